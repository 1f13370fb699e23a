#include "bbox_minimizer/optimizers/rotation_optimizer.hpp"
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bbox_minimizer {

namespace {

std::string format_percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}

OptimizationResult degenerate_result(const Rotation& rotation, double initial_volume, bool fast_mode) {
    OptimizationResult result;
    result.rotation = rotation;
    result.initial_volume = initial_volume;
    result.best_volume = initial_volume;
    result.degenerate = true;
    result.fast_mode = fast_mode;
    return result;
}

}  // namespace

RotationOptimizer::RotationOptimizer(const Config& config, LoggerPtr logger)
    : config_(config)
    , logger_(logger ? std::move(logger) : null_logger())
{
    config_.validate();
    phases_ = default_phases(config_, logger_);
}

RotationOptimizer::RotationOptimizer(const Config& config, std::vector<PhasePtr> phases, LoggerPtr logger)
    : config_(config)
    , phases_(std::move(phases))
    , logger_(logger ? std::move(logger) : null_logger())
{
    config_.validate();
    for (const auto& phase : phases_) {
        if (!phase) {
            throw std::invalid_argument("RotationOptimizer: null phase");
        }
    }
}

RotationOptimizer::RotationOptimizer(const RotationOptimizer& other)
    : config_(other.config_)
    , logger_(other.logger_)
{
    phases_.reserve(other.phases_.size());
    for (const auto& phase : other.phases_) {
        phases_.push_back(phase->clone());
    }
}

RotationOptimizer& RotationOptimizer::operator=(const RotationOptimizer& other) {
    if (this != &other) {
        RotationOptimizer copy(other);
        *this = std::move(copy);
    }
    return *this;
}

std::vector<PhasePtr> RotationOptimizer::default_phases(const Config& config, LoggerPtr logger) {
    std::vector<PhasePtr> phases;
    phases.push_back(std::make_unique<PresetPhase>());
    phases.push_back(std::make_unique<CoarsePhase>());
    phases.push_back(std::make_unique<GridPhase>(GridLevel::Medium));
    phases.push_back(std::make_unique<GridPhase>(GridLevel::Fine));
    phases.push_back(std::make_unique<PcaPhase>(PcaAligner(config.pca, std::move(logger))));
    phases.push_back(std::make_unique<LocalRefinePhase>());
    return phases;
}

OptimizationResult RotationOptimizer::optimize(
    GeometryProvider& geometry,
    std::span<const Vec3> presets,
    std::optional<double> max_time
) const {
    Logger& log = *logger_;
    const double budget = max_time.value_or(config_.max_time);
    if (std::isnan(budget) || budget < 0.0) {
        throw std::invalid_argument("RotationOptimizer::optimize: max_time must be >= 0");
    }

    const Rotation initial_rotation = geometry.current_rotation();
    const size_t n_vertices = geometry.vertex_count();

    bool fast_mode = config_.fast_mode;
    if (n_vertices == 0) {
        log.warn("Optimizer", "mesh has no vertices, nothing to optimize");
        return degenerate_result(initial_rotation, 0.0, fast_mode);
    }

    if (!fast_mode && config_.auto_fast_mode_vertex_threshold > 0 &&
        n_vertices > config_.auto_fast_mode_vertex_threshold) {
        fast_mode = true;
        log.info("Optimizer", "large mesh (" + std::to_string(n_vertices) +
                 " vertices), auto-enabling fast mode");
    }

    // Make sure the provider reflects the starting orientation before measuring
    geometry.apply_rotation(initial_rotation);
    const double initial_volume = geometry.measure_aabb().volume;

    if (!std::isfinite(initial_volume) || initial_volume <= 0.0) {
        log.warn("Optimizer", "initial bounding box has no volume, nothing to optimize");
        return degenerate_result(initial_rotation, std::isfinite(initial_volume) ? initial_volume : 0.0, fast_mode);
    }

    if (log.enabled(LogLevel::Info)) {
        std::ostringstream oss;
        oss << "initial bbox volume: " << initial_volume
            << (config_.z_only ? " (Z-only mode)" : "")
            << (fast_mode ? " (fast mode)" : "");
        log.info("Optimizer", oss.str());
    }

    SearchState state(initial_rotation, initial_volume, budget, config_.improvement_tolerance);
    const RotationGenerator generator(config_.z_only, fast_mode);
    SearchContext context{geometry, state, generator, config_, log, presets, fast_mode};

    OptimizationResult result;
    result.fast_mode = fast_mode;

    for (const auto& phase : phases_) {
        if (state.deadline_passed()) {
            log.info("Optimizer", "time budget exhausted, skipping remaining phases");
            break;
        }
        if (!phase->enabled(context)) {
            continue;
        }

        phase->run(context);
        result.phases_run.emplace_back(phase->name());

        if (log.enabled(LogLevel::Info)) {
            std::ostringstream oss;
            oss << phase->name() << " done: " << format_percent(state.reduction_percent())
                << " reduction after " << state.attempts() << " attempts";
            log.info("Optimizer", oss.str());
        }
    }

    // Leave the provider in the best orientation found
    try {
        geometry.apply_rotation(state.best_rotation());
    } catch (const std::exception& e) {
        state.record_failure();
        log.warn("Optimizer", std::string("failed to apply final rotation: ") + e.what());
    }

    result.rotation = state.best_rotation();
    result.reduction_percent = state.reduction_percent();
    result.initial_volume = state.initial_volume();
    result.best_volume = state.best_volume();
    result.attempts = state.attempts();
    result.failures = state.failures();
    result.elapsed_seconds = state.elapsed_seconds();

    if (log.enabled(LogLevel::Info)) {
        std::ostringstream oss;
        oss << "best: " << result.rotation.to_string() << ", reduction "
            << format_percent(result.reduction_percent) << ", "
            << std::fixed << std::setprecision(2) << result.elapsed_seconds << "s";
        log.info("Optimizer", oss.str());
    }

    return result;
}

OptimizationResult RotationOptimizer::optimize_points(
    PointCloud points,
    const Rotation& initial,
    std::span<const Vec3> presets,
    std::optional<double> max_time
) const {
    PointCloudGeometry geometry(std::move(points), initial);
    return optimize(geometry, presets, max_time);
}

std::vector<OptimizationResult> RotationOptimizer::optimize_batch(
    std::span<const PointCloud> meshes,
    std::span<const Rotation> initial,
    std::span<const Vec3> presets,
    std::optional<double> max_time
) const {
    if (!initial.empty() && initial.size() != meshes.size()) {
        throw std::invalid_argument("RotationOptimizer::optimize_batch: initial rotations must match meshes");
    }

    const int n = static_cast<int>(meshes.size());
    std::vector<OptimizationResult> results(meshes.size());

    auto run_one = [&](const RotationOptimizer& optimizer, int i) {
        const size_t idx = static_cast<size_t>(i);
        const Rotation start = initial.empty() ? Rotation{} : initial[idx];
        try {
            results[idx] = optimizer.optimize_points(meshes[idx], start, presets, max_time);
        } catch (const std::exception& e) {
            logger_->warn("Batch", "mesh " + std::to_string(i) + " failed: " + e.what());
            results[idx] = degenerate_result(start, 0.0, config_.fast_mode);
            results[idx].failures = 1;
        }
    };

#ifdef _OPENMP
    #pragma omp parallel
    {
        // Each thread gets its own phase chain
        const RotationOptimizer thread_optimizer(*this);

        #pragma omp for schedule(dynamic)
        for (int i = 0; i < n; ++i) {
            run_one(thread_optimizer, i);
        }
    }
#else
    for (int i = 0; i < n; ++i) {
        run_one(*this, i);
    }
#endif

    return results;
}

}  // namespace bbox_minimizer
