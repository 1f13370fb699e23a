#include "bbox_minimizer/optimizers/phases.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <span>
#include <sstream>

namespace bbox_minimizer {

namespace {

std::string describe_center(const Vec3& deg) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0)
        << "(" << deg.x << "°, " << deg.y << "°, " << deg.z << "°)";
    return oss.str();
}

void log_count(SearchContext& context, std::string_view phase, size_t n) {
    if (context.logger.enabled(LogLevel::Info)) {
        std::ostringstream oss;
        oss << "testing " << n << " rotations";
        context.logger.info(phase, oss.str());
    }
}

}  // namespace

bool PresetPhase::enabled(const SearchContext& context) const {
    return !context.presets.empty() && context.config.max_presets > 0;
}

void PresetPhase::run(SearchContext& context) {
    const size_t n = std::min(context.presets.size(), context.config.max_presets);
    log_count(context, "Presets", n);
    for (size_t i = 0; i < n; ++i) {
        context.try_offset(context.presets[i]);
    }
}

void CoarsePhase::run(SearchContext& context) {
    const std::vector<Vec3> candidates = context.generator.generate_coarse();
    log_count(context, "Coarse", candidates.size());
    for (const auto& offset : candidates) {
        context.try_offset(offset);
    }
}

void GridPhase::run(SearchContext& context) {
    const Vec3 center = context.state.best_rotation().to_degrees();
    const std::vector<Vec3> candidates = (level_ == GridLevel::Medium)
        ? context.generator.generate_medium(center)
        : context.generator.generate_fine(center);

    const std::string_view component = (level_ == GridLevel::Medium) ? "Medium" : "Fine";
    if (context.logger.enabled(LogLevel::Info)) {
        context.logger.info(component, "search around " + describe_center(center));
    }
    log_count(context, component, candidates.size());

    for (const auto& deg : candidates) {
        context.try_absolute(Rotation::from_degrees(deg));
    }
}

bool PcaPhase::enabled(const SearchContext& context) const {
    return context.config.use_pca_initial_guess && !context.config.z_only;
}

void PcaPhase::run(SearchContext& context) {
    const auto aligned = aligner_.align(context.geometry.rest_points());
    if (!aligned) {
        context.logger.info("PCA", "no alignment available, skipping");
        return;
    }

    context.logger.info("PCA", "result: " + aligned->to_string());

    for (const auto& variant : context.generator.generate_pca_variants(*aligned)) {
        if (context.try_absolute(variant) && context.logger.enabled(LogLevel::Info)) {
            std::ostringstream oss;
            oss << "improved: bbox = " << context.state.best_volume();
            context.logger.info("PCA", oss.str());
        }
    }
}

void LocalRefinePhase::run(SearchContext& context) {
    const auto& config = context.config;
    const std::vector<double>& steps = context.fast_mode ? config.fast_adaptive_steps : config.adaptive_steps;
    const int max_sweeps = context.fast_mode ? config.fast_max_refine_sweeps : config.max_refine_sweeps;

    static constexpr std::array<size_t, 3> ALL_AXES{0, 1, 2};
    static constexpr std::array<size_t, 1> Z_AXIS{2};
    const std::span<const size_t> axes = config.z_only
        ? std::span<const size_t>(Z_AXIS)
        : std::span<const size_t>(ALL_AXES);

    const uint64_t improvements_before = context.state.improvements();

    for (double step_deg : steps) {
        const double step = step_deg * DEG_TO_RAD;
        bool improved = true;
        int sweeps = 0;

        while (improved && sweeps < max_sweeps) {
            improved = false;
            ++sweeps;

            for (size_t axis : axes) {
                for (double direction : {1.0, -1.0}) {
                    Rotation trial = context.state.best_rotation();
                    trial[axis] += direction * step;
                    if (context.try_absolute(trial)) {
                        improved = true;
                    }
                }
            }
        }
    }

    if (context.state.improvements() > improvements_before) {
        context.logger.info("Refine", "fine-tuned: " + context.state.best_rotation().to_string());
    }
}

}  // namespace bbox_minimizer
