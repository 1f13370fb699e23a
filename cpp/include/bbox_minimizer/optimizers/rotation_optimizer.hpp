#pragma once

#include "phase.hpp"
#include "phases.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bbox_minimizer {

struct OptimizationResult {
    Rotation rotation{};             // radians
    double reduction_percent{0.0};
    double initial_volume{0.0};
    double best_volume{0.0};
    uint64_t attempts{0};
    uint64_t failures{0};
    double elapsed_seconds{0.0};
    // Empty mesh or zero initial volume; rotation is left unchanged
    bool degenerate{false};
    // Effective fast mode, including the automatic switch for large meshes
    bool fast_mode{false};
    std::vector<std::string> phases_run;

    [[nodiscard]] Vec3 rotation_degrees() const { return rotation.to_degrees(); }
};

/**
 * Searches for the rotation that minimizes a mesh's axis-aligned bounding box.
 *
 * Runs a fixed chain of phases (presets, coarse, medium, fine, PCA, local
 * refine). The time budget is checked before each phase; a phase that has
 * started always completes. The best rotation found is applied to the
 * provider before returning.
 */
class RotationOptimizer {
public:
    using Config = OptimizerConfig;

    explicit RotationOptimizer(const Config& config = Config{}, LoggerPtr logger = null_logger());
    RotationOptimizer(const Config& config, std::vector<PhasePtr> phases, LoggerPtr logger = null_logger());

    RotationOptimizer(const RotationOptimizer& other);
    RotationOptimizer& operator=(const RotationOptimizer& other);
    RotationOptimizer(RotationOptimizer&&) noexcept = default;
    RotationOptimizer& operator=(RotationOptimizer&&) noexcept = default;

    /**
     * Optimize the orientation of the mesh behind `geometry`.
     *
     * @param presets   Learned rotations in degrees, tried as offsets
     * @param max_time  Budget in seconds (defaults to config().max_time)
     *
     * Failures of individual candidates are counted and skipped. A failure
     * while measuring the initial orientation propagates.
     */
    OptimizationResult optimize(
        GeometryProvider& geometry,
        std::span<const Vec3> presets = {},
        std::optional<double> max_time = std::nullopt
    ) const;

    // In-memory convenience: optimize a point cloud starting from `initial`
    OptimizationResult optimize_points(
        PointCloud points,
        const Rotation& initial = Rotation{},
        std::span<const Vec3> presets = {},
        std::optional<double> max_time = std::nullopt
    ) const;

    /**
     * Optimize independent meshes in parallel (OpenMP, when available).
     * `initial` is empty (identity everywhere) or holds one rotation per mesh.
     * A mesh whose optimization throws yields a degenerate result.
     */
    std::vector<OptimizationResult> optimize_batch(
        std::span<const PointCloud> meshes,
        std::span<const Rotation> initial = {},
        std::span<const Vec3> presets = {},
        std::optional<double> max_time = std::nullopt
    ) const;

    // Phase chain used by the single-config constructor
    [[nodiscard]] static std::vector<PhasePtr> default_phases(const Config& config, LoggerPtr logger);

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const std::vector<PhasePtr>& phases() const { return phases_; }

private:
    Config config_;
    std::vector<PhasePtr> phases_;
    LoggerPtr logger_;
};

}  // namespace bbox_minimizer
