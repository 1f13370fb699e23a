#include <iostream>
#include <iomanip>
#include "bbox_minimizer/bbox_minimizer.hpp"

using namespace bbox_minimizer;

namespace {

// Corners and edge midpoints of an axis-aligned box
PointCloud make_box(double sx, double sy, double sz) {
    PointCloud points;
    for (double x : {0.0, 0.5 * sx, sx}) {
        for (double y : {0.0, 0.5 * sy, sy}) {
            for (double z : {0.0, 0.5 * sz, sz}) {
                points.push_back(Vec3{x - 0.5 * sx, y - 0.5 * sy, z});
            }
        }
    }
    return points;
}

}  // namespace

int main() {
    std::cout << "Bounding Box Minimizer Example\n";
    std::cout << "==============================\n\n";

    // A flat 10 x 6 x 1 plate, tilted away from its natural resting pose
    const Rotation tilted = Rotation::from_degrees(20.0, -35.0, 40.0);
    PointCloudGeometry geometry(make_box(10.0, 6.0, 1.0), tilted);

    const AabbMetrics before = geometry.measure_aabb();
    std::cout << "Initial orientation: " << tilted.to_string() << "\n";
    std::cout << "  Volume: " << before.volume << "\n";
    std::cout << "  Dims:   " << before.width << " x " << before.depth << " x " << before.height << "\n\n";

    OptimizerConfig config;
    config.max_time = 30.0;

    RotationOptimizer optimizer(config, console_logger());
    const OptimizationResult result = optimizer.optimize(geometry);

    const AabbMetrics after = geometry.measure_aabb();
    const Vec3 deg = result.rotation_degrees();

    std::cout << "\nResult:\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Rotation (deg): " << deg.x << ", " << deg.y << ", " << deg.z << "\n";
    std::cout << "  Volume:         " << after.volume << "\n";
    std::cout << "  Dims:           " << after.width << " x " << after.depth << " x " << after.height << "\n";
    std::cout << "  Reduction:      " << result.reduction_percent << "%\n";
    std::cout << "  Attempts:       " << result.attempts << "\n";
    std::cout << "  Time:           " << result.elapsed_seconds << "s\n";

    // Remember the rotation so the next optimization of this object starts from it
    PresetCache cache;
    cache.save_rotation("plate", "sheet_metal", deg, result.reduction_percent);
    const std::vector<Vec3> presets = cache.presets_for("plate", "sheet_metal");

    PointCloudGeometry again(make_box(10.0, 6.0, 1.0), tilted);
    const OptimizationResult replay = RotationOptimizer(config).optimize(again, presets);
    std::cout << "\nWith learned preset: " << replay.reduction_percent << "% reduction\n";

    // Rest the object on the ground plane
    const Vec2 center = after.center_xy();
    std::cout << "Ground offset: (" << -center.x << ", " << -center.y << ", " << -after.min_z() << ")\n";

    return 0;
}
