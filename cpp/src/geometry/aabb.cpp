#include "bbox_minimizer/geometry/aabb.hpp"
#include <stdexcept>

namespace bbox_minimizer {

AabbMetrics AabbMetrics::from_box(const AABB3& box) {
    AabbMetrics metrics;
    const Vec3 size = box.size();
    // A box that never saw a point is inverted on every axis
    if (size.x < 0.0 && size.y < 0.0 && size.z < 0.0) {
        return metrics;
    }
    if (size.x < 0.0 || size.y < 0.0 || size.z < 0.0) {
        throw std::logic_error("AABB with negative extent");
    }

    metrics.width = size.x;
    metrics.depth = size.y;
    metrics.height = size.z;
    metrics.volume = size.x * size.y * size.z;
    metrics.footprint = size.x * size.y;
    metrics.min_point = box.min;
    metrics.max_point = box.max;
    metrics.empty = false;
    return metrics;
}

AabbMetrics compute_aabb(const PointCloud& points) {
    AABB3 box;
    const size_t n = points.size();
    for (size_t i = 0; i < n; ++i) {
        box.expand(Vec3{points.x[i], points.y[i], points.z[i]});
    }
    return AabbMetrics::from_box(box);
}

AabbMetrics compute_aabb(const PointCloud& points, const Mat3& r) {
    AABB3 box;
    const size_t n = points.size();
    for (size_t i = 0; i < n; ++i) {
        const double px = points.x[i];
        const double py = points.y[i];
        const double pz = points.z[i];
        box.expand(Vec3{
            r.m[0] * px + r.m[1] * py + r.m[2] * pz,
            r.m[3] * px + r.m[4] * py + r.m[5] * pz,
            r.m[6] * px + r.m[7] * py + r.m[8] * pz
        });
    }
    return AabbMetrics::from_box(box);
}

AabbMetrics compute_aabb(const PointCloud& points, const Rotation& rotation) {
    return compute_aabb(points, rotation.to_matrix());
}

double evaluate_volume(const PointCloud& points, const Rotation& rotation) {
    return compute_aabb(points, rotation).volume;
}

}  // namespace bbox_minimizer
