#pragma once

#include "../core/types.hpp"
#include "../core/rotation.hpp"
#include "../core/point_cloud.hpp"

namespace bbox_minimizer {

// Bounding box measurements for one orientation of a point cloud.
// An empty cloud produces `empty == true` with every extent at 0.
struct AabbMetrics {
    double volume{0.0};
    double footprint{0.0};  // width * depth, the ground-plane area
    double width{0.0};      // X extent
    double depth{0.0};      // Y extent
    double height{0.0};     // Z extent
    Vec3 min_point{};
    Vec3 max_point{};
    bool empty{true};

    [[nodiscard]] static AabbMetrics from_box(const AABB3& box);

    [[nodiscard]] Vec3 dims() const { return Vec3{width, depth, height}; }

    // Lowest world Z, used to rest the object on the ground plane
    [[nodiscard]] double min_z() const { return min_point.z; }

    [[nodiscard]] Vec2 center_xy() const {
        return Vec2{(min_point.x + max_point.x) * 0.5, (min_point.y + max_point.y) * 0.5};
    }
};

// Bounding box of the points as stored
[[nodiscard]] AabbMetrics compute_aabb(const PointCloud& points);

// Bounding box of the points after rotation, without materializing a rotated copy
[[nodiscard]] AabbMetrics compute_aabb(const PointCloud& points, const Mat3& rotation);
[[nodiscard]] AabbMetrics compute_aabb(const PointCloud& points, const Rotation& rotation);

// Volume of the rotated bounding box
[[nodiscard]] double evaluate_volume(const PointCloud& points, const Rotation& rotation);

}  // namespace bbox_minimizer
