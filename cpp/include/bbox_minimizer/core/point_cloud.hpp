#pragma once

#include "types.hpp"
#include <span>
#include <vector>

namespace bbox_minimizer {

// SoA (Structure of Arrays) vertex storage - better for SIMD
//
// Holds mesh vertices in world units with the object's own rotation removed.
// Applying a rotation R to the object places vertex p at R * p in world space.
struct PointCloud {
    std::vector<double> x;
    std::vector<double> y;
    std::vector<double> z;

    PointCloud() = default;
    explicit PointCloud(size_t n) : x(n, 0.0), y(n, 0.0), z(n, 0.0) {}

    [[nodiscard]] static PointCloud from_points(std::span<const Vec3> points);

    [[nodiscard]] size_t size() const { return x.size(); }
    [[nodiscard]] bool empty() const { return x.empty(); }

    void reserve(size_t n) {
        x.reserve(n);
        y.reserve(n);
        z.reserve(n);
    }

    void push_back(const Vec3& p) {
        x.push_back(p.x);
        y.push_back(p.y);
        z.push_back(p.z);
    }

    [[nodiscard]] Vec3 get(size_t i) const {
        return Vec3{x[i], y[i], z[i]};
    }

    void set(size_t i, const Vec3& p) {
        x[i] = p.x;
        y[i] = p.y;
        z[i] = p.z;
    }

    // Copy of the cloud with every point multiplied by `rotation`
    [[nodiscard]] PointCloud transformed(const Mat3& rotation) const;

    [[nodiscard]] Vec3 centroid() const;

    [[nodiscard]] bool is_finite() const;
};

}  // namespace bbox_minimizer
