#include "bbox_minimizer/core/point_cloud.hpp"
#include <cmath>

namespace bbox_minimizer {

PointCloud PointCloud::from_points(std::span<const Vec3> points) {
    PointCloud cloud;
    cloud.reserve(points.size());
    for (const auto& p : points) {
        cloud.push_back(p);
    }
    return cloud;
}

PointCloud PointCloud::transformed(const Mat3& r) const {
    const size_t n = size();
    PointCloud out(n);
    for (size_t i = 0; i < n; ++i) {
        const double px = x[i];
        const double py = y[i];
        const double pz = z[i];
        out.x[i] = r.m[0] * px + r.m[1] * py + r.m[2] * pz;
        out.y[i] = r.m[3] * px + r.m[4] * py + r.m[5] * pz;
        out.z[i] = r.m[6] * px + r.m[7] * py + r.m[8] * pz;
    }
    return out;
}

Vec3 PointCloud::centroid() const {
    const size_t n = size();
    if (n == 0) return Vec3{};

    Vec3 sum;
    for (size_t i = 0; i < n; ++i) {
        sum.x += x[i];
        sum.y += y[i];
        sum.z += z[i];
    }
    return sum / static_cast<double>(n);
}

bool PointCloud::is_finite() const {
    for (size_t i = 0; i < size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i]) || !std::isfinite(z[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace bbox_minimizer
