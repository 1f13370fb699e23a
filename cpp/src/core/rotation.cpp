#include "bbox_minimizer/core/rotation.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace bbox_minimizer {

namespace {

// Below this cos(Y) the X and Z angles are no longer separable
constexpr double GIMBAL_EPSILON = 1e-9;

double magnitude(const Rotation& r) {
    return std::abs(r.x) + std::abs(r.y) + std::abs(r.z);
}

}  // namespace

Mat3 Rotation::to_matrix() const {
    const double cx = std::cos(x), sx = std::sin(x);
    const double cy = std::cos(y), sy = std::sin(y);
    const double cz = std::cos(z), sz = std::sin(z);

    // Rz * Ry * Rx expanded
    return Mat3{
        cy * cz, sx * sy * cz - cx * sz, cx * sy * cz + sx * sz,
        cy * sz, sx * sy * sz + cx * cz, cx * sy * sz - sx * cz,
        -sy,     sx * cy,                cx * cy
    };
}

Rotation Rotation::from_matrix(const Mat3& r) {
    const double cy = std::hypot(r(0, 0), r(1, 0));

    if (cy > GIMBAL_EPSILON) {
        const Rotation first{
            std::atan2(r(2, 1), r(2, 2)),
            std::atan2(-r(2, 0), cy),
            std::atan2(r(1, 0), r(0, 0))
        };
        const Rotation second{
            std::atan2(-r(2, 1), -r(2, 2)),
            std::atan2(-r(2, 0), -cy),
            std::atan2(-r(1, 0), -r(0, 0))
        };
        return magnitude(second) < magnitude(first) ? second : first;
    }

    // Gimbal lock: Y is +-90 degrees, X and Z share one degree of freedom
    return Rotation{
        std::atan2(-r(1, 2), r(1, 1)),
        std::atan2(-r(2, 0), cy),
        0.0
    };
}

std::string Rotation::to_string() const {
    const Vec3 deg = to_degrees();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "X=" << deg.x << "°, Y=" << deg.y << "°, Z=" << deg.z << "°";
    return oss.str();
}

Rotation compose(const Rotation& base, const Rotation& offset) {
    return Rotation::from_matrix(base.to_matrix() * offset.to_matrix());
}

double normalize_angle_deg(double angle_deg) {
    double a = std::fmod(angle_deg, 360.0);
    if (a > 180.0) a -= 360.0;
    if (a <= -180.0) a += 360.0;
    return a;
}

bool equivalent(const Rotation& a, const Rotation& b, double tol) {
    return a.to_matrix().approx_equal(b.to_matrix(), tol);
}

}  // namespace bbox_minimizer
