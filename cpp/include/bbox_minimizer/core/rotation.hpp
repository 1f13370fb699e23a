#pragma once

#include "types.hpp"
#include <string>

namespace bbox_minimizer {

// Euler rotation in radians, XYZ order: X is applied first, then Y, then Z,
// so the matrix form is Rz * Ry * Rx.
struct Rotation {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    constexpr Rotation() = default;
    constexpr Rotation(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] static Rotation from_degrees(const Vec3& degrees) {
        return Rotation{degrees.x * DEG_TO_RAD, degrees.y * DEG_TO_RAD, degrees.z * DEG_TO_RAD};
    }

    [[nodiscard]] static Rotation from_degrees(double x_deg, double y_deg, double z_deg) {
        return from_degrees(Vec3{x_deg, y_deg, z_deg});
    }

    // Decompose a rotation matrix. Of the two Euler triples that produce the
    // matrix, the one with the smaller total magnitude is returned.
    [[nodiscard]] static Rotation from_matrix(const Mat3& matrix);

    [[nodiscard]] Mat3 to_matrix() const;

    [[nodiscard]] Vec3 to_degrees() const {
        return Vec3{x * RAD_TO_DEG, y * RAD_TO_DEG, z * RAD_TO_DEG};
    }

    [[nodiscard]] Vec3 as_vec() const { return Vec3{x, y, z}; }

    [[nodiscard]] constexpr double operator[](size_t i) const {
        switch (i) {
            case 0: return x;
            case 1: return y;
            default: return z;
        }
    }

    [[nodiscard]] constexpr double& operator[](size_t i) {
        switch (i) {
            case 0: return x;
            case 1: return y;
            default: return z;
        }
    }

    [[nodiscard]] constexpr bool operator==(const Rotation& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    [[nodiscard]] std::string to_string() const;
};

// Layer `offset` on top of `base`: the result is base * offset in matrix form,
// decomposed back to Euler XYZ.
[[nodiscard]] Rotation compose(const Rotation& base, const Rotation& offset);

// Normalize an angle in degrees to (-180, 180]
[[nodiscard]] double normalize_angle_deg(double angle_deg);

[[nodiscard]] inline Vec3 radians_to_degrees(const Vec3& radians) {
    return radians * RAD_TO_DEG;
}

[[nodiscard]] inline Vec3 degrees_to_radians(const Vec3& degrees) {
    return degrees * DEG_TO_RAD;
}

// True when both rotations produce the same matrix within tol
[[nodiscard]] bool equivalent(const Rotation& a, const Rotation& b, double tol = 1e-9);

}  // namespace bbox_minimizer
