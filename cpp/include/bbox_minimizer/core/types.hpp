#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace bbox_minimizer {

// Forward declarations
struct Vec2;
struct Vec3;
struct Mat3;

// 2D vector (ground plane coordinates)
struct Vec2 {
    double x{0.0};
    double y{0.0};

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr Vec2 operator+(const Vec2& other) const {
        return Vec2{x + other.x, y + other.y};
    }

    [[nodiscard]] constexpr Vec2 operator-(const Vec2& other) const {
        return Vec2{x - other.x, y - other.y};
    }

    [[nodiscard]] constexpr Vec2 operator*(double scalar) const {
        return Vec2{x * scalar, y * scalar};
    }
};

// 3D vector
struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] constexpr Vec3 operator+(const Vec3& other) const {
        return Vec3{x + other.x, y + other.y, z + other.z};
    }

    [[nodiscard]] constexpr Vec3 operator-(const Vec3& other) const {
        return Vec3{x - other.x, y - other.y, z - other.z};
    }

    [[nodiscard]] constexpr Vec3 operator*(double scalar) const {
        return Vec3{x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] constexpr Vec3 operator/(double scalar) const {
        return Vec3{x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    [[nodiscard]] constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

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

    [[nodiscard]] constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    [[nodiscard]] constexpr Vec3 cross(const Vec3& other) const {
        return Vec3{
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    [[nodiscard]] double length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

[[nodiscard]] inline constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// 3x3 matrix, row-major
struct Mat3 {
    std::array<double, 9> m{1.0, 0.0, 0.0,
                            0.0, 1.0, 0.0,
                            0.0, 0.0, 1.0};

    constexpr Mat3() = default;
    constexpr Mat3(double m00, double m01, double m02,
                   double m10, double m11, double m12,
                   double m20, double m21, double m22)
        : m{m00, m01, m02, m10, m11, m12, m20, m21, m22} {}

    [[nodiscard]] static constexpr Mat3 identity() { return Mat3{}; }

    // Right-handed rotations about the world axes
    [[nodiscard]] static Mat3 rotation_x(double angle) {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        return Mat3{1.0, 0.0, 0.0,
                    0.0, c, -s,
                    0.0, s, c};
    }

    [[nodiscard]] static Mat3 rotation_y(double angle) {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        return Mat3{c, 0.0, s,
                    0.0, 1.0, 0.0,
                    -s, 0.0, c};
    }

    [[nodiscard]] static Mat3 rotation_z(double angle) {
        const double c = std::cos(angle);
        const double s = std::sin(angle);
        return Mat3{c, -s, 0.0,
                    s, c, 0.0,
                    0.0, 0.0, 1.0};
    }

    [[nodiscard]] static Mat3 from_columns(const Vec3& c0, const Vec3& c1, const Vec3& c2) {
        return Mat3{c0.x, c1.x, c2.x,
                    c0.y, c1.y, c2.y,
                    c0.z, c1.z, c2.z};
    }

    [[nodiscard]] constexpr double operator()(size_t row, size_t col) const {
        return m[row * 3 + col];
    }

    [[nodiscard]] constexpr double& operator()(size_t row, size_t col) {
        return m[row * 3 + col];
    }

    [[nodiscard]] constexpr Vec3 row(size_t r) const {
        return Vec3{m[r * 3], m[r * 3 + 1], m[r * 3 + 2]};
    }

    [[nodiscard]] constexpr Vec3 col(size_t c) const {
        return Vec3{m[c], m[3 + c], m[6 + c]};
    }

    [[nodiscard]] constexpr Vec3 operator*(const Vec3& v) const {
        return Vec3{
            m[0] * v.x + m[1] * v.y + m[2] * v.z,
            m[3] * v.x + m[4] * v.y + m[5] * v.z,
            m[6] * v.x + m[7] * v.y + m[8] * v.z
        };
    }

    [[nodiscard]] constexpr Mat3 operator*(const Mat3& other) const {
        Mat3 out;
        for (size_t i = 0; i < 3; ++i) {
            for (size_t j = 0; j < 3; ++j) {
                out(i, j) = (*this)(i, 0) * other(0, j)
                          + (*this)(i, 1) * other(1, j)
                          + (*this)(i, 2) * other(2, j);
            }
        }
        return out;
    }

    [[nodiscard]] constexpr Mat3 transposed() const {
        return Mat3{m[0], m[3], m[6],
                    m[1], m[4], m[7],
                    m[2], m[5], m[8]};
    }

    [[nodiscard]] constexpr double determinant() const {
        return m[0] * (m[4] * m[8] - m[5] * m[7])
             - m[1] * (m[3] * m[8] - m[5] * m[6])
             + m[2] * (m[3] * m[7] - m[4] * m[6]);
    }

    [[nodiscard]] bool approx_equal(const Mat3& other, double tol) const {
        for (size_t i = 0; i < 9; ++i) {
            if (std::abs(m[i] - other.m[i]) > tol) return false;
        }
        return true;
    }
};

// Axis-aligned bounding box in 3D
struct AABB3 {
    Vec3 min{std::numeric_limits<double>::max(),
             std::numeric_limits<double>::max(),
             std::numeric_limits<double>::max()};
    Vec3 max{std::numeric_limits<double>::lowest(),
             std::numeric_limits<double>::lowest(),
             std::numeric_limits<double>::lowest()};

    constexpr AABB3() = default;
    constexpr AABB3(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    void expand(const Vec3& point) {
        min.x = std::min(min.x, point.x);
        min.y = std::min(min.y, point.y);
        min.z = std::min(min.z, point.z);
        max.x = std::max(max.x, point.x);
        max.y = std::max(max.y, point.y);
        max.z = std::max(max.z, point.z);
    }

    [[nodiscard]] bool is_empty() const {
        return min.x > max.x || min.y > max.y || min.z > max.z;
    }

    [[nodiscard]] Vec3 center() const {
        return (min + max) * 0.5;
    }

    [[nodiscard]] Vec3 size() const {
        return max - min;
    }
};

// Common constants
constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

}  // namespace bbox_minimizer
