#include "bbox_minimizer/search/rotation_generator.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace bbox_minimizer {

namespace {

constexpr std::array<double, 6> COARSE_ANGLES{0.0, 45.0, -45.0, 90.0, -90.0, 180.0};
constexpr std::array<double, 4> FAST_COARSE_ANGLES{0.0, 45.0, 90.0, 180.0};

// Offsets -n*step .. n*step with n*step <= radius
std::vector<double> axis_offsets(const GridSpec& spec) {
    const int n = static_cast<int>(std::floor(spec.radius / spec.step + 1e-9));
    std::vector<double> offsets;
    offsets.reserve(static_cast<size_t>(2 * n + 1));
    for (int k = -n; k <= n; ++k) {
        offsets.push_back(static_cast<double>(k) * spec.step);
    }
    return offsets;
}

}  // namespace

std::vector<Vec3> RotationGenerator::generate_coarse() const {
    std::vector<Vec3> rotations;

    if (z_only_) {
        const int n = static_cast<int>(360.0 / Z_ONLY_COARSE_STEP);
        rotations.reserve(static_cast<size_t>(n));
        for (int i = 0; i < n; ++i) {
            rotations.emplace_back(0.0, 0.0, static_cast<double>(i) * Z_ONLY_COARSE_STEP);
        }
        return rotations;
    }

    auto emit = [&rotations](const auto& angles) {
        rotations.reserve(angles.size() * angles.size() * angles.size());
        for (double x : angles) {
            for (double y : angles) {
                for (double z : angles) {
                    const Vec3 candidate{x, y, z};
                    if (std::find(rotations.begin(), rotations.end(), candidate) == rotations.end()) {
                        rotations.push_back(candidate);
                    }
                }
            }
        }
    };

    if (fast_mode_) {
        emit(FAST_COARSE_ANGLES);
    } else {
        emit(COARSE_ANGLES);
    }
    return rotations;
}

GridSpec RotationGenerator::medium_spec() const {
    // z_only sweeps always use the full-resolution grid
    return (fast_mode_ && !z_only_) ? FAST_MEDIUM : MEDIUM;
}

GridSpec RotationGenerator::fine_spec() const {
    return (fast_mode_ && !z_only_) ? FAST_FINE : FINE;
}

std::vector<Vec3> RotationGenerator::generate_medium(const Vec3& center_deg) const {
    return generate_grid(center_deg, medium_spec());
}

std::vector<Vec3> RotationGenerator::generate_fine(const Vec3& center_deg) const {
    return generate_grid(center_deg, fine_spec());
}

std::vector<Vec3> RotationGenerator::generate_grid(const Vec3& center_deg, const GridSpec& spec) const {
    const std::vector<double> offsets = axis_offsets(spec);
    std::vector<Vec3> rotations;

    if (z_only_) {
        rotations.reserve(offsets.size());
        for (double dz : offsets) {
            rotations.emplace_back(0.0, 0.0, center_deg.z + dz);
        }
        return rotations;
    }

    rotations.reserve(offsets.size() * offsets.size() * offsets.size());
    for (double dx : offsets) {
        for (double dy : offsets) {
            for (double dz : offsets) {
                rotations.emplace_back(center_deg.x + dx, center_deg.y + dy, center_deg.z + dz);
            }
        }
    }
    return rotations;
}

std::vector<Rotation> RotationGenerator::generate_pca_variants(const Rotation& base) const {
    std::vector<Rotation> variants;
    variants.reserve(7);
    variants.push_back(base);
    for (size_t axis = 0; axis < 3; ++axis) {
        for (double sign : {1.0, -1.0}) {
            Rotation variant = base;
            variant[axis] += sign * HALF_PI;
            variants.push_back(variant);
        }
    }
    return variants;
}

}  // namespace bbox_minimizer
