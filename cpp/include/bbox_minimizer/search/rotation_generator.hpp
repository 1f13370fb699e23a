#pragma once

#include "../core/types.hpp"
#include "../core/rotation.hpp"
#include <vector>

namespace bbox_minimizer {

// Step and radius of a regular angular grid, in degrees
struct GridSpec {
    double step{15.0};
    double radius{45.0};
};

/**
 * Produces rotation candidates at decreasing angular granularity.
 *
 * Grid candidates are Euler XYZ triples in degrees. Output depends only on
 * the arguments and the two construction flags, so repeated calls return
 * identical sequences.
 */
class RotationGenerator {
public:
    static constexpr GridSpec MEDIUM{15.0, 45.0};
    static constexpr GridSpec FAST_MEDIUM{30.0, 30.0};
    static constexpr GridSpec FINE{5.0, 15.0};
    static constexpr GridSpec FAST_FINE{15.0, 15.0};
    static constexpr double Z_ONLY_COARSE_STEP = 15.0;

    explicit RotationGenerator(bool z_only = false, bool fast_mode = false)
        : z_only_(z_only), fast_mode_(fast_mode) {}

    /**
     * Cartesian product of a fixed angle set per axis (X outer, Z inner),
     * duplicates removed. In z_only mode: a full turn about Z in 15 degree
     * steps.
     */
    [[nodiscard]] std::vector<Vec3> generate_coarse() const;

    // Grid of MEDIUM (or FAST_MEDIUM) spacing around `center_deg`
    [[nodiscard]] std::vector<Vec3> generate_medium(const Vec3& center_deg) const;

    // Grid of FINE (or FAST_FINE) spacing around `center_deg`
    [[nodiscard]] std::vector<Vec3> generate_fine(const Vec3& center_deg) const;

    /**
     * Every triple center + k * step with |k * step| <= radius on each axis.
     * In z_only mode only Z varies and X, Y are 0.
     */
    [[nodiscard]] std::vector<Vec3> generate_grid(const Vec3& center_deg, const GridSpec& spec) const;

    /**
     * The base rotation followed by the six variants with +-90 degrees added to
     * exactly one axis (X, then Y, then Z). Radians in, radians out.
     */
    [[nodiscard]] std::vector<Rotation> generate_pca_variants(const Rotation& base) const;

    [[nodiscard]] GridSpec medium_spec() const;
    [[nodiscard]] GridSpec fine_spec() const;

    [[nodiscard]] bool z_only() const { return z_only_; }
    [[nodiscard]] bool fast_mode() const { return fast_mode_; }

private:
    bool z_only_;
    bool fast_mode_;
};

}  // namespace bbox_minimizer
