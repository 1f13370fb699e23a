#pragma once

#include "../core/types.hpp"
#include "../core/rotation.hpp"
#include "../core/point_cloud.hpp"
#include "../core/config.hpp"
#include "../util/logger.hpp"
#include <optional>

namespace bbox_minimizer {

// Principal axes of a point cloud
struct PrincipalAxes {
    Vec3 centroid{};
    // Columns are the principal directions, largest variance first.
    // Always a proper rotation (determinant +1).
    Mat3 axes{};
    Vec3 variances{};
};

/**
 * Aligns a point cloud's principal axes with the world axes.
 *
 * Eigenvector signs are arbitrary, so the plain PCA rotation may leave the
 * object upside down. The aligner compares it with the same rotation flipped
 * 180 degrees about X and keeps the one whose lowest slice of points covers
 * the larger area, then trims the pitch about the narrower horizontal axis to
 * minimize height.
 *
 * The result carries no volume guarantee; callers measure it like any other
 * candidate.
 */
class PcaAligner {
public:
    using Config = PcaConfig;

    PcaAligner() = default;
    explicit PcaAligner(const Config& config, LoggerPtr logger = null_logger());

    /**
     * Best-effort absolute rotation for the cloud, or nullopt when fewer than
     * three points are given, the data is not finite or the eigen solver fails.
     */
    [[nodiscard]] std::optional<Rotation> align(const PointCloud& points) const;

    [[nodiscard]] std::optional<PrincipalAxes> principal_axes(const PointCloud& points) const;

    /**
     * XY bounding-box area of the points whose rotated Z lies in the lowest
     * `floor_slice_fraction` of the height. 0 when the slice holds fewer than
     * `min_floor_points` points.
     */
    [[nodiscard]] double floor_slice_score(const PointCloud& points, const Mat3& orientation) const;

    // Either `base` or Rx(180) * base, whichever has the larger floor slice.
    // Ties keep `base`.
    [[nodiscard]] Mat3 resolve_flip(const PointCloud& points, const Mat3& base) const;

    // `orientation` with a small pitch correction about the narrower of the
    // X/Y extents that minimizes the Z extent
    [[nodiscard]] Mat3 fine_tune_pitch(const PointCloud& points, const Mat3& orientation) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_{};
    LoggerPtr logger_{null_logger()};
};

}  // namespace bbox_minimizer
