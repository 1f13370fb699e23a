#include "bbox_minimizer/alignment/pca_aligner.hpp"
#include "bbox_minimizer/geometry/aabb.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace bbox_minimizer {

namespace {

constexpr std::string_view COMPONENT = "PCA";

}  // namespace

PcaAligner::PcaAligner(const Config& config, LoggerPtr logger)
    : config_(config)
    , logger_(logger ? std::move(logger) : null_logger())
{
    config_.validate();
}

std::optional<PrincipalAxes> PcaAligner::principal_axes(const PointCloud& points) const {
    const size_t n = points.size();
    if (n < 3) {
        logger_->info(COMPONENT, "fewer than 3 points, skipping");
        return std::nullopt;
    }
    if (!points.is_finite()) {
        logger_->warn(COMPONENT, "non-finite vertex data, skipping");
        return std::nullopt;
    }

    const Vec3 c = points.centroid();

    // Sample covariance of the centered cloud
    Eigen::Matrix3d cov = Eigen::Matrix3d::Zero();
    for (size_t i = 0; i < n; ++i) {
        const Eigen::Vector3d d(points.x[i] - c.x, points.y[i] - c.y, points.z[i] - c.z);
        cov += d * d.transpose();
    }
    cov /= static_cast<double>(n - 1);

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(cov);
    if (solver.info() != Eigen::Success) {
        logger_->warn(COMPONENT, "eigen decomposition failed");
        return std::nullopt;
    }

    const Eigen::Vector3d eigenvalues = solver.eigenvalues();
    const Eigen::Matrix3d eigenvectors = solver.eigenvectors();  // columns

    // Sort by descending variance
    std::array<int, 3> order = {0, 1, 2};
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return eigenvalues[a] > eigenvalues[b];
    });

    std::array<Vec3, 3> cols;
    for (size_t k = 0; k < 3; ++k) {
        const Eigen::Vector3d v = eigenvectors.col(order[k]);
        cols[k] = Vec3{v.x(), v.y(), v.z()};
    }
    // Right-handed basis
    if (cols[0].cross(cols[1]).dot(cols[2]) < 0.0) {
        cols[2] = cols[2] * -1.0;
    }

    PrincipalAxes result;
    result.centroid = c;
    result.axes = Mat3::from_columns(cols[0], cols[1], cols[2]);
    result.variances = Vec3{eigenvalues[order[0]], eigenvalues[order[1]], eigenvalues[order[2]]};
    return result;
}

double PcaAligner::floor_slice_score(const PointCloud& points, const Mat3& orientation) const {
    const PointCloud rotated = points.transformed(orientation);
    if (rotated.empty()) return 0.0;

    const auto [min_it, max_it] = std::minmax_element(rotated.z.begin(), rotated.z.end());
    const double min_z = *min_it;
    const double threshold = min_z + (*max_it - min_z) * config_.floor_slice_fraction;

    AABB3 slice;
    size_t count = 0;
    for (size_t i = 0; i < rotated.size(); ++i) {
        if (rotated.z[i] < threshold) {
            slice.expand(Vec3{rotated.x[i], rotated.y[i], 0.0});
            ++count;
        }
    }

    if (count < config_.min_floor_points) {
        return 0.0;
    }
    const Vec3 size = slice.size();
    return size.x * size.y;
}

Mat3 PcaAligner::resolve_flip(const PointCloud& points, const Mat3& base) const {
    const std::array<Mat3, 2> candidates = {base, Mat3::rotation_x(PI) * base};

    Mat3 best = base;
    double best_score = -1.0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const double score = floor_slice_score(points, candidates[i]);
        if (logger_->enabled(LogLevel::Debug)) {
            std::ostringstream oss;
            oss << "candidate " << i << ": floor score = " << score;
            logger_->debug(COMPONENT, oss.str());
        }
        if (score > best_score) {
            best_score = score;
            best = candidates[i];
        }
    }
    return best;
}

Mat3 PcaAligner::fine_tune_pitch(const PointCloud& points, const Mat3& orientation) const {
    const PointCloud rotated = points.transformed(orientation);
    const AabbMetrics dims = compute_aabb(rotated);
    if (dims.empty) return orientation;

    // Pitch about the narrower horizontal axis
    const bool about_x = dims.width < dims.depth;

    const int n = static_cast<int>(std::round(config_.pitch_range_deg / config_.pitch_step_deg));
    double best_angle = 0.0;
    double min_height = dims.height;

    for (int i = -n; i <= n; ++i) {
        const double angle = static_cast<double>(i) * config_.pitch_step_deg * DEG_TO_RAD;
        const double c = std::cos(angle);
        const double s = std::sin(angle);

        double lo = std::numeric_limits<double>::max();
        double hi = std::numeric_limits<double>::lowest();
        for (size_t k = 0; k < rotated.size(); ++k) {
            // Only the Z row of the in-plane rotation is needed
            const double z = about_x
                ? rotated.y[k] * s + rotated.z[k] * c
                : -rotated.x[k] * s + rotated.z[k] * c;
            lo = std::min(lo, z);
            hi = std::max(hi, z);
        }

        const double height = hi - lo;
        if (height < min_height) {
            min_height = height;
            best_angle = angle;
        }
    }

    if (logger_->enabled(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "pitch correction about " << (about_x ? 'X' : 'Y') << ": "
            << best_angle * RAD_TO_DEG << " deg";
        logger_->debug(COMPONENT, oss.str());
    }

    const Mat3 correction = about_x ? Mat3::rotation_x(best_angle) : Mat3::rotation_y(best_angle);
    return correction * orientation;
}

std::optional<Rotation> PcaAligner::align(const PointCloud& points) const {
    const auto axes = principal_axes(points);
    if (!axes) {
        return std::nullopt;
    }

    // The eigenbasis is orthonormal, so its inverse is its transpose
    const Mat3 base = axes->axes.transposed();
    const Mat3 upright = resolve_flip(points, base);
    const Mat3 tuned = fine_tune_pitch(points, upright);

    const Rotation result = Rotation::from_matrix(tuned);
    if (!result.is_finite()) {
        logger_->warn(COMPONENT, "alignment produced a non-finite rotation");
        return std::nullopt;
    }
    return result;
}

}  // namespace bbox_minimizer
