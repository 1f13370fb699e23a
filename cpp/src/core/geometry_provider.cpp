#include "bbox_minimizer/core/geometry_provider.hpp"
#include <stdexcept>
#include <utility>

namespace bbox_minimizer {

PointCloudGeometry::PointCloudGeometry(PointCloud points, const Rotation& rotation)
    : points_(std::move(points))
    , rotation_(rotation)
{}

void PointCloudGeometry::apply_rotation(const Rotation& rotation) {
    rotation_ = rotation;
    ++apply_count_;
}

AabbMetrics PointCloudGeometry::measure_aabb() const {
    return compute_aabb(points_, rotation_);
}

CallbackGeometry::CallbackGeometry(
    PointCloud rest_points,
    const Rotation& initial_rotation,
    ApplyFn apply_fn,
    MeasureFn measure_fn
)
    : points_(std::move(rest_points))
    , rotation_(initial_rotation)
    , apply_fn_(std::move(apply_fn))
    , measure_fn_(std::move(measure_fn))
{
    if (!apply_fn_ || !measure_fn_) {
        throw std::invalid_argument("CallbackGeometry requires apply and measure callbacks");
    }
}

void CallbackGeometry::apply_rotation(const Rotation& rotation) {
    apply_fn_(rotation);
    rotation_ = rotation;
}

AabbMetrics CallbackGeometry::measure_aabb() const {
    return measure_fn_();
}

}  // namespace bbox_minimizer
