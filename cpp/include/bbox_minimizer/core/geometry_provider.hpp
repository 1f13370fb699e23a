#pragma once

#include "types.hpp"
#include "rotation.hpp"
#include "point_cloud.hpp"
#include "../geometry/aabb.hpp"
#include <functional>
#include <memory>

namespace bbox_minimizer {

/**
 * Host-side view of the mesh being optimized.
 *
 * The optimizer never touches vertex data directly. It asks the provider to
 * apply a rotation and then reads back the bounding box of the mesh in its
 * current orientation. Each measure_aabb() call must reflect the most recent
 * apply_rotation(), not a cached transform.
 *
 * Implementations are not required to be thread-safe; one provider serves one
 * optimization at a time.
 */
class GeometryProvider {
public:
    virtual ~GeometryProvider() = default;

    [[nodiscard]] virtual size_t vertex_count() const = 0;

    /**
     * Vertices with the object's rotation removed. Used for principal
     * component analysis, whose result is an absolute rotation.
     */
    [[nodiscard]] virtual const PointCloud& rest_points() const = 0;

    [[nodiscard]] virtual Rotation current_rotation() const = 0;

    virtual void apply_rotation(const Rotation& rotation) = 0;

    [[nodiscard]] virtual AabbMetrics measure_aabb() const = 0;
};

// In-memory provider: rotates a fixed point cloud about the origin.
class PointCloudGeometry : public GeometryProvider {
public:
    explicit PointCloudGeometry(PointCloud points, const Rotation& rotation = Rotation{});

    [[nodiscard]] size_t vertex_count() const override { return points_.size(); }
    [[nodiscard]] const PointCloud& rest_points() const override { return points_; }
    [[nodiscard]] Rotation current_rotation() const override { return rotation_; }

    void apply_rotation(const Rotation& rotation) override;

    [[nodiscard]] AabbMetrics measure_aabb() const override;

    [[nodiscard]] size_t apply_count() const { return apply_count_; }

private:
    PointCloud points_;
    Rotation rotation_;
    size_t apply_count_{0};
};

// Provider driven by host callbacks, e.g. a scene object owned by a 3D
// authoring application. The rest-pose points are only used for PCA.
class CallbackGeometry : public GeometryProvider {
public:
    using ApplyFn = std::function<void(const Rotation&)>;
    using MeasureFn = std::function<AabbMetrics()>;

    CallbackGeometry(
        PointCloud rest_points,
        const Rotation& initial_rotation,
        ApplyFn apply_fn,
        MeasureFn measure_fn
    );

    [[nodiscard]] size_t vertex_count() const override { return points_.size(); }
    [[nodiscard]] const PointCloud& rest_points() const override { return points_; }
    [[nodiscard]] Rotation current_rotation() const override { return rotation_; }

    void apply_rotation(const Rotation& rotation) override;

    [[nodiscard]] AabbMetrics measure_aabb() const override;

private:
    PointCloud points_;
    Rotation rotation_;
    ApplyFn apply_fn_;
    MeasureFn measure_fn_;
};

}  // namespace bbox_minimizer
