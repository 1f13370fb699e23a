#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "bbox_minimizer/bbox_minimizer.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace bbox_minimizer;
using Catch::Approx;

namespace {

// Corners of a box centered on the origin in XY, resting on Z = 0
PointCloud make_box(double sx, double sy, double sz) {
    PointCloud points;
    for (double x : {-0.5 * sx, 0.5 * sx}) {
        for (double y : {-0.5 * sy, 0.5 * sy}) {
            for (double z : {0.0, sz}) {
                points.push_back(Vec3{x, y, z});
            }
        }
    }
    return points;
}

// Points on an ellipsoid surface, deterministic spiral layout
PointCloud make_ellipsoid(size_t n, double a, double b, double c) {
    PointCloud points;
    const double golden = PI * (3.0 - std::sqrt(5.0));
    for (size_t i = 0; i < n; ++i) {
        const double t = 1.0 - 2.0 * (static_cast<double>(i) + 0.5) / static_cast<double>(n);
        const double r = std::sqrt(1.0 - t * t);
        const double phi = golden * static_cast<double>(i);
        points.push_back(Vec3{a * r * std::cos(phi), b * r * std::sin(phi), c * t});
    }
    return points;
}

OptimizerConfig quick_config() {
    OptimizerConfig config;
    config.fast_mode = true;
    return config;
}

}  // namespace

TEST_CASE("Optimizer improves a rotated box", "[optimizer]") {
    // 10 x 10 x 1 plate turned 45 degrees: bbox 200, best possible 100
    PointCloudGeometry geometry(make_box(10.0, 10.0, 1.0), Rotation::from_degrees(0.0, 0.0, 45.0));
    REQUIRE(geometry.measure_aabb().volume == Approx(200.0));

    RotationOptimizer optimizer;
    OptimizationResult result = optimizer.optimize(geometry);

    REQUIRE_FALSE(result.degenerate);
    REQUIRE(result.initial_volume == Approx(200.0));
    REQUIRE(result.best_volume == Approx(100.0));
    REQUIRE(result.reduction_percent > 30.0);
    REQUIRE(result.reduction_percent == Approx(50.0));
    REQUIRE(result.attempts > 0);
    REQUIRE(result.failures == 0);

    // The provider is left in the best orientation
    REQUIRE(geometry.current_rotation() == result.rotation);
    REQUIRE(geometry.measure_aabb().volume == Approx(result.best_volume));
}

TEST_CASE("Optimizer never worsens the box", "[optimizer]") {
    const PointCloud points = make_ellipsoid(300, 6.0, 2.5, 1.0);

    for (const Vec3& start : {Vec3(0, 0, 0), Vec3(30, 15, -50), Vec3(-80, 45, 170)}) {
        PointCloudGeometry geometry(points, Rotation::from_degrees(start));
        const double initial = geometry.measure_aabb().volume;

        OptimizationResult result = RotationOptimizer(quick_config()).optimize(geometry);

        REQUIRE(result.best_volume <= initial);
        REQUIRE(result.reduction_percent >= 0.0);
        REQUIRE(geometry.measure_aabb().volume == Approx(result.best_volume));
        REQUIRE(evaluate_volume(points, result.rotation) == Approx(result.best_volume));
    }
}

TEST_CASE("Unit cube cannot be improved", "[optimizer]") {
    PointCloudGeometry geometry(make_box(1.0, 1.0, 1.0));

    OptimizationResult result = RotationOptimizer().optimize(geometry);

    REQUIRE(result.reduction_percent == 0.0);
    REQUIRE(result.best_volume == result.initial_volume);
    REQUIRE(result.rotation == Rotation{});
    REQUIRE_FALSE(result.degenerate);
}

TEST_CASE("Degenerate meshes", "[optimizer]") {
    RotationOptimizer optimizer;

    SECTION("Empty mesh") {
        const Rotation start = Rotation::from_degrees(10.0, 20.0, 30.0);
        PointCloudGeometry geometry(PointCloud{}, start);

        OptimizationResult result = optimizer.optimize(geometry);
        REQUIRE(result.degenerate);
        REQUIRE(result.reduction_percent == 0.0);
        REQUIRE(result.rotation == start);
        REQUIRE(result.attempts == 0);
        REQUIRE(geometry.apply_count() == 0);
    }

    SECTION("Flat mesh has zero volume") {
        PointCloud square;
        square.push_back(Vec3(0, 0, 0));
        square.push_back(Vec3(1, 0, 0));
        square.push_back(Vec3(0, 1, 0));
        square.push_back(Vec3(1, 1, 0));
        PointCloudGeometry geometry(square);

        OptimizationResult result = optimizer.optimize(geometry);
        REQUIRE(result.degenerate);
        REQUIRE(result.reduction_percent == 0.0);
        REQUIRE(result.rotation == Rotation{});
    }
}

TEST_CASE("Z only mode keeps the object upright", "[optimizer]") {
    OptimizerConfig config;
    config.z_only = true;

    const Rotation start = Rotation::from_degrees(10.0, -5.0, 30.0);
    const PointCloud points = make_box(8.0, 3.0, 2.0);

    std::vector<Rotation> applied;
    Rotation current = start;
    CallbackGeometry geometry(
        points,
        start,
        [&](const Rotation& r) {
            applied.push_back(r);
            current = r;
        },
        [&]() { return compute_aabb(points, current); });

    OptimizationResult result = RotationOptimizer(config).optimize(geometry);

    REQUIRE(result.rotation.x == start.x);
    REQUIRE(result.rotation.y == start.y);
    REQUIRE(result.best_volume <= result.initial_volume);

    REQUIRE_FALSE(applied.empty());
    for (const auto& r : applied) {
        REQUIRE(r.x == start.x);
        REQUIRE(r.y == start.y);
    }

    // No PCA phase in this mode
    for (const auto& name : result.phases_run) {
        REQUIRE(name != "pca");
    }
}

TEST_CASE("Z only mode finds the upright minimum", "[optimizer]") {
    OptimizerConfig config;
    config.z_only = true;

    PointCloudGeometry geometry(make_box(8.0, 3.0, 2.0), Rotation::from_degrees(0.0, 0.0, 37.0));
    OptimizationResult result = RotationOptimizer(config).optimize(geometry);

    REQUIRE(result.best_volume == Approx(48.0).epsilon(1e-4));
    REQUIRE(result.rotation.x == 0.0);
    REQUIRE(result.rotation.y == 0.0);
}

TEST_CASE("Optimizer is deterministic", "[optimizer]") {
    const PointCloud points = make_ellipsoid(200, 5.0, 2.0, 1.0);
    const Rotation start = Rotation::from_degrees(25.0, -40.0, 60.0);
    RotationOptimizer optimizer(quick_config());

    OptimizationResult a = optimizer.optimize_points(points, start);
    OptimizationResult b = optimizer.optimize_points(points, start);

    REQUIRE(a.rotation == b.rotation);
    REQUIRE(a.best_volume == b.best_volume);
    REQUIRE(a.attempts == b.attempts);
    REQUIRE(a.phases_run == b.phases_run);
}

TEST_CASE("Offset and absolute candidates", "[optimizer]") {
    const Rotation start = Rotation::from_degrees(0.0, 0.0, 30.0);
    PointCloudGeometry geometry(make_box(10.0, 4.0, 1.0), start);
    geometry.apply_rotation(start);

    OptimizerConfig config;
    SearchState state(start, geometry.measure_aabb().volume, 600.0);
    RotationGenerator generator;
    NullLogger logger;
    SearchContext context{geometry, state, generator, config, logger, {}, false};

    SECTION("Offset composes with the initial rotation") {
        REQUIRE(context.try_offset(Vec3(0.0, 0.0, -30.0)));
        REQUIRE(equivalent(geometry.current_rotation(), Rotation{}, 1e-9));
        REQUIRE(state.best_volume() == Approx(40.0));
    }

    SECTION("Absolute is applied as given") {
        context.try_absolute(Rotation::from_degrees(0.0, 0.0, -30.0));
        REQUIRE(geometry.current_rotation() == Rotation::from_degrees(0.0, 0.0, -30.0));
        REQUIRE(state.best_volume() > 40.0);
    }

    SECTION("Offsets use matrix composition") {
        SearchState tilted_state(Rotation::from_degrees(30.0, 0.0, 0.0), 1.0, 600.0);
        SearchContext tilted{geometry, tilted_state, generator, config, logger, {}, false};

        const Rotation effective = tilted.offset_rotation(Vec3(0.0, 20.0, 0.0));
        const Mat3 expected = Mat3::rotation_x(30.0 * DEG_TO_RAD) * Mat3::rotation_y(20.0 * DEG_TO_RAD);
        REQUIRE(effective.to_matrix().approx_equal(expected, 1e-9));
        REQUIRE_FALSE(equivalent(effective, Rotation::from_degrees(30.0, 20.0, 0.0), 1e-6));
    }

    SECTION("Z only pins X and Y") {
        OptimizerConfig z_config;
        z_config.z_only = true;
        const Rotation tilted_start = Rotation::from_degrees(10.0, 20.0, 30.0);
        SearchState z_state(tilted_start, 1.0, 600.0);
        SearchContext z_context{geometry, z_state, generator, z_config, logger, {}, false};

        const Rotation offset = z_context.offset_rotation(Vec3(45.0, 45.0, 15.0));
        REQUIRE(offset.x == tilted_start.x);
        REQUIRE(offset.y == tilted_start.y);
        REQUIRE(offset.z == Approx(45.0 * DEG_TO_RAD));

        const Rotation pinned = z_context.pin(Rotation{1.0, 2.0, 3.0});
        REQUIRE(pinned == Rotation{tilted_start.x, tilted_start.y, 3.0});
    }
}

TEST_CASE("Failing candidates are skipped", "[optimizer]") {
    const PointCloud points = make_box(10.0, 10.0, 1.0);
    Rotation current = Rotation::from_degrees(0.0, 0.0, 45.0);
    int calls = 0;

    CallbackGeometry geometry(
        points,
        current,
        [&](const Rotation& r) { current = r; },
        [&]() {
            ++calls;
            // The initial measurement succeeds; afterwards every third call fails
            if (calls > 1 && calls % 3 == 0) {
                throw std::runtime_error("transient host error");
            }
            return compute_aabb(points, current);
        });

    OptimizationResult result = RotationOptimizer(quick_config()).optimize(geometry);

    REQUIRE(result.failures > 0);
    REQUIRE(result.best_volume <= result.initial_volume);
    REQUIRE(result.reduction_percent > 30.0);
}

TEST_CASE("Failure of the initial measurement propagates", "[optimizer]") {
    CallbackGeometry geometry(
        make_box(1.0, 1.0, 1.0),
        Rotation{},
        [](const Rotation&) {},
        []() -> AabbMetrics { throw std::runtime_error("mesh gone"); });

    REQUIRE_THROWS_AS(RotationOptimizer().optimize(geometry), std::runtime_error);
}

TEST_CASE("Time budget", "[optimizer]") {
    const Rotation start = Rotation::from_degrees(0.0, 0.0, 45.0);

    SECTION("Zero budget runs no phase") {
        PointCloudGeometry geometry(make_box(10.0, 10.0, 1.0), start);
        OptimizationResult result = RotationOptimizer().optimize(geometry, {}, 0.0);

        REQUIRE(result.attempts == 0);
        REQUIRE(result.phases_run.empty());
        REQUIRE(result.rotation == start);
        REQUIRE(result.reduction_percent == 0.0);
    }

    SECTION("Config budget is the default") {
        OptimizerConfig config;
        config.max_time = 0.0;
        PointCloudGeometry geometry(make_box(10.0, 10.0, 1.0), start);
        OptimizationResult result = RotationOptimizer(config).optimize(geometry);
        REQUIRE(result.phases_run.empty());
    }

    SECTION("Negative budget is rejected") {
        PointCloudGeometry geometry(make_box(10.0, 10.0, 1.0), start);
        REQUIRE_THROWS_AS(RotationOptimizer().optimize(geometry, {}, -1.0), std::invalid_argument);
    }
}

TEST_CASE("Phase chain", "[optimizer]") {
    const PointCloud box = make_box(10.0, 10.0, 1.0);
    const Rotation start = Rotation::from_degrees(0.0, 0.0, 45.0);

    SECTION("Default order") {
        OptimizationResult result = RotationOptimizer().optimize_points(box, start);
        const std::vector<std::string> expected = {"coarse", "medium", "fine", "pca", "local_refine"};
        REQUIRE(result.phases_run == expected);
    }

    SECTION("Presets run first") {
        const std::vector<Vec3> presets = {Vec3(0.0, 0.0, -45.0)};
        OptimizationResult result = RotationOptimizer().optimize_points(box, start, presets);
        REQUIRE(result.phases_run.front() == "presets");
        REQUIRE(result.best_volume == Approx(100.0));
    }

    SECTION("PCA can be disabled") {
        OptimizerConfig config;
        config.use_pca_initial_guess = false;
        OptimizationResult result = RotationOptimizer(config).optimize_points(box, start);
        for (const auto& name : result.phases_run) {
            REQUIRE(name != "pca");
        }
    }

    SECTION("Only the first presets are tried") {
        OptimizerConfig config;
        config.max_presets = 2;
        std::vector<PhasePtr> phases;
        phases.push_back(std::make_unique<PresetPhase>());
        RotationOptimizer optimizer(config, std::move(phases));

        const std::vector<Vec3> presets(5, Vec3(0.0, 0.0, 10.0));
        OptimizationResult result = optimizer.optimize_points(box, start, presets);
        REQUIRE(result.attempts == 2);
    }

    SECTION("Custom chain") {
        std::vector<PhasePtr> phases;
        phases.push_back(std::make_unique<CoarsePhase>());
        RotationOptimizer optimizer(OptimizerConfig{}, std::move(phases));

        OptimizationResult result = optimizer.optimize_points(box, start);
        REQUIRE(result.phases_run == std::vector<std::string>{"coarse"});
        REQUIRE(result.attempts == 216);

        RotationOptimizer copy(optimizer);
        REQUIRE(copy.phases().size() == 1);
        REQUIRE(copy.phases()[0].get() != optimizer.phases()[0].get());
        REQUIRE(copy.optimize_points(box, start).rotation == result.rotation);
    }

    SECTION("Null phase is rejected") {
        std::vector<PhasePtr> phases;
        phases.push_back(nullptr);
        REQUIRE_THROWS_AS(RotationOptimizer(OptimizerConfig{}, std::move(phases)), std::invalid_argument);
    }
}

TEST_CASE("Fast mode", "[optimizer]") {
    const PointCloud box = make_box(10.0, 10.0, 1.0);
    const Rotation start = Rotation::from_degrees(0.0, 0.0, 45.0);

    SECTION("Explicit") {
        OptimizationResult fast = RotationOptimizer(quick_config()).optimize_points(box, start);
        OptimizationResult full = RotationOptimizer().optimize_points(box, start);
        REQUIRE(fast.fast_mode);
        REQUIRE_FALSE(full.fast_mode);
        REQUIRE(fast.attempts < full.attempts);
    }

    SECTION("Enabled automatically for large meshes") {
        OptimizerConfig config;
        config.auto_fast_mode_vertex_threshold = 4;
        OptimizationResult result = RotationOptimizer(config).optimize_points(box, start);
        REQUIRE(result.fast_mode);

        config.auto_fast_mode_vertex_threshold = 0;
        REQUIRE_FALSE(RotationOptimizer(config).optimize_points(box, start).fast_mode);
    }
}

TEST_CASE("Configuration validation", "[optimizer]") {
    OptimizerConfig config;

    SECTION("Empty steps") {
        config.adaptive_steps.clear();
        REQUIRE_THROWS_AS(RotationOptimizer(config), std::invalid_argument);
    }

    SECTION("Non-positive step") {
        config.fast_adaptive_steps = {5.0, -1.0};
        REQUIRE_THROWS_AS(RotationOptimizer(config), std::invalid_argument);
    }

    SECTION("Negative time") {
        config.max_time = -1.0;
        REQUIRE_THROWS_AS(RotationOptimizer(config), std::invalid_argument);
    }

    SECTION("Sweep caps") {
        config.max_refine_sweeps = 0;
        REQUIRE_THROWS_AS(RotationOptimizer(config), std::invalid_argument);
    }

    SECTION("Nested PCA config") {
        config.pca.pitch_range_deg = -1.0;
        REQUIRE_THROWS_AS(RotationOptimizer(config), std::invalid_argument);
    }

    SECTION("Defaults are valid") {
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("Batch optimization", "[optimizer]") {
    const std::vector<PointCloud> meshes = {
        make_box(10.0, 10.0, 1.0),
        make_box(8.0, 3.0, 2.0),
        make_ellipsoid(150, 4.0, 2.0, 1.0),
        PointCloud{}
    };
    const std::vector<Rotation> starts = {
        Rotation::from_degrees(0.0, 0.0, 45.0),
        Rotation::from_degrees(20.0, 10.0, -30.0),
        Rotation::from_degrees(-15.0, 60.0, 5.0),
        Rotation{}
    };
    RotationOptimizer optimizer(quick_config());

    SECTION("Matches individual runs") {
        const auto results = optimizer.optimize_batch(meshes, starts);
        REQUIRE(results.size() == meshes.size());
        for (size_t i = 0; i < meshes.size(); ++i) {
            OptimizationResult single = optimizer.optimize_points(meshes[i], starts[i]);
            REQUIRE(results[i].rotation == single.rotation);
            REQUIRE(results[i].best_volume == single.best_volume);
        }
        REQUIRE(results[3].degenerate);
    }

    SECTION("Identity start when no rotations are given") {
        const auto results = optimizer.optimize_batch(meshes);
        REQUIRE(results.size() == meshes.size());
        REQUIRE(results[0].initial_volume == Approx(100.0));
    }

    SECTION("Mismatched rotations") {
        const std::vector<Rotation> too_few(2);
        REQUIRE_THROWS_AS(optimizer.optimize_batch(meshes, too_few), std::invalid_argument);
    }
}

TEST_CASE("Optimizer logging", "[optimizer]") {
    std::ostringstream out;
    auto logger = std::make_shared<StreamLogger>(out, LogLevel::Info);

    RotationOptimizer optimizer(quick_config(), logger);
    optimizer.optimize_points(make_box(10.0, 10.0, 1.0), Rotation::from_degrees(0.0, 0.0, 45.0));

    const std::string text = out.str();
    REQUIRE(text.find("[Optimizer] initial bbox volume") != std::string::npos);
    REQUIRE(text.find("[Coarse] testing 64 rotations") != std::string::npos);
    REQUIRE(text.find("[Optimizer] best:") != std::string::npos);
    REQUIRE(text.find("DEBUG") == std::string::npos);
}

TEST_CASE("Stream logger", "[logger]") {
    std::ostringstream out;
    StreamLogger logger(out, LogLevel::Info);

    logger.debug("Test", "hidden");
    logger.info("Test", "shown");
    logger.warn("Test", "careful");
    REQUIRE(out.str() == "[Test] shown\n[Test] WARN: careful\n");

    logger.set_min_level(LogLevel::Debug);
    logger.debug("Test", "now visible");
    REQUIRE(out.str().find("[Test] DEBUG: now visible") != std::string::npos);

    REQUIRE_FALSE(null_logger()->enabled(LogLevel::Warn));
}
