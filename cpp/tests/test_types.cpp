#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "bbox_minimizer/core/types.hpp"
#include "bbox_minimizer/core/rotation.hpp"
#include "bbox_minimizer/core/point_cloud.hpp"

using namespace bbox_minimizer;
using Catch::Approx;

TEST_CASE("Vec3 operations", "[types]") {
    SECTION("Construction") {
        Vec3 v1;
        REQUIRE(v1.x == 0.0);
        REQUIRE(v1.y == 0.0);
        REQUIRE(v1.z == 0.0);

        Vec3 v2(1.0, 2.0, 3.0);
        REQUIRE(v2[0] == 1.0);
        REQUIRE(v2[1] == 2.0);
        REQUIRE(v2[2] == 3.0);
    }

    SECTION("Arithmetic") {
        Vec3 a(1.0, 2.0, 3.0);
        Vec3 b(4.0, 5.0, 6.0);

        REQUIRE(a + b == Vec3(5.0, 7.0, 9.0));
        REQUIRE(b - a == Vec3(3.0, 3.0, 3.0));
        REQUIRE(a * 2.0 == Vec3(2.0, 4.0, 6.0));
        REQUIRE(2.0 * a == Vec3(2.0, 4.0, 6.0));
    }

    SECTION("Dot and cross") {
        Vec3 ex(1.0, 0.0, 0.0);
        Vec3 ey(0.0, 1.0, 0.0);
        REQUIRE(ex.dot(ey) == 0.0);
        REQUIRE(ex.cross(ey) == Vec3(0.0, 0.0, 1.0));
        REQUIRE(Vec3(3.0, 4.0, 12.0).length() == Approx(13.0));
    }
}

TEST_CASE("Mat3 operations", "[types]") {
    SECTION("Identity") {
        Mat3 id = Mat3::identity();
        Vec3 v(1.0, -2.0, 3.0);
        REQUIRE(id * v == v);
        REQUIRE(id.determinant() == 1.0);
    }

    SECTION("Axis rotations") {
        Vec3 p = Mat3::rotation_z(HALF_PI) * Vec3(1.0, 0.0, 0.0);
        REQUIRE(p.x == Approx(0.0).margin(1e-12));
        REQUIRE(p.y == Approx(1.0));

        Vec3 q = Mat3::rotation_x(HALF_PI) * Vec3(0.0, 1.0, 0.0);
        REQUIRE(q.z == Approx(1.0));

        Vec3 r = Mat3::rotation_y(HALF_PI) * Vec3(0.0, 0.0, 1.0);
        REQUIRE(r.x == Approx(1.0));
    }

    SECTION("Transpose inverts a rotation") {
        Mat3 r = Mat3::rotation_x(0.3) * Mat3::rotation_y(-1.1) * Mat3::rotation_z(2.0);
        REQUIRE((r * r.transposed()).approx_equal(Mat3::identity(), 1e-12));
        REQUIRE(r.determinant() == Approx(1.0));
    }

    SECTION("Columns") {
        Mat3 m = Mat3::from_columns(Vec3(1, 2, 3), Vec3(4, 5, 6), Vec3(7, 8, 9));
        REQUIRE(m.col(1) == Vec3(4, 5, 6));
        REQUIRE(m.row(0) == Vec3(1, 4, 7));
    }
}

TEST_CASE("Rotation conversions", "[types]") {
    SECTION("Degrees") {
        Rotation r = Rotation::from_degrees(90.0, -45.0, 180.0);
        REQUIRE(r.x == Approx(HALF_PI));
        REQUIRE(r.y == Approx(-PI / 4.0));
        REQUIRE(r.z == Approx(PI));

        Vec3 deg = r.to_degrees();
        REQUIRE(deg.x == Approx(90.0));
        REQUIRE(deg.y == Approx(-45.0));
        REQUIRE(deg.z == Approx(180.0));
    }

    SECTION("Matrix is Rz * Ry * Rx") {
        Rotation r{0.4, -0.7, 1.3};
        Mat3 expected = Mat3::rotation_z(1.3) * Mat3::rotation_y(-0.7) * Mat3::rotation_x(0.4);
        REQUIRE(r.to_matrix().approx_equal(expected, 1e-12));
    }

    SECTION("Matrix round trip") {
        for (const Vec3& deg : {Vec3(0, 0, 0), Vec3(10, 20, 30), Vec3(-170, 80, 45),
                                Vec3(135, -60, -120), Vec3(0, 0, 180)}) {
            Rotation r = Rotation::from_degrees(deg);
            Rotation back = Rotation::from_matrix(r.to_matrix());
            REQUIRE(equivalent(r, back, 1e-9));
        }
    }

    SECTION("Small angles decompose to themselves") {
        Rotation r = Rotation::from_degrees(10.0, 20.0, 30.0);
        Rotation back = Rotation::from_matrix(r.to_matrix());
        REQUIRE(back.x == Approx(r.x));
        REQUIRE(back.y == Approx(r.y));
        REQUIRE(back.z == Approx(r.z));
    }

    SECTION("Gimbal lock") {
        Rotation r{0.3, HALF_PI, 0.2};
        Rotation back = Rotation::from_matrix(r.to_matrix());
        REQUIRE(back.is_finite());
        REQUIRE(back.z == 0.0);
        REQUIRE(equivalent(r, back, 1e-9));

        Rotation down{-0.5, -HALF_PI, 0.1};
        REQUIRE(equivalent(down, Rotation::from_matrix(down.to_matrix()), 1e-9));
    }

    SECTION("to_string") {
        REQUIRE(Rotation::from_degrees(90.0, 0.0, -12.5).to_string() == "X=90.00°, Y=0.00°, Z=-12.50°");
    }
}

TEST_CASE("Rotation composition", "[types]") {
    SECTION("Compose matches matrix product") {
        const Rotation a = Rotation::from_degrees(30.0, -10.0, 75.0);
        const Rotation b = Rotation::from_degrees(-45.0, 60.0, 15.0);
        const Mat3 expected = a.to_matrix() * b.to_matrix();

        REQUIRE(compose(a, b).to_matrix().approx_equal(expected, 1e-6));
    }

    SECTION("Compose differs from per-axis addition") {
        const Rotation a = Rotation::from_degrees(30.0, 0.0, 0.0);
        const Rotation b = Rotation::from_degrees(0.0, 20.0, 0.0);
        REQUIRE_FALSE(equivalent(compose(a, b), Rotation::from_degrees(30.0, 20.0, 0.0), 1e-6));
    }

    SECTION("Identity is neutral") {
        const Rotation a = Rotation::from_degrees(12.0, 34.0, 56.0);
        REQUIRE(equivalent(compose(a, Rotation{}), a, 1e-12));
        REQUIRE(equivalent(compose(Rotation{}, a), a, 1e-12));
    }
}

TEST_CASE("Angle utilities", "[types]") {
    REQUIRE(normalize_angle_deg(0.0) == 0.0);
    REQUIRE(normalize_angle_deg(190.0) == Approx(-170.0));
    REQUIRE(normalize_angle_deg(-190.0) == Approx(170.0));
    REQUIRE(normalize_angle_deg(180.0) == Approx(180.0));
    REQUIRE(normalize_angle_deg(-180.0) == Approx(180.0));
    REQUIRE(normalize_angle_deg(540.0) == Approx(180.0));
    REQUIRE(normalize_angle_deg(725.0) == Approx(5.0));

    Vec3 rad = degrees_to_radians(Vec3(180.0, 90.0, -90.0));
    REQUIRE(rad.x == Approx(PI));
    REQUIRE(rad.y == Approx(HALF_PI));
    Vec3 deg = radians_to_degrees(rad);
    REQUIRE(deg.z == Approx(-90.0));
}

TEST_CASE("PointCloud", "[types]") {
    SECTION("Construction") {
        const std::vector<Vec3> pts = {Vec3(0, 0, 0), Vec3(2, 0, 0), Vec3(0, 4, 6)};
        PointCloud cloud = PointCloud::from_points(pts);
        REQUIRE(cloud.size() == 3);
        REQUIRE(cloud.get(2) == Vec3(0, 4, 6));

        Vec3 c = cloud.centroid();
        REQUIRE(c.x == Approx(2.0 / 3.0));
        REQUIRE(c.y == Approx(4.0 / 3.0));
        REQUIRE(c.z == Approx(2.0));
    }

    SECTION("Transform") {
        PointCloud cloud;
        cloud.push_back(Vec3(1, 0, 0));
        PointCloud rotated = cloud.transformed(Mat3::rotation_z(HALF_PI));
        REQUIRE(rotated.x[0] == Approx(0.0).margin(1e-12));
        REQUIRE(rotated.y[0] == Approx(1.0));
        // Source untouched
        REQUIRE(cloud.x[0] == 1.0);
    }

    SECTION("Finite check") {
        PointCloud cloud;
        cloud.push_back(Vec3(1, 2, 3));
        REQUIRE(cloud.is_finite());
        cloud.push_back(Vec3(std::numeric_limits<double>::quiet_NaN(), 0, 0));
        REQUIRE_FALSE(cloud.is_finite());
    }

    SECTION("Empty centroid") {
        REQUIRE(PointCloud{}.centroid() == Vec3{});
    }
}
