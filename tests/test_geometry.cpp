/// @file test_geometry.cpp
/// @brief Tests for rotation, intersection, containment and polyline helpers

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "geometry/geometry.hpp"

#include <cmath>
#include <stdexcept>

using namespace tapeboard;
using Catch::Approx;

namespace {

constexpr double PI = 3.14159265358979323846;

const Polygon SQUARE = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};

} // namespace

TEST_CASE("Rotation uses degrees counter-clockwise", "[geometry]") {
    Vec2 p = rotate_point({1.0, 0.0}, 90.0);
    CHECK(p.x == Approx(0.0).margin(1e-12));
    CHECK(p.y == Approx(1.0));

    Vec2 world = transform_point({2.0, 0.0}, {10.0, 5.0}, 180.0);
    CHECK(world.x == Approx(8.0));
    CHECK(world.y == Approx(5.0).margin(1e-12));
}

TEST_CASE("Segments that only touch do not intersect", "[geometry]") {
    CHECK(segments_intersect({0, 0}, {10, 10}, {0, 10}, {10, 0}));
    CHECK_FALSE(segments_intersect({0, 0}, {5, 0}, {5, 0}, {5, 5}));
    CHECK_FALSE(segments_intersect({0, 0}, {10, 0}, {2, 0}, {8, 0}));
}

TEST_CASE("Polyline crossing detection", "[geometry]") {
    Polyline horizontal = {{0, 5}, {10, 5}};
    Polyline vertical = {{5, 0}, {5, 10}};
    Polyline beside = {{20, 0}, {20, 10}};
    CHECK(polylines_intersect(horizontal, vertical));
    CHECK_FALSE(polylines_intersect(horizontal, beside));
}

TEST_CASE("Point containment and edge tolerance", "[geometry]") {
    CHECK(point_in_polygon({5, 5}, SQUARE));
    CHECK_FALSE(point_in_polygon({15, 5}, SQUARE));
    CHECK(point_on_polygon_edge({10, 5}, SQUARE, 1e-6));
    CHECK_FALSE(point_on_polygon_edge({5, 5}, SQUARE, 1e-6));
    CHECK_FALSE(point_in_polygon({1, 1}, {{0, 0}, {10, 0}}));
}

TEST_CASE("Distance to segments and polylines", "[geometry]") {
    CHECK(distance_to_segment({5, 3}, {0, 0}, {10, 0}) == Approx(3.0));
    CHECK(distance_to_segment({-4, 3}, {0, 0}, {10, 0}) == Approx(5.0));
    CHECK(distance_to_segment({3, 4}, {0, 0}, {0, 0}) == Approx(5.0));
    CHECK(std::isinf(distance_to_polyline({0, 0}, {})));
    CHECK(distance_to_polyline({0, 2}, {{0, 0}}) == Approx(2.0));
    CHECK(polyline_length({{0, 0}, {3, 4}, {3, 10}}) == Approx(11.0));
}

TEST_CASE("Turn angle is the interior angle and rejects zero legs", "[geometry]") {
    auto right = turn_angle({0, 0}, {10, 0}, {10, 10});
    REQUIRE(right);
    CHECK(*right == Approx(PI / 2.0));

    auto straight = turn_angle({0, 0}, {5, 0}, {10, 0});
    REQUIRE(straight);
    CHECK(*straight == Approx(PI));

    CHECK_FALSE(turn_angle({0, 0}, {0, 0}, {10, 0}));
}

TEST_CASE("Box overlap honours clearance", "[geometry]") {
    BoundingBox a{0, 0, 10, 10};
    BoundingBox b{13, 0, 20, 10};
    CHECK_FALSE(boxes_overlap(a, b, 2.0));
    CHECK(boxes_overlap(a, b, 5.0));
    CHECK(bounds_of({{3, -1}, {-2, 4}}).width() == Approx(5.0));
}

TEST_CASE("Grid snapping rejects a non-positive pitch", "[geometry]") {
    CHECK(snap_to_grid(3.9, 2.5) == Approx(5.0));
    CHECK(snap_to_grid(-1.0, 2.5) == Approx(0.0).margin(1e-12));
    CHECK_THROWS_AS(snap_to_grid(1.0, 0.0), std::invalid_argument);
}

TEST_CASE("Collinear points are collapsed, reversals kept", "[geometry]") {
    Polyline line = collapse_collinear({{0, 0}, {5, 0}, {10, 0}, {10, 5}, {10, 10}});
    REQUIRE(line.size() == 3);
    CHECK(line[1] == Vec2{10, 0});

    Polyline reversal = collapse_collinear({{0, 0}, {10, 0}, {5, 0}});
    CHECK(reversal.size() == 3);
}

TEST_CASE("Repeated points never leave zero-length legs", "[geometry]") {
    Polyline tail = collapse_collinear({{0, 0}, {10, 0}, {10, 0}});
    REQUIRE(tail.size() == 2);
    CHECK(tail[1] == Vec2{10, 0});

    Polyline corner = collapse_collinear({{0, 0}, {10, 0}, {10, 0}, {10, 10}});
    REQUIRE(corner.size() == 3);
    CHECK(corner[1] == Vec2{10, 0});
    CHECK(corner[2] == Vec2{10, 10});
}
