/// @file test_pathfinder.cpp
/// @brief Tests for grid A* search

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "routing/pathfinder.hpp"

#include <stdexcept>

using namespace tapeboard;

namespace {

const BoundingBox BOARD{0.0, 0.0, 100.0, 60.0};

Polygon square(double min_x, double min_y, double max_x, double max_y) {
    return BoundingBox{min_x, min_y, max_x, max_y}.corners();
}

} // namespace

TEST_CASE("Free straight path collapses to its endpoints", "[pathfinder]") {
    Pathfinder pathfinder(BOARD, 2.5, 5.0);
    auto path = pathfinder.find_path({0.0, 0.0}, {20.0, 0.0}, {});
    REQUIRE(path);
    REQUIRE(path->size() == 2);
    CHECK(path->front() == Vec2{0.0, 0.0});
    CHECK(path->back() == Vec2{20.0, 0.0});
    CHECK(polyline_length(*path) == Catch::Approx(20.0));
}

TEST_CASE("Paths go around a wall", "[pathfinder]") {
    Pathfinder pathfinder(BOARD, 2.5, 5.0);
    Polygon wall = square(45.0, 0.0, 55.0, 45.0);
    auto path = pathfinder.find_path({20.0, 20.0}, {80.0, 20.0}, {wall});
    REQUIRE(path);
    CHECK(path->front() == Vec2{20.0, 20.0});
    CHECK(path->back() == Vec2{80.0, 20.0});
    CHECK(polyline_length(*path) > 60.0);
    for (const Vec2& p : *path) {
        CHECK_FALSE(point_in_polygon(p, wall));
        CHECK(p.y <= 60.0);
    }
}

TEST_CASE("An enclosed goal is unreachable", "[pathfinder]") {
    Pathfinder pathfinder(BOARD, 2.5, 5.0);
    auto path = pathfinder.find_path({10.0, 10.0}, {50.0, 30.0}, {square(40.0, 20.0, 60.0, 40.0)});
    CHECK_FALSE(path);
    CHECK(pathfinder.last_iterations() > 0);
}

TEST_CASE("The iteration cap ends the search", "[pathfinder]") {
    Pathfinder pathfinder(BOARD, 2.5, 5.0, 3);
    CHECK_FALSE(pathfinder.find_path({0.0, 0.0}, {90.0, 50.0}, {}));
    CHECK(pathfinder.last_iterations() == 3);
}

TEST_CASE("Endpoints are snapped and clamped into the grid", "[pathfinder]") {
    Pathfinder pathfinder(BOARD, 2.5, 5.0);
    CHECK(pathfinder.snap({-3.0, 61.2}) == Vec2{0.0, 60.0});
    CHECK(pathfinder.snap({11.0, 13.9}) == Vec2{10.0, 15.0});
}

TEST_CASE("Invalid pathfinder parameters are rejected", "[pathfinder]") {
    CHECK_THROWS_AS(Pathfinder(BOARD, 0.0, 5.0), std::invalid_argument);
    CHECK_THROWS_AS(Pathfinder(BOARD, 2.5, -1.0), std::invalid_argument);
    CHECK_THROWS_AS(Pathfinder(BOARD, 2.5, 5.0, 0), std::invalid_argument);
}
