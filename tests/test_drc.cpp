/// @file test_drc.cpp
/// @brief Tests for the individual design-rule checks and the aggregate run

#include <catch2/catch_test_macros.hpp>

#include "drc/drc_engine.hpp"

#include <algorithm>

using namespace tapeboard;

namespace {

Route route(Polyline points, double width = 5.0) {
    Route r;
    r.polyline = std::move(points);
    r.width = width;
    return r;
}

Component part(const std::string& id, const std::string& type, Vec2 pos,
               std::vector<Vec2> pad_positions, double pad_dia = 2.0) {
    Component c;
    c.id = id;
    c.type = type;
    c.pos = pos;
    for (size_t i = 0; i < pad_positions.size(); i++) {
        c.pads.push_back({id + "_pad" + std::to_string(i), pad_positions[i], pad_dia});
    }
    return c;
}

long count_type(const std::vector<Violation>& violations, ViolationType type) {
    return std::count_if(violations.begin(), violations.end(),
                         [&](const Violation& v) { return v.type == type; });
}

} // namespace

TEST_CASE("Close parallel routes violate spacing once", "[drc]") {
    Project project;
    project.rules.min_spacing = 5.0;
    project.routes = {route({{10.0, 10.0}, {40.0, 10.0}}), route({{10.0, 13.0}, {40.0, 13.0}})};

    auto violations = check_min_spacing(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].type == ViolationType::SPACING);
    CHECK(violations[0].severity == Severity::ERROR);
    CHECK(violations[0].message == "Routes too close: 3.00mm (min: 5mm)");
    CHECK(violations[0].position == Vec2{10.0, 11.5});

    CHECK(check_wall_thickness(project).size() == 1);
}

TEST_CASE("Separated routes pass spacing and wall checks", "[drc]") {
    Project project;
    project.routes = {route({{10.0, 10.0}, {40.0, 10.0}}), route({{10.0, 30.0}, {40.0, 30.0}}),
                      route({})};
    CHECK(check_min_spacing(project).empty());
    CHECK(check_wall_thickness(project).empty());
}

TEST_CASE("Sharp corners warn, straight runs do not", "[drc]") {
    Project project;
    project.routes = {route({{10.0, 10.0}, {30.0, 10.0}, {30.0, 30.0}}),
                      route({{10.0, 50.0}, {30.0, 50.0}, {50.0, 50.0}})};
    auto violations = check_bend_radius(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].severity == Severity::WARNING);
    CHECK(violations[0].position == Vec2{30.0, 10.0});
}

TEST_CASE("Routes too near a pad are reported", "[drc]") {
    Project project;
    project.components = {part("r1", "resistor_th", {20.0, 20.0}, {{0.0, 0.0}})};

    project.routes = {route({{10.0, 21.0}, {30.0, 21.0}})};
    auto near = check_pad_clearance(project);
    REQUIRE(near.size() == 1);
    CHECK(near[0].type == ViolationType::PAD);
    CHECK(near[0].position == Vec2{20.0, 20.0});

    project.routes = {route({{10.0, 40.0}, {30.0, 40.0}})};
    CHECK(check_pad_clearance(project).empty());
}

TEST_CASE("Points on the board edge are not overhangs", "[drc]") {
    Project project;
    project.routes = {route({{0.0, 30.0}, {100.0, 30.0}}), route({{90.0, 10.0}, {105.0, 10.0}})};
    auto violations = check_overhangs(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].position == Vec2{105.0, 10.0});

    project.board.boundary = {{0.0, 0.0}, {10.0, 0.0}};
    CHECK(check_overhangs(project).empty());
}

TEST_CASE("Holes from components, vias and board features collide", "[drc]") {
    Project project;
    Component magnet;
    magnet.id = "m";
    magnet.type = "magnet_6x2";
    magnet.pos = {20.0, 20.0};
    magnet.holes.push_back({{0.0, 0.0}, 6.0});
    project.components = {magnet};
    project.board.features.push_back({{23.0, 20.0}, 3.0});
    project.vias.push_back({{70.0, 30.0}, 3.0});

    auto violations = check_hole_collisions(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].type == ViolationType::COLLISION);
    CHECK(violations[0].message == "Holes collide: 3.00mm apart (min: 4.50mm)");
}

TEST_CASE("Vias must sit on a tape route", "[drc]") {
    Project project;
    project.vias = {{{20.0, 10.0}}, {{50.0, 50.0}}};
    project.routes = {route({{10.0, 10.0}, {40.0, 10.0}})};
    auto violations = check_tape_overlap(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].type == ViolationType::OVERLAP);
    CHECK(violations[0].severity == Severity::WARNING);
    CHECK(violations[0].position == Vec2{50.0, 50.0});
}

TEST_CASE("Unrouted pads warn, magnets are exempt", "[drc]") {
    Project project;
    project.components = {part("p", "pot_9mm", {20.0, 20.0}, {{0.0, 0.0}, {2.0, 0.0}, {5.0, 0.0}}),
                          part("m", "magnet_6x2", {60.0, 20.0}, {{0.0, 0.0}})};
    project.routes = {route({{20.0, 20.0}, {20.0, 50.0}}, 1.0)};

    auto violations = check_unconnected_pads(project);
    // Reach is pad radius + half width + 1 mm, so only the third pad is left out
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].message == "Unconnected pad on pot_9mm (pad 3) - may need a trace");
    CHECK(violations[0].severity == Severity::WARNING);
}

TEST_CASE("Power sources and consumers are cross-checked", "[drc]") {
    Project project;
    project.components = {part("u1", "ic_dip8", {50.0, 30.0}, {{0.0, 0.0}})};
    auto missing_source = check_power_connections(project);
    REQUIRE(missing_source.size() == 1);
    CHECK(missing_source[0].position == Vec2{50.0, 30.0});

    project.components.push_back(part("vr", "regulator_7805", {20.0, 30.0}, {{0.0, 0.0}}));
    auto unrouted = check_power_connections(project);
    REQUIRE(unrouted.size() == 1);
    CHECK(unrouted[0].message.find("regulator_7805") != std::string::npos);

    project.routes = {route({{21.0, 30.0}, {50.0, 30.0}})};
    CHECK(check_power_connections(project).empty());
}

TEST_CASE("Components placed on top of each other collide", "[drc]") {
    Project project;
    project.components = {part("a", "resistor_th", {20.0, 20.0}, {{0.0, 0.0}, {10.0, 0.0}}),
                          part("b", "resistor_th", {25.0, 22.0}, {{0.0, 0.0}, {10.0, 0.0}}),
                          part("c", "resistor_th", {80.0, 50.0}, {{0.0, 0.0}, {10.0, 0.0}})};
    auto violations = check_component_overlap(project);
    REQUIRE(violations.size() == 1);
    CHECK(violations[0].type == ViolationType::COLLISION);
    CHECK(violations[0].severity == Severity::ERROR);
}

TEST_CASE("A full run aggregates every check", "[drc]") {
    Project project;
    project.rules.min_spacing = 5.0;
    project.routes = {route({{10.0, 10.0}, {40.0, 10.0}}), route({{10.0, 13.0}, {40.0, 13.0}}),
                      route({{90.0, 50.0}, {110.0, 50.0}})};
    project.vias = {{{70.0, 30.0}}};

    auto violations = run_drc(project);
    CHECK(count_type(violations, ViolationType::SPACING) == 1);
    CHECK(count_type(violations, ViolationType::WALL) == 1);
    CHECK(count_type(violations, ViolationType::OVERHANG) == 1);
    CHECK(count_type(violations, ViolationType::OVERLAP) == 1);

    DrcSummary summary = summarize(violations);
    CHECK(summary.errors == 3);
    CHECK(summary.warnings == 1);
    CHECK(summary.has_errors());
    CHECK_FALSE(summarize({}).has_errors());
}
