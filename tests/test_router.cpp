/// @file test_router.cpp
/// @brief Tests for Manhattan fallback, filleting, obstacle building and the auto-router

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "routing/auto_router.hpp"
#include "routing/routing_utils.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tapeboard;

namespace {

Polygon square(double min_x, double min_y, double max_x, double max_y) {
    return BoundingBox{min_x, min_y, max_x, max_y}.corners();
}

/// Non-catalog part with a single pad at its origin
Component terminal(const std::string& id, Vec2 pos) {
    Component c;
    c.id = id;
    c.type = "test_terminal";
    c.pos = pos;
    c.pads.push_back({id + "_pad0", {0.0, 0.0}, 1.5});
    return c;
}

Route straight_route(const std::string& connection_id, Vec2 a, Vec2 b) {
    Route r;
    r.connection_id = connection_id;
    r.net = connection_id;
    r.polyline = {a, b};
    return r;
}

bool inside_board(const Polyline& line, const BoundingBox& bounds) {
    return std::all_of(line.begin(), line.end(), [&](const Vec2& p) {
        return p.x >= bounds.min_x - 1e-9 && p.x <= bounds.max_x + 1e-9 &&
               p.y >= bounds.min_y - 1e-9 && p.y <= bounds.max_y + 1e-9;
    });
}

} // namespace

TEST_CASE("Manhattan routes bend once unless nearly aligned", "[routing]") {
    CHECK(manhattan_route({0.0, 0.0}, {20.0, 0.5}, true).size() == 2);

    Polyline horizontal = manhattan_route({0.0, 0.0}, {20.0, 10.0}, true);
    REQUIRE(horizontal.size() == 3);
    CHECK(horizontal[1] == Vec2{20.0, 0.0});

    Polyline vertical = manhattan_route({0.0, 0.0}, {20.0, 10.0}, false);
    REQUIRE(vertical.size() == 3);
    CHECK(vertical[1] == Vec2{0.0, 10.0});
}

TEST_CASE("Manhattan avoidance picks the clear L shape", "[routing]") {
    RoutedPath path =
        manhattan_route_with_avoidance({0.0, 0.0}, {20.0, 20.0}, {square(8.0, -2.0, 12.0, 2.0)});
    CHECK(path.method == RouteMethod::MANHATTAN);
    REQUIRE(path.points.size() == 3);
    CHECK(path.points[1] == Vec2{0.0, 20.0});
}

TEST_CASE("Manhattan avoidance falls back to a straight line", "[routing]") {
    RoutedPath path =
        manhattan_route_with_avoidance({0.0, 0.0}, {20.0, 20.0}, {square(15.0, 15.0, 25.0, 25.0)});
    CHECK(path.method == RouteMethod::DIRECT);
    CHECK(path.points.size() == 2);
}

TEST_CASE("Fillets replace corners with tangent arcs", "[routing][fillet]") {
    Polyline corner = {{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}};

    SECTION("endpoints are kept") {
        Polyline filleted = fillet_polyline(corner, 2.0);
        REQUIRE(filleted.size() > 3);
        CHECK(filleted.front() == corner.front());
        CHECK(filleted.back() == corner.back());
        CHECK(std::find(filleted.begin(), filleted.end(), Vec2{10.0, 0.0}) == filleted.end());
    }
    SECTION("arc starts one radius before a right-angle corner") {
        Polyline filleted = fillet_polyline(corner, 2.0);
        CHECK(filleted[1].x == Catch::Approx(8.0));
        CHECK(filleted[1].y == Catch::Approx(0.0).margin(1e-9));
        CHECK(filleted[filleted.size() - 2].x == Catch::Approx(10.0));
        CHECK(filleted[filleted.size() - 2].y == Catch::Approx(2.0));
    }
    SECTION("arc points keep the radius from the centre") {
        Polyline filleted = fillet_polyline(corner, 2.0);
        for (size_t i = 1; i + 1 < filleted.size(); i++) {
            CHECK(distance(filleted[i], {8.0, 2.0}) == Catch::Approx(2.0));
        }
    }
    SECTION("tangent length is limited by short legs") {
        Polyline filleted = fillet_polyline({{0.0, 0.0}, {2.0, 0.0}, {2.0, 10.0}}, 5.0);
        CHECK(filleted[1].x == Catch::Approx(1.0));
        CHECK(filleted.front() == Vec2{0.0, 0.0});
        CHECK(filleted.back() == Vec2{2.0, 10.0});
    }
    SECTION("non-positive radius and straight lines are unchanged") {
        CHECK(fillet_polyline(corner, 0.0).size() == 3);
        CHECK(fillet_polyline(corner, -1.0).size() == 3);
        CHECK(fillet_polyline({{0.0, 0.0}, {5.0, 0.0}, {10.0, 0.0}}, 2.0).size() == 3);
    }
}

TEST_CASE("Component obstacles come from outlines or pad boxes", "[routing]") {
    Component pot;
    pot.id = "pot";
    pot.type = "pot_9mm";
    pot.pos = {50.0, 30.0};
    Component bare;
    bare.id = "bare";
    bare.type = "test_terminal";

    auto obstacles = build_component_obstacles({pot, terminal("t", {10.0, 10.0}), bare});
    REQUIRE(obstacles.size() == 2);
    CHECK(obstacles[0].owner_id == "pot");
    CHECK(point_in_polygon({52.5, 32.5}, obstacles[0].polygon));
    CHECK(obstacles[1].owner_id == "t");
    BoundingBox box = bounds_of(obstacles[1].polygon);
    CHECK(box.min_x == Catch::Approx(8.0));
    CHECK(box.max_y == Catch::Approx(12.0));
}

TEST_CASE("Route obstacles grow by half width and half spacing", "[routing]") {
    Route route = straight_route("r", {20.0, 30.0}, {80.0, 30.0});
    BoundingBox box = bounds_of(route_to_obstacle(route, 3.0));
    CHECK(box.min_x == Catch::Approx(16.0));
    CHECK(box.max_x == Catch::Approx(84.0));
    CHECK(box.min_y == Catch::Approx(26.0));
    CHECK(box.max_y == Catch::Approx(34.0));
    CHECK(route_to_obstacle(Route{}, 3.0).empty());
}

TEST_CASE("Power connections are routed first, then short ones", "[routing]") {
    std::vector<Component> components = {terminal("a", {10.0, 10.0}), terminal("b", {20.0, 10.0}),
                                         terminal("c", {90.0, 10.0})};
    ComponentIndex index(components);
    Connection short_signal{"short", {"a", 0}, {"b", 0}};
    Connection long_power{"power", {"a", 0}, {"c", 0}};
    long_power.is_power = true;
    Connection broken{"broken", {"a", 0}, {"nowhere", 0}};

    auto ordered = order_connections({broken, short_signal, long_power}, index);
    REQUIRE(ordered.size() == 3);
    CHECK(ordered[0].id == "power");
    CHECK(ordered[1].id == "short");
    CHECK(ordered[2].id == "broken");
}

TEST_CASE("A clear connection is routed by A* inside the board", "[routing]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components = {terminal("a", {20.0, 30.0}), terminal("b", {80.0, 30.0})};
    RoutingContext context(board, components);

    RouteAttempt attempt = route_connection({"c1", {"a", 0}, {"b", 0}, "SIG"}, context, {});
    REQUIRE(attempt.route);
    CHECK(attempt.method == RouteMethod::ASTAR);
    CHECK(attempt.route->connection_id == "c1");
    CHECK(attempt.route->net == "SIG");
    CHECK(attempt.route->width == Catch::Approx(5.0));
    CHECK(attempt.route->polyline.front() == Vec2{20.0, 30.0});
    CHECK(attempt.route->polyline.back() == Vec2{80.0, 30.0});
    CHECK(inside_board(attempt.route->polyline, board.bounds()));
}

TEST_CASE("Unnamed connections get a net from their id", "[routing]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components = {terminal("a", {20.0, 30.0}), terminal("b", {40.0, 30.0})};
    RoutingContext context(board, components);
    RouteAttempt attempt = route_connection({"c7", {"a", 0}, {"b", 0}}, context, {});
    REQUIRE(attempt.route);
    CHECK(attempt.route->net == "net_c7");
}

TEST_CASE("Unresolvable connections are skipped with a reason", "[routing]") {
    Board board = make_rectangular_board(100.0, 60.0);
    Arrangement arrangement;
    arrangement.components = {terminal("a", {20.0, 30.0}), terminal("b", {80.0, 30.0})};
    std::vector<Connection> connections = {{"ok", {"a", 0}, {"b", 0}},
                                           {"bad_pad", {"a", 3}, {"b", 0}},
                                           {"bad_id", {"a", 0}, {"zzz", 0}}};

    Arrangement routed = route_arrangement(arrangement, connections, board);
    REQUIRE(routed.routes.size() == 1);
    CHECK(routed.routes[0].connection_id == "ok");
    REQUIRE(routed.skipped.size() == 2);
    CHECK(routed.unresolved_conflicts == 0);
}

TEST_CASE("Router configuration is validated", "[routing]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components;
    RouterConfig config;
    config.grid_pitch = 0.0;
    CHECK_THROWS_AS(RoutingContext(board, components, config), std::invalid_argument);
    config = RouterConfig{};
    config.max_astar_iterations = 0;
    CHECK_THROWS_AS(RoutingContext(board, components, config), std::invalid_argument);
}

TEST_CASE("Crossing routes are resolved by re-routing the shorter one", "[routing][conflicts]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components = {terminal("l1", {20.0, 30.0}), terminal("l2", {80.0, 30.0}),
                                         terminal("s1", {50.0, 15.0}), terminal("s2", {50.0, 45.0})};
    RoutingContext context(board, components);
    std::vector<Connection> connections = {{"long", {"l1", 0}, {"l2", 0}},
                                           {"short", {"s1", 0}, {"s2", 0}}};
    std::vector<Route> routes = {straight_route("long", {20.0, 30.0}, {80.0, 30.0}),
                                 straight_route("short", {50.0, 15.0}, {50.0, 45.0})};

    ConflictReport report = resolve_conflicts(routes, connections, context);
    CHECK(report.conflicts_found == 1);
    CHECK(report.rerouted == 1);
    CHECK(report.remaining == 0);
    CHECK(routes[0].polyline.size() == 2);
    CHECK(routes[1].connection_id == "short");
    CHECK(routes[1].polyline.front() == Vec2{50.0, 15.0});
    CHECK(routes[1].polyline.back() == Vec2{50.0, 45.0});
    CHECK_FALSE(polylines_intersect(routes[0].polyline, routes[1].polyline));
}

TEST_CASE("Conflicts that cannot be avoided are reported", "[routing][conflicts]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components = {terminal("s1", {50.0, 15.0}), terminal("s2", {50.0, 45.0})};
    RoutingContext context(board, components);
    std::vector<Connection> connections = {{"short", {"s1", 0}, {"s2", 0}}};
    std::vector<Route> routes = {straight_route("wall", {0.0, 30.0}, {100.0, 30.0}),
                                 straight_route("short", {50.0, 15.0}, {50.0, 45.0})};

    ConflictReport report = resolve_conflicts(routes, connections, context);
    CHECK(report.conflicts_found == 1);
    CHECK(report.remaining == 1);
}

TEST_CASE("Crossings created by a re-route are left for the caller", "[routing][conflicts]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components = {terminal("s1", {50.0, 15.0}), terminal("s2", {50.0, 45.0})};
    RoutingContext context(board, components);
    std::vector<Connection> connections = {{"short", {"s1", 0}, {"s2", 0}}};
    Route detour;
    detour.connection_id = "short";
    detour.net = "short";
    detour.polyline = {{50.0, 15.0}, {70.0, 15.0}, {70.0, 45.0}, {50.0, 45.0}};
    std::vector<Route> routes = {straight_route("wall", {0.0, 30.0}, {100.0, 30.0}), detour,
                                 straight_route("third", {40.0, 20.0}, {60.0, 20.0})};
    REQUIRE_FALSE(polylines_intersect(routes[1].polyline, routes[2].polyline));

    ConflictReport report = resolve_conflicts(routes, connections, context);
    CHECK(report.conflicts_found == 1);
    CHECK(report.rerouted == 1);
    CHECK(report.remaining == 2);
    CHECK(polylines_intersect(routes[1].polyline, routes[2].polyline));
}

TEST_CASE("Routes without a matching connection are left alone", "[routing][conflicts]") {
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components;
    RoutingContext context(board, components);
    std::vector<Route> routes = {straight_route("", {20.0, 30.0}, {80.0, 30.0}),
                                 straight_route("", {50.0, 15.0}, {50.0, 45.0})};

    ConflictReport report = resolve_conflicts(routes, {}, context);
    CHECK(report.conflicts_found == 1);
    CHECK(report.rerouted == 0);
    CHECK(report.remaining == 1);
}
