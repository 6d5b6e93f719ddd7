/// @file auto_router.cpp
/// @brief Obstacle construction, connection ordering, routing and conflict resolution

#include "routing/auto_router.hpp"

#include "catalog/catalog.hpp"
#include "routing/pathfinder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace tapeboard {

namespace {

constexpr double PAD_BOX_MARGIN = 2.0;
constexpr size_t MIN_OUTLINE_POINTS = 3;

/// Manhattan distance between the resolved endpoints, or infinity when either is missing
double estimated_length(const Connection& connection, const ComponentIndex& index) {
    auto from = resolve_pad(index, connection.from);
    auto to = resolve_pad(index, connection.to);
    if (!from || !to) {
        return std::numeric_limits<double>::infinity();
    }
    return std::abs(to->world.x - from->world.x) + std::abs(to->world.y - from->world.y);
}

/// Prepends/appends the exact pad positions to a grid path when snapping moved them
Polyline join_endpoints(Polyline path, Vec2 start, Vec2 end) {
    if (path.front() != start) {
        path.insert(path.begin(), start);
    }
    if (path.back() != end) {
        path.push_back(end);
    }
    return collapse_collinear(path);
}

int count_conflicts(const std::vector<Route>& routes) {
    int count = 0;
    for (size_t i = 0; i < routes.size(); i++) {
        for (size_t j = i + 1; j < routes.size(); j++) {
            if (polylines_intersect(routes[i].polyline, routes[j].polyline)) {
                count++;
            }
        }
    }
    return count;
}

} // namespace

RoutingContext::RoutingContext(const Board& board, const std::vector<Component>& components,
                               RouterConfig config)
    : board_(board), components_(components), index_(components), config_(config),
      component_obstacles_(build_component_obstacles(components)) {
    if (config_.grid_pitch <= 0.0) {
        throw std::invalid_argument("Router grid pitch must be positive");
    }
    if (config_.route_width <= 0.0) {
        throw std::invalid_argument("Route width must be positive");
    }
    if (config_.max_astar_iterations <= 0) {
        throw std::invalid_argument("A* iteration cap must be positive");
    }
}

std::vector<Obstacle> build_component_obstacles(const std::vector<Component>& components) {
    std::vector<Obstacle> obstacles;
    obstacles.reserve(components.size());
    for (const Component& component : components) {
        Polygon local;
        const Footprint* fp = find_footprint(component.type);
        if (fp != nullptr && fp->outline.size() >= MIN_OUTLINE_POINTS) {
            local = fp->outline;
        } else if (!component.pads.empty()) {
            std::vector<Vec2> centres;
            for (const Pad& pad : component.pads) {
                centres.push_back(pad.pos);
            }
            local = bounds_of(centres).expanded(PAD_BOX_MARGIN).corners();
        } else {
            continue;
        }

        Obstacle obstacle;
        obstacle.owner_id = component.id;
        for (const Vec2& p : local) {
            obstacle.polygon.push_back(to_world(component, p));
        }
        obstacles.push_back(std::move(obstacle));
    }
    return obstacles;
}

Polygon route_to_obstacle(const Route& route, double spacing) {
    if (route.polyline.size() < 2) {
        return {};
    }
    return bounds_of(route.polyline).expanded(route.width / 2.0 + spacing / 2.0).corners();
}

std::vector<Connection> order_connections(const std::vector<Connection>& connections,
                                          const ComponentIndex& index) {
    std::vector<std::pair<double, Connection>> keyed;
    keyed.reserve(connections.size());
    for (const Connection& c : connections) {
        keyed.emplace_back(estimated_length(c, index), c);
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (a.second.is_power != b.second.is_power) {
            return a.second.is_power;
        }
        return a.first < b.first;
    });

    std::vector<Connection> ordered;
    ordered.reserve(keyed.size());
    for (auto& entry : keyed) {
        ordered.push_back(std::move(entry.second));
    }
    return ordered;
}

RouteAttempt route_connection(const Connection& connection, const RoutingContext& context,
                              const std::vector<Polygon>& route_obstacles) {
    RouteAttempt attempt;
    if (auto problem = check_connection(context.index(), connection)) {
        attempt.skipped = std::move(problem);
        return attempt;
    }
    const auto from = resolve_pad(context.index(), connection.from);
    const auto to = resolve_pad(context.index(), connection.to);

    std::vector<Polygon> obstacles;
    for (const Obstacle& o : context.component_obstacles()) {
        if (o.owner_id != from->component->id && o.owner_id != to->component->id) {
            obstacles.push_back(o.polygon);
        }
    }
    for (const Polygon& p : route_obstacles) {
        if (!p.empty()) obstacles.push_back(p);
    }

    const RouterConfig& config = context.config();
    Pathfinder pathfinder(context.board().bounds(), config.grid_pitch, config.route_width,
                          config.max_astar_iterations);

    RoutedPath path;
    if (auto grid_path = pathfinder.find_path(from->world, to->world, obstacles)) {
        path = RoutedPath{join_endpoints(std::move(*grid_path), from->world, to->world),
                          RouteMethod::ASTAR};
    } else {
        path = manhattan_route_with_avoidance(from->world, to->world, obstacles);
    }
    attempt.method = path.method;

    Route route;
    route.net = connection.net_name.empty() ? "net_" + connection.id : connection.net_name;
    route.connection_id = connection.id;
    route.layer = Layer::TOP;
    route.polyline = fillet_polyline(path.points, config.min_bend_radius);
    route.width = config.route_width;
    route.profile = ChannelProfile::U;
    route.depth = config.route_depth;
    attempt.route = std::move(route);

    spdlog::debug("[route] {} via {} ({} A* iterations)", connection.id,
                  route_method_name(path.method), pathfinder.last_iterations());
    return attempt;
}

RoutingResult route_all(const std::vector<Connection>& connections, const RoutingContext& context) {
    RoutingResult result;
    std::vector<Polygon> route_obstacles;

    for (const Connection& c : order_connections(connections, context.index())) {
        RouteAttempt attempt = route_connection(c, context, route_obstacles);
        if (!attempt.route) {
            spdlog::warn("[route] connection {} skipped: {}", c.id, attempt.skipped->reason);
            result.skipped.push_back(std::move(*attempt.skipped));
            continue;
        }
        if (attempt.method == RouteMethod::DIRECT) {
            spdlog::warn("[route] {} fell back to a straight line", c.id);
        }
        route_obstacles.push_back(route_to_obstacle(*attempt.route, context.config().route_spacing));
        result.routes.push_back(std::move(*attempt.route));
    }
    return result;
}

ConflictReport resolve_conflicts(std::vector<Route>& routes,
                                 const std::vector<Connection>& connections,
                                 const RoutingContext& context) {
    ConflictReport report;
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < routes.size(); i++) {
        for (size_t j = i + 1; j < routes.size(); j++) {
            if (polylines_intersect(routes[i].polyline, routes[j].polyline)) {
                pairs.emplace_back(i, j);
            }
        }
    }
    report.conflicts_found = static_cast<int>(pairs.size());
    if (pairs.empty()) {
        return report;
    }

    std::unordered_map<std::string, const Connection*> by_id;
    for (const Connection& c : connections) {
        by_id.emplace(c.id, &c);
    }

    for (const auto& [i, j] : pairs) {
        const size_t target =
            polyline_length(routes[i].polyline) < polyline_length(routes[j].polyline) ? i : j;
        auto it = by_id.find(routes[target].connection_id);
        if (it == by_id.end()) {
            continue;
        }

        std::vector<Polygon> others;
        for (size_t k = 0; k < routes.size(); k++) {
            if (k != target) {
                others.push_back(route_to_obstacle(routes[k], context.config().route_spacing));
            }
        }
        RouteAttempt attempt = route_connection(*it->second, context, others);
        if (attempt.route) {
            routes[target] = std::move(*attempt.route);
            report.rerouted++;
        }
    }

    report.remaining = count_conflicts(routes);
    spdlog::info("[route] {} crossing pair(s), {} re-routed, {} remaining", report.conflicts_found,
                 report.rerouted, report.remaining);
    return report;
}

Arrangement route_arrangement(Arrangement arrangement, const std::vector<Connection>& connections,
                              const Board& board, const RouterConfig& config) {
    RoutingContext context(board, arrangement.components, config);
    RoutingResult result = route_all(connections, context);
    ConflictReport report = resolve_conflicts(result.routes, connections, context);

    arrangement.routes = std::move(result.routes);
    arrangement.skipped = std::move(result.skipped);
    arrangement.unresolved_conflicts = report.remaining;
    spdlog::info("[route] {}: {} route(s), {} skipped", arrangement.name, arrangement.routes.size(),
                 arrangement.skipped.size());
    return arrangement;
}

} // namespace tapeboard
