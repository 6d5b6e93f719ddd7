#pragma once

/// @file auto_router.hpp
/// @brief Routes connections of a placed arrangement as copper-tape channels

#include "model/arrangement.hpp"
#include "model/board.hpp"
#include "model/component.hpp"
#include "model/connection.hpp"
#include "routing/routing_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tapeboard {

struct RouterConfig {
    double route_width = 5.0;  ///< Copper tape width, mm
    double route_depth = 0.8;  ///< Channel depth, mm
    double route_spacing = 3.0;
    double grid_pitch = 2.5;
    double min_bend_radius = 5.0;
    int max_astar_iterations = 10000;
};

/// Keep-out polygon in board space. Component obstacles carry their component id so a
/// connection can route out of its own components.
struct Obstacle {
    std::string owner_id; ///< Empty for route obstacles
    Polygon polygon;
};

/// Static routing inputs shared by every connection of one arrangement.
///
/// Holds references to `board` and `components`, which must outlive the context.
class RoutingContext {
  public:
    RoutingContext(const Board& board, const std::vector<Component>& components,
                   RouterConfig config = {});

    [[nodiscard]] const Board& board() const { return board_; }
    [[nodiscard]] const std::vector<Component>& components() const { return components_; }
    [[nodiscard]] const ComponentIndex& index() const { return index_; }
    [[nodiscard]] const RouterConfig& config() const { return config_; }
    [[nodiscard]] const std::vector<Obstacle>& component_obstacles() const {
        return component_obstacles_;
    }

  private:
    const Board& board_;
    const std::vector<Component>& components_;
    ComponentIndex index_;
    RouterConfig config_;
    std::vector<Obstacle> component_obstacles_;
};

/// One obstacle per component: the catalog outline when it has at least 3 points, else the
/// pad-centre box grown by 2 mm, in board space. Components without either are skipped.
[[nodiscard]] std::vector<Obstacle> build_component_obstacles(const std::vector<Component>& components);

/// Bounding box of a route grown by half its width plus half the spacing; empty for a route
/// with fewer than 2 points
[[nodiscard]] Polygon route_to_obstacle(const Route& route, double spacing);

/// Power connections first, then by Manhattan distance between the world pad positions.
/// Unresolvable connections go last; the sort is stable.
[[nodiscard]] std::vector<Connection> order_connections(const std::vector<Connection>& connections,
                                                        const ComponentIndex& index);

struct RouteAttempt {
    std::optional<Route> route;
    RouteMethod method = RouteMethod::DIRECT;
    std::optional<SkippedConnection> skipped; ///< Set when the route is empty
};

/// Routes one connection around the component obstacles of every other component and the
/// given route obstacles. Falls back from A* to Manhattan paths to a straight line, so a
/// route is produced whenever both endpoints resolve.
[[nodiscard]] RouteAttempt route_connection(const Connection& connection,
                                            const RoutingContext& context,
                                            const std::vector<Polygon>& route_obstacles);

struct RoutingResult {
    std::vector<Route> routes;
    std::vector<SkippedConnection> skipped;
};

/// Routes connections in priority order, each avoiding the ones routed before it
[[nodiscard]] RoutingResult route_all(const std::vector<Connection>& connections,
                                      const RoutingContext& context);

struct ConflictReport {
    int conflicts_found = 0;
    int rerouted = 0;
    int remaining = 0; ///< Crossing pairs left after the pass
};

/// Single pass over the crossing route pairs found up front. For each pair the shorter
/// route is re-routed around every other current route and replaced. Routes are matched to
/// connections by `connection_id`; routes without a match are left alone.
ConflictReport resolve_conflicts(std::vector<Route>& routes,
                                 const std::vector<Connection>& connections,
                                 const RoutingContext& context);

/// Routes an arrangement: route_all followed by one conflict-resolution pass. The
/// returned arrangement carries the routes, skipped connections and remaining conflicts.
[[nodiscard]] Arrangement route_arrangement(Arrangement arrangement,
                                            const std::vector<Connection>& connections,
                                            const Board& board, const RouterConfig& config = {});

} // namespace tapeboard
