#pragma once

/// @file routing_utils.hpp
/// @brief Manhattan fallback paths, obstacle tests and corner filleting

#include "geometry/geometry.hpp"

#include <string_view>
#include <vector>

namespace tapeboard {

/// How a route's path was produced
enum class RouteMethod { ASTAR, MANHATTAN, DIRECT };

[[nodiscard]] constexpr std::string_view route_method_name(RouteMethod method) {
    switch (method) {
    case RouteMethod::ASTAR:
        return "astar";
    case RouteMethod::MANHATTAN:
        return "manhattan";
    case RouteMethod::DIRECT:
        return "direct";
    }
    return "unknown";
}

struct RoutedPath {
    Polyline points;
    RouteMethod method = RouteMethod::DIRECT;
};

/// L-shaped path with one corner, or the straight segment when either offset is under 1 mm
[[nodiscard]] Polyline manhattan_route(Vec2 start, Vec2 end, bool horizontal_first);

/// True when any segment of `path` properly crosses an edge of any obstacle
[[nodiscard]] bool path_hits_obstacles(const Polyline& path, const std::vector<Polygon>& obstacles);

/// Tries both L shapes (shorter first when both are clear), then Z shapes through the
/// midpoint, and finally the straight segment
[[nodiscard]] RoutedPath manhattan_route_with_avoidance(Vec2 start, Vec2 end,
                                                        const std::vector<Polygon>& obstacles);

/// Replaces each interior corner turning more than 0.1 rad with a circular arc of radius
/// `radius` tangent to both legs. The tangent length is limited to half the shorter leg, so
/// tight corners get a smaller arc. Endpoints are kept exactly, corners with a zero-length
/// leg are kept as they are, and a non-positive radius returns the input unchanged.
[[nodiscard]] Polyline fillet_polyline(const Polyline& points, double radius);

} // namespace tapeboard
