/// @file routing_utils.cpp
/// @brief Manhattan fallback and tangent-arc filleting

#include "routing/routing_utils.hpp"

#include <algorithm>
#include <cmath>

namespace tapeboard {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double STRAIGHT_TOLERANCE = 0.1;  // rad off a straight line still counted straight
constexpr double MIN_ALIGNED_OFFSET = 1.0;  // mm; smaller offsets route straight
constexpr double MIN_CORNER_ANGLE = 1e-6;   // rad; a full reversal has no tangent arc

Vec2 normalized(Vec2 v) {
    double length = std::hypot(v.x, v.y);
    return length > 0.0 ? Vec2{v.x / length, v.y / length} : v;
}

/// Arc points from the incoming tangent point to the outgoing one, both included
std::vector<Vec2> corner_arc(Vec2 p0, Vec2 p1, Vec2 p2, double interior, double radius) {
    const double leg_in = distance(p0, p1);
    const double leg_out = distance(p1, p2);
    const double half = interior / 2.0;

    double tangent = radius / std::tan(half);
    tangent = std::min(tangent, std::min(leg_in, leg_out) / 2.0);
    const double arc_radius = tangent * std::tan(half);

    const Vec2 u_in = normalized(p0 - p1);
    const Vec2 u_out = normalized(p2 - p1);
    const Vec2 t_in = p1 + u_in * tangent;
    const Vec2 t_out = p1 + u_out * tangent;
    const Vec2 bisector = normalized(u_in + u_out);
    const Vec2 center = p1 + bisector * (arc_radius / std::sin(half));

    const double turn = PI - interior;
    const int segments = std::max(3, static_cast<int>(std::floor(turn * 8.0 / PI)));

    double start_angle = std::atan2(t_in.y - center.y, t_in.x - center.x);
    double end_angle = std::atan2(t_out.y - center.y, t_out.x - center.x);
    double sweep = end_angle - start_angle;
    while (sweep > PI) sweep -= 2.0 * PI;
    while (sweep <= -PI) sweep += 2.0 * PI;

    std::vector<Vec2> arc;
    arc.reserve(static_cast<size_t>(segments) + 1);
    arc.push_back(t_in);
    for (int i = 1; i < segments; i++) {
        double a = start_angle + sweep * static_cast<double>(i) / segments;
        arc.push_back({center.x + arc_radius * std::cos(a), center.y + arc_radius * std::sin(a)});
    }
    arc.push_back(t_out);
    return arc;
}

} // namespace

Polyline manhattan_route(Vec2 start, Vec2 end, bool horizontal_first) {
    const double dx = end.x - start.x;
    const double dy = end.y - start.y;
    if (std::abs(dx) < MIN_ALIGNED_OFFSET || std::abs(dy) < MIN_ALIGNED_OFFSET) {
        return {start, end};
    }
    Vec2 corner = horizontal_first ? Vec2{end.x, start.y} : Vec2{start.x, end.y};
    return {start, corner, end};
}

bool path_hits_obstacles(const Polyline& path, const std::vector<Polygon>& obstacles) {
    for (size_t i = 0; i + 1 < path.size(); i++) {
        for (const Polygon& obstacle : obstacles) {
            if (segment_intersects_polygon(path[i], path[i + 1], obstacle)) {
                return true;
            }
        }
    }
    return false;
}

RoutedPath manhattan_route_with_avoidance(Vec2 start, Vec2 end,
                                          const std::vector<Polygon>& obstacles) {
    Polyline horizontal = manhattan_route(start, end, true);
    Polyline vertical = manhattan_route(start, end, false);
    const bool horizontal_clear = !path_hits_obstacles(horizontal, obstacles);
    const bool vertical_clear = !path_hits_obstacles(vertical, obstacles);

    if (horizontal_clear && vertical_clear) {
        bool horizontal_shorter = polyline_length(horizontal) <= polyline_length(vertical);
        return {horizontal_shorter ? horizontal : vertical, RouteMethod::MANHATTAN};
    }
    if (horizontal_clear) return {horizontal, RouteMethod::MANHATTAN};
    if (vertical_clear) return {vertical, RouteMethod::MANHATTAN};

    const double mid_x = (start.x + end.x) / 2.0;
    const double mid_y = (start.y + end.y) / 2.0;
    Polyline z_horizontal = {start, {mid_x, start.y}, {mid_x, end.y}, end};
    Polyline z_vertical = {start, {start.x, mid_y}, {end.x, mid_y}, end};
    if (!path_hits_obstacles(z_horizontal, obstacles)) return {z_horizontal, RouteMethod::MANHATTAN};
    if (!path_hits_obstacles(z_vertical, obstacles)) return {z_vertical, RouteMethod::MANHATTAN};

    return {{start, end}, RouteMethod::DIRECT};
}

Polyline fillet_polyline(const Polyline& points, double radius) {
    if (points.size() < 3 || radius <= 0.0) {
        return points;
    }

    Polyline filleted;
    filleted.push_back(points.front());
    for (size_t i = 1; i + 1 < points.size(); i++) {
        const Vec2& p0 = points[i - 1];
        const Vec2& p1 = points[i];
        const Vec2& p2 = points[i + 1];

        auto interior = turn_angle(p0, p1, p2);
        if (!interior || *interior >= PI - STRAIGHT_TOLERANCE || *interior < MIN_CORNER_ANGLE) {
            filleted.push_back(p1);
            continue;
        }
        std::vector<Vec2> arc = corner_arc(p0, p1, p2, *interior, radius);
        filleted.insert(filleted.end(), arc.begin(), arc.end());
    }
    filleted.push_back(points.back());
    return filleted;
}

} // namespace tapeboard
