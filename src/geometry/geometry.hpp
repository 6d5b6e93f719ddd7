#pragma once

/// @file geometry.hpp
/// @brief 2D primitives and predicates shared by placement, routing and DRC

#include <optional>
#include <vector>

namespace tapeboard {

/// A 2D point in board coordinates (millimetres)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

[[nodiscard]] inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
[[nodiscard]] inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
[[nodiscard]] inline Vec2 operator*(Vec2 v, double s) { return {v.x * s, v.y * s}; }
[[nodiscard]] inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
[[nodiscard]] inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }

using Polyline = std::vector<Vec2>;
using Polygon = std::vector<Vec2>;

/// An axis-aligned box in board coordinates
struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    [[nodiscard]] double width() const { return max_x - min_x; }
    [[nodiscard]] double height() const { return max_y - min_y; }
    [[nodiscard]] double area() const { return width() * height(); }
    [[nodiscard]] Vec2 center() const { return {(min_x + max_x) / 2.0, (min_y + max_y) / 2.0}; }

    /// Returns this box translated by an offset
    [[nodiscard]] BoundingBox translated(Vec2 offset) const {
        return {min_x + offset.x, min_y + offset.y, max_x + offset.x, max_y + offset.y};
    }

    /// Returns this box grown by `amount` on every side
    [[nodiscard]] BoundingBox expanded(double amount) const {
        return {min_x - amount, min_y - amount, max_x + amount, max_y + amount};
    }

    /// The four corners in counter-clockwise order, usable as a polygon
    [[nodiscard]] Polygon corners() const {
        return {{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}};
    }
};

/// Rotates a point around the origin by an angle in degrees
[[nodiscard]] Vec2 rotate_point(Vec2 p, double degrees);

/// Maps a local footprint point into board space: rotate by `degrees`, then translate by
/// `origin`.
[[nodiscard]] Vec2 transform_point(Vec2 local, Vec2 origin, double degrees);

[[nodiscard]] double distance(Vec2 a, Vec2 b);

/// Sum of segment lengths; zero for fewer than two points
[[nodiscard]] double polyline_length(const Polyline& points);

/// Signed orientation of `p` relative to the directed line a->b
[[nodiscard]] double orientation(Vec2 a, Vec2 b, Vec2 p);

/// True when segments p1-p2 and q1-q2 properly cross. Touching endpoints and collinear
/// overlaps are not reported.
[[nodiscard]] bool segments_intersect(Vec2 p1, Vec2 p2, Vec2 q1, Vec2 q2);

/// True when any segment of `a` properly crosses any segment of `b`
[[nodiscard]] bool polylines_intersect(const Polyline& a, const Polyline& b);

/// True when segment p1-p2 properly crosses any edge of the closed polygon
[[nodiscard]] bool segment_intersects_polygon(Vec2 p1, Vec2 p2, const Polygon& polygon);

/// Ray-casting containment test. Polygons with fewer than 3 vertices contain nothing.
[[nodiscard]] bool point_in_polygon(Vec2 p, const Polygon& polygon);

/// True when `p` lies within `tolerance` of any edge of the closed polygon
[[nodiscard]] bool point_on_polygon_edge(Vec2 p, const Polygon& polygon, double tolerance = 1e-9);

/// Distance from `p` to segment a-b. A zero-length segment degrades to point distance.
[[nodiscard]] double distance_to_segment(Vec2 p, Vec2 a, Vec2 b);

/// Distance from `p` to the nearest segment of a polyline. Infinity for an empty polyline,
/// plain point distance for a single point.
[[nodiscard]] double distance_to_polyline(Vec2 p, const Polyline& polyline);

/// Smallest vertex-to-vertex distance between two polylines (infinity when either is empty)
[[nodiscard]] double min_vertex_distance(const Polyline& a, const Polyline& b);

/// Interior angle at `p1` between legs p1->p0 and p1->p2, in radians within [0, pi].
/// Empty when either leg has zero length.
[[nodiscard]] std::optional<double> turn_angle(Vec2 p0, Vec2 p1, Vec2 p2);

/// Tight box around the points; empty input yields a zero box at the origin
[[nodiscard]] BoundingBox bounds_of(const std::vector<Vec2>& points);

/// True unless the boxes are separated by more than `clearance` along some axis
[[nodiscard]] bool boxes_overlap(const BoundingBox& a, const BoundingBox& b, double clearance);

/// Rounds a coordinate to the nearest multiple of `pitch`
/// @throws std::invalid_argument if pitch is not positive
[[nodiscard]] double snap_to_grid(double value, double pitch);

/// Removes interior points that continue in the same direction as the previous segment
[[nodiscard]] Polyline collapse_collinear(const Polyline& points);

} // namespace tapeboard
