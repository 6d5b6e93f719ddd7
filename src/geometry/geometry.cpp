/// @file geometry.cpp
/// @brief 2D primitives and predicates

#include "geometry/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tapeboard {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double COLLINEAR_EPSILON = 1e-9;

double degrees_to_radians(double degrees) {
    return degrees * PI / 180.0;
}

} // namespace

Vec2 rotate_point(Vec2 p, double degrees) {
    if (degrees == 0.0) {
        return p;
    }
    double rad = degrees_to_radians(degrees);
    double c = std::cos(rad);
    double s = std::sin(rad);
    return {p.x * c - p.y * s, p.x * s + p.y * c};
}

Vec2 transform_point(Vec2 local, Vec2 origin, double degrees) {
    return rotate_point(local, degrees) + origin;
}

double distance(Vec2 a, Vec2 b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

double polyline_length(const Polyline& points) {
    double length = 0.0;
    for (size_t i = 1; i < points.size(); i++) {
        length += distance(points[i - 1], points[i]);
    }
    return length;
}

double orientation(Vec2 a, Vec2 b, Vec2 p) {
    return (p.x - a.x) * (b.y - a.y) - (b.x - a.x) * (p.y - a.y);
}

bool segments_intersect(Vec2 p1, Vec2 p2, Vec2 q1, Vec2 q2) {
    double d1 = orientation(q1, q2, p1);
    double d2 = orientation(q1, q2, p2);
    double d3 = orientation(p1, p2, q1);
    double d4 = orientation(p1, p2, q2);

    bool p_straddles = (d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0);
    bool q_straddles = (d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0);
    return p_straddles && q_straddles;
}

bool polylines_intersect(const Polyline& a, const Polyline& b) {
    for (size_t i = 1; i < a.size(); i++) {
        for (size_t j = 1; j < b.size(); j++) {
            if (segments_intersect(a[i - 1], a[i], b[j - 1], b[j])) {
                return true;
            }
        }
    }
    return false;
}

bool segment_intersects_polygon(Vec2 p1, Vec2 p2, const Polygon& polygon) {
    const size_t n = polygon.size();
    for (size_t i = 0; i < n; i++) {
        if (segments_intersect(p1, p2, polygon[i], polygon[(i + 1) % n])) {
            return true;
        }
    }
    return false;
}

bool point_in_polygon(Vec2 p, const Polygon& polygon) {
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }
    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Vec2& a = polygon[i];
        const Vec2& b = polygon[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            double cross_x = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (p.x < cross_x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool point_on_polygon_edge(Vec2 p, const Polygon& polygon, double tolerance) {
    const size_t n = polygon.size();
    for (size_t i = 0; i < n; i++) {
        if (distance_to_segment(p, polygon[i], polygon[(i + 1) % n]) <= tolerance) {
            return true;
        }
    }
    return false;
}

double distance_to_segment(Vec2 p, Vec2 a, Vec2 b) {
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    double length_sq = dx * dx + dy * dy;
    if (length_sq == 0.0) {
        return distance(p, a);
    }
    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / length_sq;
    t = std::clamp(t, 0.0, 1.0);
    return distance(p, {a.x + t * dx, a.y + t * dy});
}

double distance_to_polyline(Vec2 p, const Polyline& polyline) {
    if (polyline.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (polyline.size() == 1) {
        return distance(p, polyline.front());
    }
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < polyline.size(); i++) {
        best = std::min(best, distance_to_segment(p, polyline[i - 1], polyline[i]));
    }
    return best;
}

double min_vertex_distance(const Polyline& a, const Polyline& b) {
    double best = std::numeric_limits<double>::infinity();
    for (const Vec2& pa : a) {
        for (const Vec2& pb : b) {
            best = std::min(best, distance(pa, pb));
        }
    }
    return best;
}

std::optional<double> turn_angle(Vec2 p0, Vec2 p1, Vec2 p2) {
    Vec2 v1 = p0 - p1;
    Vec2 v2 = p2 - p1;
    double mag1 = std::hypot(v1.x, v1.y);
    double mag2 = std::hypot(v2.x, v2.y);
    if (mag1 == 0.0 || mag2 == 0.0) {
        return std::nullopt;
    }
    double cosine = (v1.x * v2.x + v1.y * v2.y) / (mag1 * mag2);
    return std::acos(std::clamp(cosine, -1.0, 1.0));
}

BoundingBox bounds_of(const std::vector<Vec2>& points) {
    if (points.empty()) {
        return {};
    }
    BoundingBox box{points[0].x, points[0].y, points[0].x, points[0].y};
    for (const Vec2& p : points) {
        box.min_x = std::min(box.min_x, p.x);
        box.min_y = std::min(box.min_y, p.y);
        box.max_x = std::max(box.max_x, p.x);
        box.max_y = std::max(box.max_y, p.y);
    }
    return box;
}

bool boxes_overlap(const BoundingBox& a, const BoundingBox& b, double clearance) {
    return !(a.max_x + clearance < b.min_x || b.max_x + clearance < a.min_x ||
             a.max_y + clearance < b.min_y || b.max_y + clearance < a.min_y);
}

double snap_to_grid(double value, double pitch) {
    if (pitch <= 0.0) {
        throw std::invalid_argument("Grid pitch must be positive");
    }
    return std::round(value / pitch) * pitch;
}

Polyline collapse_collinear(const Polyline& points) {
    if (points.size() < 3) {
        return points;
    }
    Polyline result;
    result.push_back(points.front());
    for (size_t i = 1; i + 1 < points.size(); i++) {
        const Vec2& prev = result.back();
        const Vec2& curr = points[i];
        const Vec2& next = points[i + 1];
        if (curr == prev || curr == next) {
            continue;
        }
        // Same heading when the cross product vanishes and the legs point the same way
        Vec2 a = curr - prev;
        Vec2 b = next - curr;
        double cross = a.x * b.y - a.y * b.x;
        double dot = a.x * b.x + a.y * b.y;
        if (std::abs(cross) > COLLINEAR_EPSILON || dot <= 0.0) {
            result.push_back(curr);
        }
    }
    if (result.size() == 1 || result.back() != points.back()) {
        result.push_back(points.back());
    }
    return result;
}

} // namespace tapeboard
