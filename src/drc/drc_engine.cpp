/// @file drc_engine.cpp
/// @brief Design-rule checks

#include "drc/drc_engine.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iterator>

namespace tapeboard {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double STRAIGHT_EPSILON = 1e-6;      // rad
constexpr double BEND_ANGLE_OFFSET = 0.1;      // keeps the bend heuristic finite at 0 rad
constexpr double CLEARANCE_PAD_DIAMETER = 1.0; // fallback pad size for clearance checks
constexpr double CONNECTED_PAD_DIAMETER = 1.5; // fallback pad size for connectivity checks
constexpr double CONNECTION_SLACK = 1.0;
constexpr double POWER_ROUTE_REACH = 3.0;
constexpr double MIN_COMPONENT_SIZE = 5.0;
constexpr double COMPONENT_SIZE_MARGIN = 4.0;
constexpr double COMPONENT_CLEARANCE = 2.0;
constexpr double BOUNDARY_EDGE_TOLERANCE = 1e-6;

struct DrilledHole {
    Vec2 pos;
    double dia = 0.0;
};

Vec2 midpoint(Vec2 a, Vec2 b) {
    return {(a.x + b.x) / 2.0, (a.y + b.y) / 2.0};
}

/// Midpoint of the first vertices of two routes
Vec2 route_pair_marker(const Route& a, const Route& b) {
    return midpoint(a.polyline.front(), b.polyline.front());
}

bool has_points(const Route& route) {
    return !route.polyline.empty();
}

bool contains_any(const std::string& type, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* n) { return type.find(n) != std::string::npos; });
}

bool is_power_source(const Component& c) {
    return contains_any(c.type, {"regulator", "connector_barrel", "terminal"});
}

bool needs_power(const Component& c) {
    return contains_any(c.type, {"mcu_", "ic_", "opamp_", "mux_", "shift_"});
}

/// Largest pad-centre spread plus margin; 5 mm components get the minimum
double estimated_size(const Component& component) {
    if (component.pads.empty()) {
        return MIN_COMPONENT_SIZE;
    }
    std::vector<Vec2> centres;
    for (const Pad& pad : component.pads) {
        centres.push_back(pad.pos);
    }
    BoundingBox spread = bounds_of(centres);
    return std::max({spread.width(), spread.height(), MIN_COMPONENT_SIZE}) + COMPONENT_SIZE_MARGIN;
}

double required_bend_radius(double interior_angle, double tape_width) {
    return tape_width * (1.0 + PI / (interior_angle + BEND_ANGLE_OFFSET));
}

} // namespace

std::vector<Violation> check_min_spacing(const Project& project) {
    std::vector<Violation> violations;
    const auto& routes = project.routes;
    for (size_t i = 0; i < routes.size(); i++) {
        for (size_t j = i + 1; j < routes.size(); j++) {
            if (!has_points(routes[i]) || !has_points(routes[j])) continue;
            double gap = min_vertex_distance(routes[i].polyline, routes[j].polyline);
            if (gap < project.rules.min_spacing) {
                violations.push_back({ViolationType::SPACING,
                                      fmt::format("Routes too close: {:.2f}mm (min: {}mm)", gap,
                                                  project.rules.min_spacing),
                                      route_pair_marker(routes[i], routes[j]), Severity::ERROR});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_wall_thickness(const Project& project) {
    std::vector<Violation> violations;
    const auto& routes = project.routes;
    for (size_t i = 0; i < routes.size(); i++) {
        for (size_t j = i + 1; j < routes.size(); j++) {
            if (!has_points(routes[i]) || !has_points(routes[j])) continue;
            double gap = min_vertex_distance(routes[i].polyline, routes[j].polyline);
            double wall = gap - (routes[i].width + routes[j].width) / 2.0;
            if (wall < project.rules.min_wall) {
                violations.push_back({ViolationType::WALL,
                                      fmt::format("Wall too thin: {:.2f}mm (min: {}mm)", wall,
                                                  project.rules.min_wall),
                                      route_pair_marker(routes[i], routes[j]), Severity::ERROR});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_bend_radius(const Project& project) {
    std::vector<Violation> violations;
    for (const Route& route : project.routes) {
        const Polyline& line = route.polyline;
        for (size_t i = 1; i + 1 < line.size(); i++) {
            auto angle = turn_angle(line[i - 1], line[i], line[i + 1]);
            if (!angle || *angle >= PI - STRAIGHT_EPSILON) continue;

            double required = required_bend_radius(*angle, route.width);
            if (required > project.rules.min_bend_radius) {
                violations.push_back(
                    {ViolationType::BEND,
                     fmt::format("Bend too sharp: requires {:.2f}mm radius (min: {}mm)", required,
                                 project.rules.min_bend_radius),
                     line[i], Severity::WARNING});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_pad_clearance(const Project& project) {
    std::vector<Violation> violations;
    for (const Component& component : project.components) {
        for (const Pad& pad : component.pads) {
            const Vec2 pad_pos = to_world(component, pad.pos);
            const double pad_radius = pad.radius(CLEARANCE_PAD_DIAMETER);
            for (const Route& route : project.routes) {
                double d = distance_to_polyline(pad_pos, route.polyline);
                if (d < project.rules.min_pad_clearance + pad_radius) {
                    violations.push_back(
                        {ViolationType::PAD,
                         fmt::format("Route too close to pad {}: {:.2f}mm (min: {}mm)", pad.id, d,
                                     project.rules.min_pad_clearance),
                         pad_pos, Severity::ERROR});
                }
            }
        }
    }
    return violations;
}

std::vector<Violation> check_overhangs(const Project& project) {
    std::vector<Violation> violations;
    const Polygon& boundary = project.board.boundary;
    if (boundary.size() < 3) {
        return violations;
    }
    for (const Route& route : project.routes) {
        for (const Vec2& p : route.polyline) {
            bool inside = point_in_polygon(p, boundary) ||
                          point_on_polygon_edge(p, boundary, BOUNDARY_EDGE_TOLERANCE);
            if (!inside) {
                violations.push_back({ViolationType::OVERHANG,
                                      "Route extends beyond board boundary", p, Severity::ERROR});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_hole_collisions(const Project& project) {
    std::vector<DrilledHole> holes;
    for (const Component& component : project.components) {
        for (const Hole& hole : component.holes) {
            holes.push_back({to_world(component, hole.pos), hole.dia});
        }
    }
    for (const Via& via : project.vias) {
        holes.push_back({via.pos, via.dia});
    }
    for (const MountFeature& feature : project.board.features) {
        holes.push_back({feature.pos, feature.dia});
    }

    std::vector<Violation> violations;
    for (size_t i = 0; i < holes.size(); i++) {
        for (size_t j = i + 1; j < holes.size(); j++) {
            double d = distance(holes[i].pos, holes[j].pos);
            double min_distance = (holes[i].dia + holes[j].dia) / 2.0;
            if (d < min_distance) {
                violations.push_back(
                    {ViolationType::COLLISION,
                     fmt::format("Holes collide: {:.2f}mm apart (min: {:.2f}mm)", d, min_distance),
                     holes[i].pos, Severity::ERROR});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_tape_overlap(const Project& project) {
    std::vector<Violation> violations;
    for (const Via& via : project.vias) {
        bool covered = std::any_of(project.routes.begin(), project.routes.end(), [&](const Route& r) {
            return distance_to_polyline(via.pos, r.polyline) < r.width / 2.0;
        });
        if (!covered) {
            violations.push_back({ViolationType::OVERLAP, "Via not connected to any tape route",
                                  via.pos, Severity::WARNING});
        }
    }
    return violations;
}

std::vector<Violation> check_unconnected_pads(const Project& project) {
    std::vector<Violation> violations;
    for (const Component& component : project.components) {
        if (component.type.rfind("magnet_", 0) == 0) continue;

        for (size_t i = 0; i < component.pads.size(); i++) {
            const Pad& pad = component.pads[i];
            const Vec2 pad_pos = to_world(component, pad.pos);
            const double pad_radius = pad.radius(CONNECTED_PAD_DIAMETER);
            bool connected =
                std::any_of(project.routes.begin(), project.routes.end(), [&](const Route& r) {
                    return distance_to_polyline(pad_pos, r.polyline) <
                           pad_radius + r.width / 2.0 + CONNECTION_SLACK;
                });
            if (!connected) {
                violations.push_back({ViolationType::PAD,
                                      fmt::format("Unconnected pad on {} (pad {}) - may need a trace",
                                                  component.type, i + 1),
                                      pad_pos, Severity::WARNING});
            }
        }
    }
    return violations;
}

std::vector<Violation> check_power_connections(const Project& project) {
    std::vector<Violation> violations;
    std::vector<const Component*> sources;
    std::vector<const Component*> consumers;
    for (const Component& c : project.components) {
        if (is_power_source(c)) sources.push_back(&c);
        if (needs_power(c)) consumers.push_back(&c);
    }

    if (!consumers.empty() && sources.empty()) {
        violations.push_back(
            {ViolationType::PAD,
             "ICs/MCUs detected but no power source (regulator/barrel connector) - add power input",
             consumers.front()->pos, Severity::WARNING});
    }

    for (const Component* source : sources) {
        bool routed = false;
        for (const Pad& pad : source->pads) {
            const Vec2 pad_pos = to_world(*source, pad.pos);
            routed = std::any_of(project.routes.begin(), project.routes.end(), [&](const Route& r) {
                return distance_to_polyline(pad_pos, r.polyline) < POWER_ROUTE_REACH;
            });
            if (routed) break;
        }
        if (!routed) {
            violations.push_back(
                {ViolationType::PAD,
                 fmt::format("Power component {} has no connections - route power to other components",
                             source->type),
                 source->pos, Severity::WARNING});
        }
    }
    return violations;
}

std::vector<Violation> check_component_overlap(const Project& project) {
    std::vector<Violation> violations;
    const auto& components = project.components;
    for (size_t i = 0; i < components.size(); i++) {
        for (size_t j = i + 1; j < components.size(); j++) {
            const Component& a = components[i];
            const Component& b = components[j];
            double min_distance = (estimated_size(a) + estimated_size(b)) / 2.0 + COMPONENT_CLEARANCE;
            if (distance(a.pos, b.pos) < min_distance) {
                violations.push_back(
                    {ViolationType::COLLISION,
                     fmt::format("Components overlap: {} and {} - move them apart", a.type, b.type),
                     midpoint(a.pos, b.pos), Severity::ERROR});
            }
        }
    }
    return violations;
}

std::vector<Violation> run_drc(const Project& project) {
    using Check = std::vector<Violation> (*)(const Project&);
    constexpr Check CHECKS[] = {
        check_min_spacing,       check_wall_thickness,   check_bend_radius,
        check_pad_clearance,     check_overhangs,        check_hole_collisions,
        check_tape_overlap,      check_unconnected_pads, check_power_connections,
        check_component_overlap,
    };

    std::vector<Violation> violations;
    for (Check check : CHECKS) {
        std::vector<Violation> found = check(project);
        violations.insert(violations.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }

    DrcSummary summary = summarize(violations);
    spdlog::info("[drc] {}: {} error(s), {} warning(s)", project.name, summary.errors,
                 summary.warnings);
    return violations;
}

DrcSummary summarize(const std::vector<Violation>& violations) {
    DrcSummary summary;
    for (const Violation& v : violations) {
        if (v.severity == Severity::ERROR) {
            summary.errors++;
        } else {
            summary.warnings++;
        }
    }
    return summary;
}

} // namespace tapeboard
