/// @file placement_strategies.cpp
/// @brief Initial placement strategies

#include "placement/placement_strategies.hpp"

#include "assembly/connection_inference.hpp"
#include "catalog/catalog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tapeboard {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double EMPTY_FOOTPRINT_HALF_SIZE = 2.0;
constexpr double DEFAULT_PAD_DIAMETER = 2.0;
constexpr double RADIAL_EDGE_RESERVE = 15.0; // Room for the component body outside the circle
constexpr double RADIAL_STEP_PER_COMPONENT = 8.0;

/// An instance paired with its catalog footprint
struct Candidate {
    const ComponentInstance* instance = nullptr;
    const Footprint* footprint = nullptr;
};

PlacedComponent make_placed(const ComponentInstance& instance, Vec2 pos, double rotation,
                            const BoundingBox& bounds) {
    PlacedComponent placed;
    placed.id = instance.id;
    placed.type = instance.type;
    placed.pos = pos;
    placed.rotation = rotation;
    placed.bounds = bounds;
    placed.role = instance.role;
    return placed;
}

Vec2 snapped(double x, double y) {
    return {snap_placement(x), snap_placement(y)};
}

void place_grid(const std::vector<Candidate>& candidates, const BoundingBox& board,
                std::vector<PlacedComponent>& out) {
    double cursor_x = board.min_x + BOARD_MARGIN;
    double cursor_y = board.min_y + BOARD_MARGIN;
    double row_height = 0.0;

    for (const Candidate& c : candidates) {
        BoundingBox bounds = component_bounds(*c.footprint);
        if (cursor_x + bounds.width() > board.max_x - BOARD_MARGIN) {
            cursor_x = board.min_x + BOARD_MARGIN;
            cursor_y += row_height + COMPONENT_SPACING;
            row_height = 0.0;
        }

        Vec2 pos = snapped(cursor_x + bounds.width() / 2.0 - bounds.min_x,
                           cursor_y + bounds.height() / 2.0 - bounds.min_y);
        out.push_back(make_placed(*c.instance, pos, 0.0, bounds));

        cursor_x += bounds.width() + COMPONENT_SPACING;
        row_height = std::max(row_height, bounds.height());
    }
}

void place_compact(std::vector<Candidate> candidates, const BoundingBox& board,
                   std::vector<PlacedComponent>& out) {
    // Largest first packs better
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return component_bounds(*a.footprint).area() > component_bounds(*b.footprint).area();
    });

    for (const Candidate& c : candidates) {
        BoundingBox bounds = component_bounds(*c.footprint);
        auto pos = find_compact_position(out, bounds, board);
        if (!pos) {
            pos = snapped(board.min_x + BOARD_MARGIN - bounds.min_x,
                          board.min_y + BOARD_MARGIN - bounds.min_y);
        }
        out.push_back(make_placed(*c.instance, *pos, 0.0, bounds));
    }
}

void place_symmetric(const std::vector<Candidate>& candidates, const BoundingBox& board,
                     std::vector<PlacedComponent>& out) {
    const double center_x = board.center().x;
    double cursor_y = board.min_y + BOARD_MARGIN;

    size_t i = 0;
    while (i < candidates.size()) {
        const Candidate& left = candidates[i];
        BoundingBox left_bounds = component_bounds(*left.footprint);

        if (i + 1 < candidates.size()) {
            const Candidate& right = candidates[i + 1];
            BoundingBox right_bounds = component_bounds(*right.footprint);
            double offset = left_bounds.width() / 2.0 + COMPONENT_SPACING;

            out.push_back(make_placed(*left.instance,
                                      snapped(center_x - offset - left_bounds.width() / 2.0,
                                              cursor_y + left_bounds.height() / 2.0),
                                      0.0, left_bounds));
            out.push_back(make_placed(*right.instance,
                                      snapped(center_x + offset + right_bounds.width() / 2.0,
                                              cursor_y + right_bounds.height() / 2.0),
                                      0.0, right_bounds));
            cursor_y += std::max(left_bounds.height(), right_bounds.height()) + COMPONENT_SPACING;
            i += 2;
        } else {
            out.push_back(make_placed(*left.instance,
                                      snapped(center_x, cursor_y + left_bounds.height() / 2.0),
                                      0.0, left_bounds));
            cursor_y += left_bounds.height() + COMPONENT_SPACING;
            i++;
        }
    }
}

void place_signal_flow(const std::vector<Candidate>& candidates, const BoundingBox& board,
                       std::vector<PlacedComponent>& out) {
    std::vector<Candidate> columns[3];
    for (const Candidate& c : candidates) {
        ComponentRole role = c.instance->role.value_or(infer_component_role(c.instance->type));
        if (role == ComponentRole::INPUT) {
            columns[0].push_back(c);
        } else if (role == ComponentRole::OUTPUT) {
            columns[2].push_back(c);
        } else {
            columns[1].push_back(c);
        }
    }

    const double column_width = (board.width() - 2.0 * BOARD_MARGIN) / 3.0;
    for (int col = 0; col < 3; col++) {
        const double center_x = board.min_x + BOARD_MARGIN + column_width * col + column_width / 2.0;
        double cursor_y = board.min_y + BOARD_MARGIN;
        for (const Candidate& c : columns[col]) {
            BoundingBox bounds = component_bounds(*c.footprint);
            out.push_back(make_placed(*c.instance, snapped(center_x, cursor_y + bounds.height() / 2.0),
                                      0.0, bounds));
            cursor_y += bounds.height() + COMPONENT_SPACING;
        }
    }
}

void place_radial(const std::vector<Candidate>& candidates, const BoundingBox& board,
                  std::vector<PlacedComponent>& out) {
    if (candidates.empty()) {
        return;
    }
    const Vec2 center = board.center();
    const double count = static_cast<double>(candidates.size());
    const double max_radius =
        std::min(board.width(), board.height()) / 2.0 - BOARD_MARGIN - RADIAL_EDGE_RESERVE;
    const double radius = std::min(max_radius, count * RADIAL_STEP_PER_COMPONENT);

    for (size_t i = 0; i < candidates.size(); i++) {
        // Start at the top and go around
        double angle = 2.0 * PI * static_cast<double>(i) / count - PI / 2.0;
        double rotation = std::fmod(std::round(angle * 180.0 / PI + 90.0), 360.0);
        BoundingBox bounds = component_bounds(*candidates[i].footprint, rotation);
        out.push_back(make_placed(*candidates[i].instance,
                                  snapped(center.x + radius * std::cos(angle),
                                          center.y + radius * std::sin(angle)),
                                  rotation, bounds));
    }
}

} // namespace

BoundingBox component_bounds(const Footprint& footprint, double rotation) {
    std::vector<Vec2> points;
    for (const Pad& pad : footprint.pads) {
        double r = pad.radius(DEFAULT_PAD_DIAMETER);
        points.push_back({pad.pos.x - r, pad.pos.y - r});
        points.push_back({pad.pos.x + r, pad.pos.y + r});
    }
    for (const Hole& hole : footprint.holes) {
        double r = hole.dia / 2.0;
        points.push_back({hole.pos.x - r, hole.pos.y - r});
        points.push_back({hole.pos.x + r, hole.pos.y + r});
    }
    points.insert(points.end(), footprint.outline.begin(), footprint.outline.end());

    if (points.empty()) {
        return {-EMPTY_FOOTPRINT_HALF_SIZE, -EMPTY_FOOTPRINT_HALF_SIZE, EMPTY_FOOTPRINT_HALF_SIZE,
                EMPTY_FOOTPRINT_HALF_SIZE};
    }
    for (Vec2& p : points) {
        p = rotate_point(p, rotation);
    }
    return bounds_of(points);
}

double snap_placement(double value) {
    return snap_to_grid(value, GRID_PITCH);
}

std::optional<Vec2> find_compact_position(const std::vector<PlacedComponent>& placed,
                                          const BoundingBox& bounds,
                                          const BoundingBox& board_bounds) {
    const double start_x = board_bounds.min_x + BOARD_MARGIN - bounds.min_x;
    const double start_y = board_bounds.min_y + BOARD_MARGIN - bounds.min_y;
    const double step = GRID_PITCH * 2.0;

    PlacedComponent probe;
    probe.bounds = bounds;
    for (double y = start_y; y < board_bounds.max_y - BOARD_MARGIN; y += step) {
        for (double x = start_x; x < board_bounds.max_x - BOARD_MARGIN; x += step) {
            probe.pos = snapped(x, y);
            bool clear = std::none_of(placed.begin(), placed.end(), [&](const PlacedComponent& p) {
                return components_overlap(probe, p);
            });
            if (clear) {
                return probe.pos;
            }
        }
    }
    return std::nullopt;
}

std::vector<PlacedComponent> place_components(PlacementStrategy strategy,
                                              const std::vector<ComponentInstance>& instances,
                                              const Board& board) {
    const BoundingBox board_bounds = board.bounds();
    std::vector<PlacedComponent> placed;
    std::vector<Candidate> free;

    for (const ComponentInstance& instance : instances) {
        const Footprint* fp = find_footprint(instance.type);
        if (fp == nullptr) {
            spdlog::warn("[place] unknown footprint type '{}' for {}, skipped", instance.type,
                         instance.id);
            continue;
        }
        if (instance.constraint && instance.constraint->locked) {
            const PlacementConstraint& lock = *instance.constraint;
            PlacedComponent p = make_placed(instance, lock.locked_pos, lock.locked_rotation,
                                            component_bounds(*fp, lock.locked_rotation));
            p.locked = true;
            placed.push_back(std::move(p));
            continue;
        }
        free.push_back({&instance, fp});
    }

    switch (strategy) {
    case PlacementStrategy::GRID:
        place_grid(free, board_bounds, placed);
        break;
    case PlacementStrategy::COMPACT:
        place_compact(free, board_bounds, placed);
        break;
    case PlacementStrategy::SYMMETRIC:
        place_symmetric(free, board_bounds, placed);
        break;
    case PlacementStrategy::SIGNAL_FLOW:
        place_signal_flow(free, board_bounds, placed);
        break;
    case PlacementStrategy::RADIAL:
        place_radial(free, board_bounds, placed);
        break;
    }

    spdlog::debug("[place] {}: {} component(s) placed", strategy_name(strategy), placed.size());
    return placed;
}

} // namespace tapeboard
