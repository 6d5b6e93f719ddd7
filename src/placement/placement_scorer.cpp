/// @file placement_scorer.cpp
/// @brief Placement metrics and weighted score

#include "placement/placement_scorer.hpp"

#include "catalog/catalog.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace tapeboard {

namespace {

constexpr double ROUTE_WEIGHT = 0.4;
constexpr double CROSSING_WEIGHT = 0.3;
constexpr double UTILIZATION_WEIGHT = 0.15;
constexpr double SYMMETRY_WEIGHT = 0.15;

constexpr double LENGTH_PENALTY_PER_MM = 0.1;
constexpr double CROSSING_PENALTY = 20.0;
constexpr double UTILIZATION_SCALE = 50.0;
constexpr double SYMMETRY_SCALE = 30.0;

struct Segment {
    Vec2 start;
    Vec2 end;
};

double round_to_hundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

/// World position of a pad on a placed component, or empty when the pad does not exist
std::optional<Vec2> pad_world_position(const PlacedComponent& placed, int pad_index) {
    const Footprint* fp = find_footprint(placed.type);
    if (fp == nullptr || pad_index < 0 || pad_index >= static_cast<int>(fp->pads.size())) {
        return std::nullopt;
    }
    return transform_point(fp->pads[static_cast<size_t>(pad_index)].pos, placed.pos,
                           placed.rotation);
}

} // namespace

ArrangementMetrics compute_metrics(const std::vector<PlacedComponent>& placement,
                                   const std::vector<Connection>& connections,
                                   const Board& board) {
    std::unordered_map<std::string, const PlacedComponent*> by_id;
    by_id.reserve(placement.size());
    for (const PlacedComponent& p : placement) {
        by_id.emplace(p.id, &p);
    }

    double total_length = 0.0;
    std::vector<Segment> segments;
    for (const Connection& c : connections) {
        auto from = by_id.find(c.from.component_id);
        auto to = by_id.find(c.to.component_id);
        if (from == by_id.end() || to == by_id.end()) continue;

        auto start = pad_world_position(*from->second, c.from.pad_index);
        auto end = pad_world_position(*to->second, c.to.pad_index);
        if (!start || !end) continue;

        total_length += distance(*start, *end);
        segments.push_back({*start, *end});
    }

    int crossings = 0;
    for (size_t i = 0; i < segments.size(); i++) {
        for (size_t j = i + 1; j < segments.size(); j++) {
            if (segments_intersect(segments[i].start, segments[i].end, segments[j].start,
                                   segments[j].end)) {
                crossings++;
            }
        }
    }

    const BoundingBox board_bounds = board.bounds();
    const double board_area = board_bounds.area();
    double component_area = 0.0;
    for (const PlacedComponent& p : placement) {
        component_area += p.bounds.area();
    }
    double utilization = board_area > 0.0 ? std::min(1.0, component_area / board_area) : 0.0;

    double symmetry = 0.0;
    const double quarter_width = board_bounds.width() / 4.0;
    if (quarter_width > 0.0) {
        const double center_x = board_bounds.center().x;
        double deviation = 0.0;
        for (const PlacedComponent& p : placement) {
            deviation += std::abs(p.pos.x - center_x);
        }
        double average = placement.empty() ? 0.0 : deviation / static_cast<double>(placement.size());
        symmetry = std::max(0.0, 1.0 - average / quarter_width);
    }

    ArrangementMetrics metrics;
    metrics.total_route_length = std::round(total_length);
    metrics.route_crossings = crossings;
    metrics.board_utilization = round_to_hundredths(utilization);
    metrics.symmetry_score = round_to_hundredths(symmetry);
    return metrics;
}

PlacementScore score_arrangement(const std::vector<PlacedComponent>& placement,
                                 const std::vector<Connection>& connections, const Board& board) {
    PlacementScore result;
    result.metrics = compute_metrics(placement, connections, board);
    const ArrangementMetrics& m = result.metrics;

    double route_score = std::max(0.0, 100.0 - m.total_route_length * LENGTH_PENALTY_PER_MM);
    double crossing_score = std::max(0.0, 100.0 - m.route_crossings * CROSSING_PENALTY);
    double utilization_score = m.board_utilization * UTILIZATION_SCALE;
    double symmetry_score = m.symmetry_score * SYMMETRY_SCALE;

    double weighted = route_score * ROUTE_WEIGHT + crossing_score * CROSSING_WEIGHT +
                      utilization_score * UTILIZATION_WEIGHT + symmetry_score * SYMMETRY_WEIGHT;
    result.score = std::clamp(static_cast<int>(std::round(weighted)), 0, 100);
    return result;
}

} // namespace tapeboard
