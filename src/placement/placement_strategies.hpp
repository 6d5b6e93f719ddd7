#pragma once

/// @file placement_strategies.hpp
/// @brief Deterministic initial placements: grid, compact, symmetric, signal-flow and radial

#include "geometry/geometry.hpp"
#include "model/board.hpp"
#include "model/component.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tapeboard {

constexpr double GRID_PITCH = 2.54;        // 0.1" pitch
constexpr double COMPONENT_SPACING = 5.0;  // Minimum gap between component boxes
constexpr double BOARD_MARGIN = 10.0;      // Keep-out along the board edge

enum class PlacementStrategy { GRID, COMPACT, SYMMETRIC, SIGNAL_FLOW, RADIAL };

constexpr PlacementStrategy ALL_STRATEGIES[] = {
    PlacementStrategy::GRID, PlacementStrategy::COMPACT, PlacementStrategy::SYMMETRIC,
    PlacementStrategy::SIGNAL_FLOW, PlacementStrategy::RADIAL};

/// Short identifier used in arrangement ids ("arr_<name>")
[[nodiscard]] constexpr std::string_view strategy_name(PlacementStrategy strategy) {
    switch (strategy) {
    case PlacementStrategy::GRID:
        return "grid";
    case PlacementStrategy::COMPACT:
        return "compact";
    case PlacementStrategy::SYMMETRIC:
        return "symmetric";
    case PlacementStrategy::SIGNAL_FLOW:
        return "flow";
    case PlacementStrategy::RADIAL:
        return "radial";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view strategy_label(PlacementStrategy strategy) {
    switch (strategy) {
    case PlacementStrategy::GRID:
        return "Grid";
    case PlacementStrategy::COMPACT:
        return "Compact";
    case PlacementStrategy::SYMMETRIC:
        return "Symmetric";
    case PlacementStrategy::SIGNAL_FLOW:
        return "Signal Flow";
    case PlacementStrategy::RADIAL:
        return "Radial";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view strategy_description(PlacementStrategy strategy) {
    switch (strategy) {
    case PlacementStrategy::GRID:
        return "Components arranged in rows and columns";
    case PlacementStrategy::COMPACT:
        return "Minimizes board space usage";
    case PlacementStrategy::SYMMETRIC:
        return "Balanced layout around center axis";
    case PlacementStrategy::SIGNAL_FLOW:
        return "Input -> Processing -> Output layout";
    case PlacementStrategy::RADIAL:
        return "Circular arrangement around center";
    }
    return "";
}

/// A component position under construction. `bounds` is in the component frame (rotation
/// applied, translation not).
struct PlacedComponent {
    std::string id;
    std::string type;
    Vec2 pos;
    double rotation = 0.0;
    BoundingBox bounds;
    bool locked = false;
    std::optional<ComponentRole> role;
};

/// Bounds in board space
[[nodiscard]] inline BoundingBox world_bounds(const PlacedComponent& placed) {
    return placed.bounds.translated(placed.pos);
}

/// True when two components are closer than `spacing`
[[nodiscard]] inline bool components_overlap(const PlacedComponent& a, const PlacedComponent& b,
                                             double spacing = COMPONENT_SPACING) {
    return boxes_overlap(world_bounds(a), world_bounds(b), spacing);
}

/// Box around pad squares, hole squares and outline points of a footprint rotated by
/// `rotation` degrees about its origin. A footprint without geometry gets a 4 x 4 mm box.
[[nodiscard]] BoundingBox component_bounds(const Footprint& footprint, double rotation = 0.0);

/// Rounds to the placement grid
[[nodiscard]] double snap_placement(double value);

/// Bottom-left scan for the first position clear of `placed`, stepping two grid pitches.
/// Returns empty when no clear position exists inside the margins.
[[nodiscard]] std::optional<Vec2> find_compact_position(const std::vector<PlacedComponent>& placed,
                                                        const BoundingBox& bounds,
                                                        const BoundingBox& board_bounds);

/// Places every instance with a known footprint using one strategy. Locked instances keep
/// their locked position and rotation; unknown types are skipped with a warning.
[[nodiscard]] std::vector<PlacedComponent>
place_components(PlacementStrategy strategy, const std::vector<ComponentInstance>& instances,
                 const Board& board);

} // namespace tapeboard
