#pragma once

/// @file pathfinder.hpp
/// @brief Grid A* search for tape channels around polygonal obstacles

#include "geometry/geometry.hpp"

#include <optional>
#include <vector>

namespace tapeboard {

/// A* over a uniform grid covering a bounding box.
///
/// Grid nodes are the multiples of `pitch` inside the bounds. Moves are 4-connected with
/// uniform cost and a Manhattan heuristic. A node is blocked when its centre or any corner
/// of a square of half-size `route_width / 2 + 1` lies inside an obstacle; the goal node is
/// always enterable.
class Pathfinder {
  public:
    /// @throws std::invalid_argument if pitch or route width is not positive, or the
    ///         iteration cap is not positive
    Pathfinder(const BoundingBox& bounds, double pitch, double route_width,
               int max_iterations = 10000);

    /// Searches from `start` to `goal`, both snapped to the grid and clamped into the
    /// bounds. Returns the snapped path with collinear points collapsed, or empty when the
    /// goal is unreachable or the iteration cap is hit.
    [[nodiscard]] std::optional<Polyline> find_path(Vec2 start, Vec2 goal,
                                                    const std::vector<Polygon>& obstacles);

    /// Nodes expanded by the last search
    [[nodiscard]] int last_iterations() const { return last_iterations_; }

    /// Grid node nearest to `p`, clamped into the bounds
    [[nodiscard]] Vec2 snap(Vec2 p) const;

  private:
    struct Node {
        double f = 0.0;
        double g = 0.0;
        int x = 0;
        int y = 0;
        int parent = -1; ///< Index into the expanded-node arena

        bool operator>(const Node& other) const { return f > other.f; }
    };

    [[nodiscard]] bool is_blocked(Vec2 p, const std::vector<Polygon>& obstacles) const;
    [[nodiscard]] int cell_index(int x, int y) const;
    [[nodiscard]] Vec2 to_world(int x, int y) const;
    [[nodiscard]] int clamp_x(double world_x) const;
    [[nodiscard]] int clamp_y(double world_y) const;

    double pitch_;
    double margin_;
    int max_iterations_;
    int min_x_ = 0;
    int max_x_ = -1;
    int min_y_ = 0;
    int max_y_ = -1;
    int last_iterations_ = 0;
};

} // namespace tapeboard
