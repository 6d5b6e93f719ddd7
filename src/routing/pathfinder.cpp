/// @file pathfinder.cpp
/// @brief Grid A* implementation

#include "routing/pathfinder.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>

namespace tapeboard {

namespace {

constexpr double CORNER_CLEARANCE = 1.0;

struct Step {
    int dx;
    int dy;
};

constexpr Step STEPS[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

} // namespace

Pathfinder::Pathfinder(const BoundingBox& bounds, double pitch, double route_width,
                       int max_iterations)
    : pitch_(pitch), margin_(route_width / 2.0 + CORNER_CLEARANCE),
      max_iterations_(max_iterations) {
    if (pitch <= 0.0) {
        throw std::invalid_argument("Pathfinder grid pitch must be positive");
    }
    if (route_width <= 0.0) {
        throw std::invalid_argument("Pathfinder route width must be positive");
    }
    if (max_iterations <= 0) {
        throw std::invalid_argument("Pathfinder iteration cap must be positive");
    }
    min_x_ = static_cast<int>(std::ceil(bounds.min_x / pitch));
    max_x_ = static_cast<int>(std::floor(bounds.max_x / pitch));
    min_y_ = static_cast<int>(std::ceil(bounds.min_y / pitch));
    max_y_ = static_cast<int>(std::floor(bounds.max_y / pitch));
}

bool Pathfinder::is_blocked(Vec2 p, const std::vector<Polygon>& obstacles) const {
    const Vec2 probes[] = {p,
                           {p.x - margin_, p.y - margin_},
                           {p.x + margin_, p.y - margin_},
                           {p.x - margin_, p.y + margin_},
                           {p.x + margin_, p.y + margin_}};
    for (const Polygon& obstacle : obstacles) {
        for (const Vec2& probe : probes) {
            if (point_in_polygon(probe, obstacle)) {
                return true;
            }
        }
    }
    return false;
}

int Pathfinder::cell_index(int x, int y) const {
    return (y - min_y_) * (max_x_ - min_x_ + 1) + (x - min_x_);
}

Vec2 Pathfinder::to_world(int x, int y) const {
    return {x * pitch_, y * pitch_};
}

int Pathfinder::clamp_x(double world_x) const {
    return std::clamp(static_cast<int>(std::lround(world_x / pitch_)), min_x_, max_x_);
}

int Pathfinder::clamp_y(double world_y) const {
    return std::clamp(static_cast<int>(std::lround(world_y / pitch_)), min_y_, max_y_);
}

Vec2 Pathfinder::snap(Vec2 p) const {
    if (max_x_ < min_x_ || max_y_ < min_y_) {
        return {snap_to_grid(p.x, pitch_), snap_to_grid(p.y, pitch_)};
    }
    return to_world(clamp_x(p.x), clamp_y(p.y));
}

std::optional<Polyline> Pathfinder::find_path(Vec2 start, Vec2 goal,
                                              const std::vector<Polygon>& obstacles) {
    last_iterations_ = 0;
    if (max_x_ < min_x_ || max_y_ < min_y_) {
        return std::nullopt; // Bounds hold no grid node
    }

    const int start_x = clamp_x(start.x);
    const int start_y = clamp_y(start.y);
    const int goal_x = clamp_x(goal.x);
    const int goal_y = clamp_y(goal.y);

    auto heuristic = [&](int x, int y) {
        return (std::abs(x - goal_x) + std::abs(y - goal_y)) * pitch_;
    };

    const size_t cells = static_cast<size_t>(max_x_ - min_x_ + 1) *
                         static_cast<size_t>(max_y_ - min_y_ + 1);
    std::vector<char> closed(cells, 0);
    std::vector<double> best_g(cells, std::numeric_limits<double>::infinity());
    std::vector<Node> expanded; // Arena for path reconstruction

    std::priority_queue<Node, std::vector<Node>, std::greater<Node>> open;
    open.push({heuristic(start_x, start_y), 0.0, start_x, start_y, -1});
    best_g[static_cast<size_t>(cell_index(start_x, start_y))] = 0.0;

    while (!open.empty() && last_iterations_ < max_iterations_) {
        last_iterations_++;
        Node current = open.top();
        open.pop();

        const size_t current_cell = static_cast<size_t>(cell_index(current.x, current.y));
        if (closed[current_cell] != 0) {
            continue;
        }
        closed[current_cell] = 1;
        const int current_index = static_cast<int>(expanded.size());
        expanded.push_back(current);

        if (current.x == goal_x && current.y == goal_y) {
            Polyline path;
            for (int i = current_index; i >= 0; i = expanded[static_cast<size_t>(i)].parent) {
                const Node& n = expanded[static_cast<size_t>(i)];
                path.push_back(to_world(n.x, n.y));
            }
            std::reverse(path.begin(), path.end());
            return collapse_collinear(path);
        }

        for (const Step& step : STEPS) {
            const int nx = current.x + step.dx;
            const int ny = current.y + step.dy;
            if (nx < min_x_ || nx > max_x_ || ny < min_y_ || ny > max_y_) {
                continue;
            }
            const size_t next_cell = static_cast<size_t>(cell_index(nx, ny));
            if (closed[next_cell] != 0) {
                continue;
            }
            const bool is_goal = nx == goal_x && ny == goal_y;
            if (!is_goal && is_blocked(to_world(nx, ny), obstacles)) {
                continue;
            }

            const double g = current.g + pitch_;
            if (g < best_g[next_cell]) {
                best_g[next_cell] = g;
                open.push({g + heuristic(nx, ny), g, nx, ny, current_index});
            }
        }
    }
    return std::nullopt;
}

} // namespace tapeboard
