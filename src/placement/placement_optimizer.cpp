/// @file placement_optimizer.cpp
/// @brief Legalization and simulated annealing

#include "placement/placement_optimizer.hpp"

#include "placement/placement_scorer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace tapeboard {

namespace {

void validate(const PlacementConfig& config) {
    if (config.iterations < 0) {
        throw std::invalid_argument("Annealing iterations must not be negative");
    }
    if (config.initial_temperature <= 0.0) {
        throw std::invalid_argument("Annealing temperature must be positive");
    }
    if (config.cooling_rate <= 0.0 || config.cooling_rate > 1.0) {
        throw std::invalid_argument("Cooling rate must be in (0, 1]");
    }
}

bool overlaps_any(const std::vector<PlacedComponent>& placement, size_t index) {
    for (size_t j = 0; j < placement.size(); j++) {
        if (j != index && components_overlap(placement[index], placement[j])) {
            return true;
        }
    }
    return false;
}

/// Keeps the component box inside the board margins. A component wider than the usable area
/// is pinned to the low edge.
double clamp_axis(double value, double low, double high) {
    return std::max(low, std::min(high, value));
}

} // namespace

int legalize_placement(std::vector<PlacedComponent>& placement, const Board& board) {
    const BoundingBox board_bounds = board.bounds();
    std::vector<PlacedComponent> settled;
    settled.reserve(placement.size());
    int unresolved = 0;
    for (const PlacedComponent& p : placement) {
        if (!p.locked) continue;
        // Locked parts never move, so every overlapping locked pair stays unresolved
        for (const PlacedComponent& s : settled) {
            if (components_overlap(p, s)) {
                spdlog::warn("[anneal] locked components {} and {} overlap", s.id, p.id);
                unresolved++;
            }
        }
        settled.push_back(p);
    }

    for (PlacedComponent& p : placement) {
        if (p.locked) continue;

        bool clear = std::none_of(settled.begin(), settled.end(), [&](const PlacedComponent& s) {
            return components_overlap(p, s);
        });
        if (!clear) {
            if (auto pos = find_compact_position(settled, p.bounds, board_bounds)) {
                spdlog::debug("[anneal] moved {} to ({:.2f}, {:.2f}) to clear an overlap", p.id,
                              pos->x, pos->y);
                p.pos = *pos;
            } else {
                unresolved++;
            }
        }
        settled.push_back(p);
    }
    return unresolved;
}

OptimizationResult optimize_placement(std::vector<PlacedComponent> initial,
                                      const std::vector<Connection>& connections,
                                      const Board& board, const PlacementConfig& config,
                                      std::mt19937& rng, const std::atomic<bool>* cancel) {
    validate(config);

    OptimizationResult result;
    result.unlegalized = legalize_placement(initial, board);
    if (result.unlegalized > 0) {
        spdlog::warn("[anneal] {} overlap(s) left after legalization; board too small or "
                     "locked parts collide",
                     result.unlegalized);
    }

    std::vector<PlacedComponent>& current = initial;
    int current_score = score_arrangement(current, connections, board).score;
    std::vector<PlacedComponent> best = current;
    int best_score = current_score;

    std::vector<size_t> movable;
    for (size_t i = 0; i < current.size(); i++) {
        if (!current[i].locked) movable.push_back(i);
    }

    if (!movable.empty()) {
        const BoundingBox board_bounds = board.bounds();
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        std::uniform_int_distribution<size_t> pick(0, movable.size() - 1);
        double temperature = config.initial_temperature;

        for (int i = 0; i < config.iterations; i++) {
            if (cancel != nullptr && cancel->load()) {
                spdlog::info("[anneal] cancelled after {} iteration(s)", i);
                break;
            }
            result.iterations_run++;

            const size_t target_index = movable[pick(rng)];
            PlacedComponent& target = current[target_index];
            const Vec2 previous = target.pos;

            double move_x = (unit(rng) - 0.5) * 2.0 * config.move_range;
            double move_y = (unit(rng) - 0.5) * 2.0 * config.move_range;
            const BoundingBox& b = target.bounds;
            target.pos.x = clamp_axis(snap_placement(previous.x + move_x),
                                      board_bounds.min_x + BOARD_MARGIN - b.min_x,
                                      board_bounds.max_x - BOARD_MARGIN - b.max_x);
            target.pos.y = clamp_axis(snap_placement(previous.y + move_y),
                                      board_bounds.min_y + BOARD_MARGIN - b.min_y,
                                      board_bounds.max_y - BOARD_MARGIN - b.max_y);

            bool accepted = false;
            if (!overlaps_any(current, target_index)) {
                int candidate_score = score_arrangement(current, connections, board).score;
                int delta = candidate_score - current_score;
                if (delta > 0 || unit(rng) < std::exp(delta / temperature)) {
                    accepted = true;
                    current_score = candidate_score;
                    result.accepted_moves++;
                    if (current_score > best_score) {
                        best = current;
                        best_score = current_score;
                    }
                }
            }
            if (!accepted) {
                target.pos = previous;
            }

            temperature *= config.cooling_rate;
        }
    }

    spdlog::debug("[anneal] {} of {} move(s) accepted, best score {}", result.accepted_moves,
                  result.iterations_run, best_score);
    result.placement = std::move(best);
    result.score = best_score;
    return result;
}

} // namespace tapeboard
