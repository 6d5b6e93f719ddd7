#pragma once

/// @file placement_optimizer.hpp
/// @brief Overlap legalization and seeded simulated annealing over component positions

#include "model/board.hpp"
#include "model/connection.hpp"
#include "placement/placement_strategies.hpp"

#include <atomic>
#include <cstdint>
#include <random>
#include <vector>

namespace tapeboard {

struct PlacementConfig {
    int iterations = 500;
    double initial_temperature = 100.0;
    double cooling_rate = 0.95;
    double move_range = 10.0; ///< Maximum displacement per axis per move, mm
    std::uint32_t seed = 1;
};

struct OptimizationResult {
    std::vector<PlacedComponent> placement;
    int score = 0;
    int accepted_moves = 0;
    int iterations_run = 0;
    int unlegalized = 0; ///< Components still overlapping after legalization
};

/// Moves every unlocked component that overlaps an earlier one to the first clear
/// bottom-left position. Locked components are settled first and never moved, so each
/// overlapping locked pair counts as unresolved.
/// @return number of components (or locked pairs) that could not be cleared
int legalize_placement(std::vector<PlacedComponent>& placement, const Board& board);

/// Legalizes, then anneals the placement using `rng` as the only randomness source.
///
/// Each iteration moves one unlocked component, snapped to the grid and clamped inside the
/// board margins; moves that create an overlap are rejected. The best placement seen is
/// returned. When `cancel` is set the loop stops at the next iteration.
/// @throws std::invalid_argument for a negative iteration count, a non-positive temperature
///         or a cooling rate outside (0, 1]
[[nodiscard]] OptimizationResult optimize_placement(std::vector<PlacedComponent> initial,
                                                    const std::vector<Connection>& connections,
                                                    const Board& board,
                                                    const PlacementConfig& config,
                                                    std::mt19937& rng,
                                                    const std::atomic<bool>* cancel = nullptr);

} // namespace tapeboard
