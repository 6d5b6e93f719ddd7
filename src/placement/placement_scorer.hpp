#pragma once

/// @file placement_scorer.hpp
/// @brief Composite 0-100 quality score for a placement

#include "model/arrangement.hpp"
#include "model/board.hpp"
#include "model/connection.hpp"
#include "placement/placement_strategies.hpp"

#include <vector>

namespace tapeboard {

struct PlacementScore {
    int score = 0;
    ArrangementMetrics metrics;
};

/// Estimates wiring and layout quality of a placement.
///
/// Route length and crossings use straight lines between world pad positions; connections
/// whose endpoints do not resolve are ignored. A placement without components or a board
/// without area scores without producing NaN.
[[nodiscard]] ArrangementMetrics compute_metrics(const std::vector<PlacedComponent>& placement,
                                                 const std::vector<Connection>& connections,
                                                 const Board& board);

/// Weighted score: 40% route length, 30% crossings, 15% utilization, 15% symmetry,
/// rounded and clamped to [0, 100]
[[nodiscard]] PlacementScore score_arrangement(const std::vector<PlacedComponent>& placement,
                                               const std::vector<Connection>& connections,
                                               const Board& board);

} // namespace tapeboard
