#pragma once

/// @file arrangement.hpp
/// @brief A candidate layout: placed components, their routes and quality metrics

#include "model/board.hpp"
#include "model/component.hpp"
#include "model/connection.hpp"

#include <string>
#include <vector>

namespace tapeboard {

struct ArrangementMetrics {
    double total_route_length = 0.0; ///< Straight pad-to-pad estimate, whole millimetres
    int route_crossings = 0;
    double board_utilization = 0.0; ///< [0, 1], two decimals
    double symmetry_score = 0.0;    ///< [0, 1], two decimals
};

struct Arrangement {
    std::string id; ///< "arr_<strategy>"
    std::string name;
    std::string description;
    std::vector<Component> components;
    std::vector<Route> routes;
    int score = 0; ///< [0, 100]
    ArrangementMetrics metrics;

    // Filled in by the router
    std::vector<SkippedConnection> skipped;
    int unresolved_conflicts = 0;
};

} // namespace tapeboard
