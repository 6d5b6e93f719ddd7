/// @file placement_engine.cpp
/// @brief Strategy fan-out, optimization and ranking

#include "placement/placement_engine.hpp"

#include "assembly/connection_inference.hpp"
#include "catalog/catalog.hpp"
#include "placement/placement_scorer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <utility>

namespace tapeboard {

std::vector<Component> to_components(const std::vector<PlacedComponent>& placed) {
    std::vector<Component> components;
    components.reserve(placed.size());
    for (const PlacedComponent& p : placed) {
        Component c;
        c.id = p.id;
        c.type = p.type;
        c.pos = p.pos;
        c.rotation = p.rotation;
        if (const Footprint* fp = find_footprint(p.type)) {
            c.pads = fp->pads;
            for (size_t j = 0; j < c.pads.size(); j++) {
                c.pads[j].id = p.id + "_pad" + std::to_string(j);
            }
            c.holes = fp->holes;
        }
        components.push_back(std::move(c));
    }
    return components;
}

std::vector<Arrangement> generate_placements(const std::vector<AssemblyComponent>& assembly,
                                             const Board& board,
                                             const std::vector<Connection>& connections,
                                             const PlacementConfig& config,
                                             const std::atomic<bool>* cancel) {
    return generate_placements(expand_components(assembly), board, connections, config, cancel);
}

std::vector<Arrangement> generate_placements(const std::vector<ComponentInstance>& instances,
                                             const Board& board,
                                             const std::vector<Connection>& connections,
                                             const PlacementConfig& config,
                                             const std::atomic<bool>* cancel) {
    std::vector<Arrangement> arrangements;
    if (instances.empty()) {
        return arrangements;
    }

    std::uint32_t stream = 0;
    for (PlacementStrategy strategy : ALL_STRATEGIES) {
        std::seed_seq seeds{config.seed, stream++};
        std::mt19937 rng(seeds);

        auto initial = place_components(strategy, instances, board);
        OptimizationResult optimized =
            optimize_placement(std::move(initial), connections, board, config, rng, cancel);
        PlacementScore scored = score_arrangement(optimized.placement, connections, board);

        Arrangement arrangement;
        arrangement.id = "arr_" + std::string(strategy_name(strategy));
        arrangement.name = std::string(strategy_label(strategy));
        arrangement.description = std::string(strategy_description(strategy));
        arrangement.components = to_components(optimized.placement);
        arrangement.score = scored.score;
        arrangement.metrics = scored.metrics;
        arrangements.push_back(std::move(arrangement));

        spdlog::info("[place] {:<12} score {:3d}  length {:.0f} mm  crossings {}",
                     strategy_label(strategy), scored.score, scored.metrics.total_route_length,
                     scored.metrics.route_crossings);
    }

    std::stable_sort(arrangements.begin(), arrangements.end(),
                     [](const Arrangement& a, const Arrangement& b) { return a.score > b.score; });
    return arrangements;
}

} // namespace tapeboard
