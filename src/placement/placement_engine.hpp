#pragma once

/// @file placement_engine.hpp
/// @brief Runs every placement strategy through the optimizer and ranks the results

#include "model/arrangement.hpp"
#include "model/board.hpp"
#include "model/component.hpp"
#include "model/connection.hpp"
#include "placement/placement_optimizer.hpp"
#include "placement/placement_strategies.hpp"

#include <atomic>
#include <vector>

namespace tapeboard {

/// Materializes placed components with their catalog pads and holes
[[nodiscard]] std::vector<Component> to_components(const std::vector<PlacedComponent>& placed);

/// Generates one optimized arrangement per strategy, best score first (ties keep strategy
/// order). Each strategy draws from its own random stream derived from `config.seed`, so a
/// given seed always reproduces the same arrangements. Returns nothing for an empty request.
[[nodiscard]] std::vector<Arrangement>
generate_placements(const std::vector<AssemblyComponent>& assembly, const Board& board,
                    const std::vector<Connection>& connections, const PlacementConfig& config,
                    const std::atomic<bool>* cancel = nullptr);

/// Same as above for an already expanded instance list
[[nodiscard]] std::vector<Arrangement>
generate_placements(const std::vector<ComponentInstance>& instances, const Board& board,
                    const std::vector<Connection>& connections, const PlacementConfig& config,
                    const std::atomic<bool>* cancel = nullptr);

} // namespace tapeboard
