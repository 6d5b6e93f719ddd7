#pragma once

/// @file engine_config.hpp
/// @brief Tunable engine parameters loaded from an optional JSON file

#include "placement/placement_optimizer.hpp"
#include "routing/auto_router.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace tapeboard {

struct EngineConfig {
    PlacementConfig placement;
    RouterConfig router;
    std::string log_level = "info";
};

/// Overlays the keys present in `j` onto `config`. Unknown keys are ignored.
/// @throws std::runtime_error when a known key holds a value of the wrong type
void apply_config(const nlohmann::json& j, EngineConfig& config);

/// Loads a config file on top of the defaults
/// @throws std::runtime_error naming the file on I/O, parse or type errors
[[nodiscard]] EngineConfig load_engine_config(const std::string& path);

/// Sets the global spdlog level and the CLI log pattern
/// @throws std::invalid_argument for a name spdlog does not know
void configure_logging(const std::string& level);

} // namespace tapeboard
