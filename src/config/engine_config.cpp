/// @file engine_config.cpp
/// @brief EngineConfig JSON loading and logger setup

#include "config/engine_config.hpp"

#include "io/project_json.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace tapeboard {

using nlohmann::json;

namespace {

constexpr const char* LOG_PATTERN = "[%H:%M:%S] %^%l%$ %v";

/// Copies `section[key]` into `target` when present
template <typename T>
void read_field(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    try {
        target = it->template get<T>();
    } catch (const json::type_error&) {
        throw std::runtime_error(std::string("config key '") + key + "' has the wrong type (" +
                                 it->type_name() + ")");
    }
}

const json* find_section(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw std::runtime_error(std::string("config section '") + key + "' must be an object");
    }
    return &*it;
}

} // namespace

void apply_config(const json& j, EngineConfig& config) {
    if (!j.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }

    if (const json* placement = find_section(j, "placement")) {
        read_field(*placement, "iterations", config.placement.iterations);
        read_field(*placement, "initialTemperature", config.placement.initial_temperature);
        read_field(*placement, "coolingRate", config.placement.cooling_rate);
        read_field(*placement, "moveRange", config.placement.move_range);
        read_field(*placement, "seed", config.placement.seed);
    }

    if (const json* router = find_section(j, "router")) {
        read_field(*router, "routeWidth", config.router.route_width);
        read_field(*router, "routeDepth", config.router.route_depth);
        read_field(*router, "routeSpacing", config.router.route_spacing);
        read_field(*router, "gridPitch", config.router.grid_pitch);
        read_field(*router, "minBendRadius", config.router.min_bend_radius);
        read_field(*router, "maxAstarIterations", config.router.max_astar_iterations);
    }

    read_field(j, "logLevel", config.log_level);
}

EngineConfig load_engine_config(const std::string& path) {
    json document = read_json_file(path);
    EngineConfig config;
    try {
        apply_config(document, config);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    spdlog::debug("[config] loaded {}", path);
    return config;
}

void configure_logging(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level '" + level + "'");
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern(LOG_PATTERN);
}

} // namespace tapeboard
