#pragma once

/// @file project_json.hpp
/// @brief JSON encoding of projects, assembly requests, connections, arrangements and
/// DRC reports

#include "drc/drc_engine.hpp"
#include "model/arrangement.hpp"
#include "model/board.hpp"
#include "model/component.hpp"
#include "model/connection.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tapeboard {

// Points are [x, y] arrays; object keys are camelCase.
void to_json(nlohmann::json& j, const Vec2& v);
void from_json(const nlohmann::json& j, Vec2& v);

void to_json(nlohmann::json& j, const Pad& pad);
void from_json(const nlohmann::json& j, Pad& pad);
void to_json(nlohmann::json& j, const Hole& hole);
void from_json(const nlohmann::json& j, Hole& hole);
void to_json(nlohmann::json& j, const Component& component);
void from_json(const nlohmann::json& j, Component& component);
void to_json(nlohmann::json& j, const Board& board);
void from_json(const nlohmann::json& j, Board& board);
void to_json(nlohmann::json& j, const Route& route);
void from_json(const nlohmann::json& j, Route& route);
void to_json(nlohmann::json& j, const Via& via);
void from_json(const nlohmann::json& j, Via& via);
void to_json(nlohmann::json& j, const DrcRules& rules);
void from_json(const nlohmann::json& j, DrcRules& rules);
void to_json(nlohmann::json& j, const Project& project);
void from_json(const nlohmann::json& j, Project& project);
void to_json(nlohmann::json& j, const AssemblyComponent& request);
void from_json(const nlohmann::json& j, AssemblyComponent& request);
void to_json(nlohmann::json& j, const Connection& connection);
void to_json(nlohmann::json& j, const Arrangement& arrangement);
void from_json(const nlohmann::json& j, Arrangement& arrangement);
void to_json(nlohmann::json& j, const Violation& violation);

/// Decodes a connection list. Endpoints name a component either by `component` id or by
/// `componentIndex` into `component_ids`; an index out of range leaves the id empty so the
/// connection is reported as skipped later.
[[nodiscard]] std::vector<Connection>
connections_from_json(const nlohmann::json& j, const std::vector<std::string>& component_ids);

/// Ranked placement output together with the seed and the connections that produced it.
/// Connections are stored with component ids so routing does not depend on list order.
struct ArrangementSet {
    std::uint32_t seed = 1;
    std::vector<Arrangement> arrangements;
    std::vector<Connection> connections;
};

void to_json(nlohmann::json& j, const ArrangementSet& set);
void from_json(const nlohmann::json& j, ArrangementSet& set);

/// Reads and parses a JSON file
/// @throws std::runtime_error naming the file when it cannot be opened or parsed
[[nodiscard]] nlohmann::json read_json_file(const std::string& path);

/// Writes `j` pretty-printed with two-space indentation
/// @throws std::runtime_error naming the file when it cannot be written
void write_json_file(const std::string& path, const nlohmann::json& j);

// File helpers. All of them throw std::runtime_error naming the file on I/O errors and on
// documents of the wrong shape.
[[nodiscard]] Project load_project(const std::string& path);
void save_project(const std::string& path, const Project& project);
[[nodiscard]] std::vector<AssemblyComponent> load_assembly(const std::string& path);
[[nodiscard]] std::vector<Connection> load_connections(const std::string& path,
                                                       const std::vector<std::string>& component_ids);
void save_connections(const std::string& path, const std::vector<Connection>& connections);
[[nodiscard]] ArrangementSet load_arrangements(const std::string& path);
void save_arrangements(const std::string& path, const ArrangementSet& set);
[[nodiscard]] DrcRules load_rules(const std::string& path);
void save_violations(const std::string& path, const std::vector<Violation>& violations);

} // namespace tapeboard
