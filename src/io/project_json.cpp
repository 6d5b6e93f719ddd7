/// @file project_json.cpp
/// @brief nlohmann_json converters and file helpers

#include "io/project_json.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tapeboard {

using nlohmann::json;

namespace {

/// Looks up the enumerator whose name matches `text` among `values`
template <typename Enum, size_t N, typename NameFn>
Enum parse_enum(const std::string& text, const Enum (&values)[N], NameFn name,
                const char* what) {
    for (Enum value : values) {
        if (name(value) == text) {
            return value;
        }
    }
    throw std::invalid_argument(std::string("unknown ") + what + " '" + text + "'");
}

ComponentRole parse_role(const std::string& text) {
    constexpr ComponentRole ROLES[] = {ComponentRole::INPUT, ComponentRole::OUTPUT,
                                       ComponentRole::POWER, ComponentRole::SIGNAL,
                                       ComponentRole::CONNECTOR};
    return parse_enum(text, ROLES, component_role_name, "component role");
}

BoardShape parse_shape(const std::string& text) {
    constexpr BoardShape SHAPES[] = {BoardShape::RECTANGULAR, BoardShape::CIRCULAR,
                                     BoardShape::FREEFORM};
    return parse_enum(text, SHAPES, board_shape_name, "board shape");
}

Layer parse_layer(const std::string& text) {
    constexpr Layer LAYERS[] = {Layer::TOP, Layer::BOTTOM};
    return parse_enum(text, LAYERS, layer_name, "layer");
}

ChannelProfile parse_profile(const std::string& text) {
    constexpr ChannelProfile PROFILES[] = {ChannelProfile::U, ChannelProfile::V,
                                           ChannelProfile::FLAT};
    return parse_enum(text, PROFILES, channel_profile_name, "channel profile");
}

void put_if_positive(json& j, const char* key, double value) {
    if (value > 0.0) {
        j[key] = value;
    }
}

PadRef pad_ref_from_json(const json& j, const std::vector<std::string>& component_ids) {
    PadRef ref;
    ref.pad_index = j.at("padIndex").get<int>();
    if (j.contains("component")) {
        ref.component_id = j.at("component").get<std::string>();
    } else {
        int index = j.at("componentIndex").get<int>();
        if (index >= 0 && index < static_cast<int>(component_ids.size())) {
            ref.component_id = component_ids[static_cast<size_t>(index)];
        } else {
            spdlog::warn("[json] componentIndex {} out of range ({} components)", index,
                         component_ids.size());
        }
    }
    return ref;
}

json pad_ref_to_json(const PadRef& ref) {
    return json{{"component", ref.component_id}, {"padIndex", ref.pad_index}};
}

/// Runs `decode` on the document in `path`, reporting shape errors against the file
template <typename Decode>
auto decode_file(const std::string& path, Decode decode) {
    json document = read_json_file(path);
    try {
        return decode(document);
    } catch (const json::exception& e) {
        throw std::runtime_error(path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace

void to_json(json& j, const Vec2& v) {
    j = json::array({v.x, v.y});
}

void from_json(const json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument("point must be an [x, y] array, got " + j.dump());
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

void to_json(json& j, const Pad& pad) {
    j = json{{"id", pad.id}, {"pos", pad.pos}};
    put_if_positive(j, "dia", pad.dia);
    put_if_positive(j, "width", pad.width);
    put_if_positive(j, "height", pad.height);
}

void from_json(const json& j, Pad& pad) {
    pad.id = j.value("id", std::string());
    pad.pos = j.at("pos").get<Vec2>();
    pad.dia = j.value("dia", 0.0);
    pad.width = j.value("width", 0.0);
    pad.height = j.value("height", 0.0);
}

void to_json(json& j, const Hole& hole) {
    j = json{{"pos", hole.pos}, {"dia", hole.dia}};
}

void from_json(const json& j, Hole& hole) {
    hole.pos = j.at("pos").get<Vec2>();
    hole.dia = j.at("dia").get<double>();
}

void to_json(json& j, const Component& component) {
    j = json{{"id", component.id},         {"type", component.type},
             {"pos", component.pos},       {"rotation", component.rotation},
             {"pads", component.pads},     {"holes", component.holes}};
}

void from_json(const json& j, Component& component) {
    component.id = j.at("id").get<std::string>();
    component.type = j.at("type").get<std::string>();
    component.pos = j.at("pos").get<Vec2>();
    component.rotation = j.value("rotation", 0.0);
    component.pads = j.value("pads", std::vector<Pad>{});
    component.holes = j.value("holes", std::vector<Hole>{});
}

void to_json(json& j, const Board& board) {
    json features = json::array();
    for (const MountFeature& f : board.features) {
        features.push_back({{"pos", f.pos}, {"dia", f.dia}});
    }
    j = json{{"shape", std::string(board_shape_name(board.shape))},
             {"thickness", board.thickness},
             {"boundary", board.boundary},
             {"features", features}};
}

void from_json(const json& j, Board& board) {
    board.shape = parse_shape(j.value("shape", std::string("rectangular")));
    board.thickness = j.value("thickness", 2.0);
    board.boundary = j.value("boundary", Polygon{});
    board.features.clear();
    if (j.contains("features")) {
        for (const json& f : j.at("features")) {
            board.features.push_back({f.at("pos").get<Vec2>(), f.at("dia").get<double>()});
        }
    }
}

void to_json(json& j, const Route& route) {
    j = json{{"net", route.net},
             {"layer", std::string(layer_name(route.layer))},
             {"polyline", route.polyline},
             {"width", route.width},
             {"profile", std::string(channel_profile_name(route.profile))},
             {"depth", route.depth}};
    if (!route.connection_id.empty()) {
        j["connectionId"] = route.connection_id;
    }
}

void from_json(const json& j, Route& route) {
    route.net = j.value("net", std::string());
    route.connection_id = j.value("connectionId", std::string());
    route.layer = parse_layer(j.value("layer", std::string("top")));
    route.polyline = j.at("polyline").get<Polyline>();
    route.width = j.value("width", 5.0);
    route.profile = parse_profile(j.value("profile", std::string("U")));
    route.depth = j.value("depth", 0.8);
}

void to_json(json& j, const Via& via) {
    j = json{{"pos", via.pos}, {"dia", via.dia}, {"chamfer", via.chamfer}};
}

void from_json(const json& j, Via& via) {
    via.pos = j.at("pos").get<Vec2>();
    via.dia = j.value("dia", 3.0);
    via.chamfer = j.value("chamfer", 0.0);
}

void to_json(json& j, const DrcRules& rules) {
    j = json{{"minSpacing", rules.min_spacing},         {"minWall", rules.min_wall},
             {"nozzleWidth", rules.nozzle_width},       {"layerHeight", rules.layer_height},
             {"minBendRadius", rules.min_bend_radius},  {"minPadClearance", rules.min_pad_clearance}};
}

void from_json(const json& j, DrcRules& rules) {
    const DrcRules defaults;
    rules.min_spacing = j.value("minSpacing", defaults.min_spacing);
    rules.min_wall = j.value("minWall", defaults.min_wall);
    rules.nozzle_width = j.value("nozzleWidth", defaults.nozzle_width);
    rules.layer_height = j.value("layerHeight", defaults.layer_height);
    rules.min_bend_radius = j.value("minBendRadius", defaults.min_bend_radius);
    rules.min_pad_clearance = j.value("minPadClearance", defaults.min_pad_clearance);
}

void to_json(json& j, const Project& project) {
    j = json{{"name", project.name},   {"board", project.board}, {"components", project.components},
             {"routes", project.routes}, {"vias", project.vias}, {"rules", project.rules}};
}

void from_json(const json& j, Project& project) {
    const Project defaults;
    project.name = j.value("name", defaults.name);
    project.board = j.contains("board") ? j.at("board").get<Board>() : defaults.board;
    project.components = j.value("components", std::vector<Component>{});
    project.routes = j.value("routes", std::vector<Route>{});
    project.vias = j.value("vias", std::vector<Via>{});
    project.rules = j.contains("rules") ? j.at("rules").get<DrcRules>() : defaults.rules;
}

void to_json(json& j, const AssemblyComponent& request) {
    j = json{{"type", request.type}, {"quantity", request.quantity}};
    if (!request.id.empty()) {
        j["id"] = request.id;
    }
    if (request.role) {
        j["role"] = std::string(component_role_name(*request.role));
    }
    if (request.constraint) {
        j["constraint"] = {{"locked", request.constraint->locked},
                           {"lockedPos", request.constraint->locked_pos},
                           {"lockedRotation", request.constraint->locked_rotation}};
    }
}

void from_json(const json& j, AssemblyComponent& request) {
    request.id = j.value("id", std::string());
    request.type = j.at("type").get<std::string>();
    request.quantity = j.value("quantity", 1);
    request.role.reset();
    if (j.contains("role")) {
        request.role = parse_role(j.at("role").get<std::string>());
    }
    request.constraint.reset();
    if (j.contains("constraint")) {
        const json& c = j.at("constraint");
        PlacementConstraint constraint;
        constraint.locked = c.value("locked", false);
        constraint.locked_pos = c.value("lockedPos", Vec2{});
        constraint.locked_rotation = c.value("lockedRotation", 0.0);
        request.constraint = constraint;
    }
}

void to_json(json& j, const Connection& connection) {
    j = json{{"id", connection.id},
             {"from", pad_ref_to_json(connection.from)},
             {"to", pad_ref_to_json(connection.to)},
             {"isPower", connection.is_power},
             {"isGround", connection.is_ground},
             {"autoDetected", connection.auto_detected}};
    if (!connection.net_name.empty()) {
        j["netName"] = connection.net_name;
    }
}

std::vector<Connection> connections_from_json(const json& j,
                                              const std::vector<std::string>& component_ids) {
    if (!j.is_array()) {
        throw std::invalid_argument("connection list must be an array");
    }
    std::vector<Connection> connections;
    connections.reserve(j.size());
    for (const json& item : j) {
        Connection c;
        c.id = item.at("id").get<std::string>();
        c.from = pad_ref_from_json(item.at("from"), component_ids);
        c.to = pad_ref_from_json(item.at("to"), component_ids);
        c.net_name = item.value("netName", std::string());
        c.is_power = item.value("isPower", false);
        c.is_ground = item.value("isGround", false);
        c.auto_detected = item.value("autoDetected", false);
        connections.push_back(std::move(c));
    }
    return connections;
}

void to_json(json& j, const Arrangement& arrangement) {
    json skipped = json::array();
    for (const SkippedConnection& s : arrangement.skipped) {
        skipped.push_back({{"connectionId", s.connection_id}, {"reason", s.reason}});
    }
    j = json{{"id", arrangement.id},
             {"name", arrangement.name},
             {"description", arrangement.description},
             {"components", arrangement.components},
             {"routes", arrangement.routes},
             {"score", arrangement.score},
             {"metrics",
              {{"totalRouteLength", arrangement.metrics.total_route_length},
               {"routeCrossings", arrangement.metrics.route_crossings},
               {"boardUtilization", arrangement.metrics.board_utilization},
               {"symmetryScore", arrangement.metrics.symmetry_score}}},
             {"skipped", skipped},
             {"unresolvedConflicts", arrangement.unresolved_conflicts}};
}

void from_json(const json& j, Arrangement& arrangement) {
    arrangement.id = j.at("id").get<std::string>();
    arrangement.name = j.value("name", std::string());
    arrangement.description = j.value("description", std::string());
    arrangement.components = j.at("components").get<std::vector<Component>>();
    arrangement.routes = j.value("routes", std::vector<Route>{});
    arrangement.score = j.value("score", 0);
    if (j.contains("metrics")) {
        const json& m = j.at("metrics");
        arrangement.metrics.total_route_length = m.value("totalRouteLength", 0.0);
        arrangement.metrics.route_crossings = m.value("routeCrossings", 0);
        arrangement.metrics.board_utilization = m.value("boardUtilization", 0.0);
        arrangement.metrics.symmetry_score = m.value("symmetryScore", 0.0);
    }
    arrangement.skipped.clear();
    if (j.contains("skipped")) {
        for (const json& s : j.at("skipped")) {
            arrangement.skipped.push_back(
                {s.at("connectionId").get<std::string>(), s.value("reason", std::string())});
        }
    }
    arrangement.unresolved_conflicts = j.value("unresolvedConflicts", 0);
}

void to_json(json& j, const Violation& violation) {
    j = json{{"type", std::string(violation_type_name(violation.type))},
             {"message", violation.message},
             {"position", violation.position},
             {"severity", std::string(severity_name(violation.severity))}};
}

void to_json(json& j, const ArrangementSet& set) {
    j = json{{"seed", set.seed},
             {"arrangements", set.arrangements},
             {"connections", set.connections}};
}

void from_json(const json& j, ArrangementSet& set) {
    set.seed = j.value("seed", std::uint32_t{1});
    set.arrangements = j.at("arrangements").get<std::vector<Arrangement>>();
    set.connections = j.contains("connections")
                          ? connections_from_json(j.at("connections"), {})
                          : std::vector<Connection>{};
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

void write_json_file(const std::string& path, const json& j) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << j.dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
    spdlog::debug("[json] wrote {}", path);
}

Project load_project(const std::string& path) {
    return decode_file(path, [](const json& j) { return j.get<Project>(); });
}

void save_project(const std::string& path, const Project& project) {
    write_json_file(path, project);
}

std::vector<AssemblyComponent> load_assembly(const std::string& path) {
    return decode_file(path, [](const json& j) {
        if (!j.is_array()) {
            throw std::invalid_argument("assembly must be an array of component requests");
        }
        return j.get<std::vector<AssemblyComponent>>();
    });
}

std::vector<Connection> load_connections(const std::string& path,
                                         const std::vector<std::string>& component_ids) {
    return decode_file(path,
                       [&](const json& j) { return connections_from_json(j, component_ids); });
}

void save_connections(const std::string& path, const std::vector<Connection>& connections) {
    write_json_file(path, connections);
}

ArrangementSet load_arrangements(const std::string& path) {
    return decode_file(path, [](const json& j) { return j.get<ArrangementSet>(); });
}

void save_arrangements(const std::string& path, const ArrangementSet& set) {
    write_json_file(path, set);
}

DrcRules load_rules(const std::string& path) {
    return decode_file(path, [](const json& j) {
        // Either a bare rules object or a whole project carrying one
        return j.contains("rules") ? j.at("rules").get<DrcRules>() : j.get<DrcRules>();
    });
}

void save_violations(const std::string& path, const std::vector<Violation>& violations) {
    write_json_file(path, violations);
}

} // namespace tapeboard
