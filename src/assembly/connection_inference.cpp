/// @file connection_inference.cpp
/// @brief Instance expansion, role inference and automatic net detection

#include "assembly/connection_inference.hpp"

#include "catalog/catalog.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace tapeboard {

namespace {

constexpr double DEFAULT_RAIL_VOLTAGE = 5.0;
constexpr double LOW_RAIL_VOLTAGE = 3.3;

using PadKey = std::pair<std::string, int>;

struct RailPin {
    std::string component_id;
    int pad = 0;
    double voltage = DEFAULT_RAIL_VOLTAGE;
};

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* n) { return contains(haystack, n); });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Upper-cased text before the first underscore ("pot_9mm" -> "POT")
std::string type_prefix(const std::string& type) {
    std::string prefix = type.substr(0, type.find('_'));
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return prefix;
}

/// Analog controller inputs are named A0, A1, ...; AREF is not one of them
bool is_analog_pin(const Pin& pin) {
    return pin.role == PinRole::SIGNAL && pin.name.size() >= 2 && pin.name[0] == 'A' &&
           std::isdigit(static_cast<unsigned char>(pin.name[1])) != 0;
}

bool is_controller(const std::string& type) {
    return contains(type, "mcu") || contains(type, "arduino");
}

Connection make_connection(std::string id, const RailPin& from, const RailPin& to) {
    Connection c;
    c.id = std::move(id);
    c.from = {from.component_id, from.pad};
    c.to = {to.component_id, to.pad};
    c.auto_detected = true;
    return c;
}

} // namespace

std::vector<ComponentInstance> expand_components(const std::vector<AssemblyComponent>& assembly) {
    std::vector<ComponentInstance> instances;
    std::unordered_map<std::string, int> next_number;
    std::unordered_set<std::string> used;

    for (size_t source = 0; source < assembly.size(); source++) {
        const AssemblyComponent& request = assembly[source];
        if (request.quantity < 0) {
            throw std::invalid_argument("Negative quantity for component type: " + request.type);
        }
        const std::string base = request.id.empty() ? request.type : request.id;

        for (int i = 0; i < request.quantity; i++) {
            int& n = next_number[base];
            std::string id = base + "_" + std::to_string(n++);
            while (used.count(id) != 0) {
                id = base + "_" + std::to_string(n++);
            }
            used.insert(id);

            ComponentInstance instance;
            instance.id = std::move(id);
            instance.type = request.type;
            instance.instance_index = i;
            instance.source_index = static_cast<int>(source);
            instance.role = request.role;
            instance.constraint = request.constraint;
            instances.push_back(std::move(instance));
        }
    }
    return instances;
}

ComponentRole infer_component_role(const std::string& type) {
    const std::string lower = to_lower(type);
    if (contains_any(lower, {"button", "pot", "encoder", "switch", "sensor"})) {
        return ComponentRole::INPUT;
    }
    if (contains_any(lower, {"led", "display", "speaker", "buzzer"})) {
        return ComponentRole::OUTPUT;
    }
    if (contains_any(lower, {"barrel", "regulator"})) {
        return ComponentRole::POWER;
    }
    if (contains_any(lower, {"usb", "jack", "midi", "connector", "header"})) {
        return ComponentRole::CONNECTOR;
    }
    return ComponentRole::SIGNAL;
}

std::string generate_net_name(const std::string& from_type, int from_pad,
                              const std::string& to_type, int to_pad, bool is_power,
                              bool is_ground) {
    if (is_power) return "VCC";
    if (is_ground) return "GND";

    auto from_info = pin_info(from_type, from_pad);
    auto to_info = pin_info(to_type, to_pad);
    if (from_info && to_info && !from_info->name.empty() && !to_info->name.empty()) {
        return from_info->name + "_" + to_info->name;
    }
    return type_prefix(from_type) + std::to_string(from_pad + 1) + "_" + type_prefix(to_type) +
           std::to_string(to_pad + 1);
}

DetectionResult auto_detect_connections(const std::vector<ComponentInstance>& instances,
                                        const std::vector<Connection>& existing) {
    DetectionResult result;
    DetectionStats& stats = result.stats;

    std::set<PadKey> taken;
    for (const Connection& c : existing) {
        taken.emplace(c.from.component_id, c.from.pad_index);
        taken.emplace(c.to.component_id, c.to.pad_index);
    }

    std::vector<RailPin> vcc_pins;
    std::vector<RailPin> gnd_pins;
    for (const ComponentInstance& instance : instances) {
        const Pinout* p = find_pinout(instance.type);
        if (p == nullptr) {
            auto& unknown = stats.unknown_types;
            if (std::find(unknown.begin(), unknown.end(), instance.type) == unknown.end()) {
                unknown.push_back(instance.type);
            }
            continue;
        }
        for (const Pin& pin : p->pins) {
            if (pin.role == PinRole::VCC) {
                vcc_pins.push_back({instance.id, pin.index, pin.voltage.value_or(DEFAULT_RAIL_VOLTAGE)});
            } else if (pin.role == PinRole::GND) {
                gnd_pins.push_back({instance.id, pin.index, 0.0});
            }
        }
    }

    // Supply rails: every pin is bussed to the first pin of its kind
    for (size_t i = 1; i < vcc_pins.size(); i++) {
        const RailPin& from = vcc_pins[0];
        const RailPin& to = vcc_pins[i];
        PadKey from_key{from.component_id, from.pad};
        PadKey to_key{to.component_id, to.pad};
        if (taken.count(from_key) != 0 && taken.count(to_key) != 0) continue;
        if (from.voltage != to.voltage) continue;

        Connection c = make_connection("auto_vcc_" + std::to_string(i), from, to);
        c.net_name = from.voltage == LOW_RAIL_VOLTAGE ? "3V3" : "VCC";
        c.is_power = true;
        result.connections.push_back(std::move(c));
        stats.power++;
        taken.insert(from_key);
        taken.insert(to_key);
    }

    for (size_t i = 1; i < gnd_pins.size(); i++) {
        const RailPin& from = gnd_pins[0];
        const RailPin& to = gnd_pins[i];
        PadKey from_key{from.component_id, from.pad};
        PadKey to_key{to.component_id, to.pad};
        if (taken.count(from_key) != 0 && taken.count(to_key) != 0) continue;

        Connection c = make_connection("auto_gnd_" + std::to_string(i), from, to);
        c.net_name = "GND";
        c.is_ground = true;
        result.connections.push_back(std::move(c));
        stats.ground++;
        taken.insert(from_key);
        taken.insert(to_key);
    }

    // Pot and encoder outputs go to free analog inputs of the first controller
    auto controller = std::find_if(instances.begin(), instances.end(),
                                   [](const ComponentInstance& c) { return is_controller(c.type); });
    const Pinout* controller_pins =
        controller == instances.end() ? nullptr : find_pinout(controller->type);

    if (controller_pins != nullptr) {
        for (const ComponentInstance& instance : instances) {
            if (!contains(instance.type, "pot") && !contains(instance.type, "encoder")) continue;
            const Pinout* p = find_pinout(instance.type);
            if (p == nullptr) continue;

            for (const Pin& pin : p->pins) {
                if (pin.role != PinRole::OUTPUT) continue;
                PadKey from_key{instance.id, pin.index};
                if (taken.count(from_key) != 0) continue;

                auto analog = std::find_if(
                    controller_pins->pins.begin(), controller_pins->pins.end(), [&](const Pin& a) {
                        return is_analog_pin(a) && taken.count({controller->id, a.index}) == 0;
                    });
                if (analog == controller_pins->pins.end()) {
                    spdlog::debug("[assembly] no free analog input left for {}", instance.id);
                    break;
                }

                Connection c = make_connection("auto_sig_" + std::to_string(stats.signal + 1),
                                               {instance.id, pin.index, 0.0},
                                               {controller->id, analog->index, 0.0});
                c.net_name = generate_net_name(instance.type, pin.index, controller->type,
                                               analog->index, false, false);
                result.connections.push_back(std::move(c));
                stats.signal++;
                taken.insert(from_key);
                taken.emplace(controller->id, analog->index);
            }
        }
    }

    if (!stats.unknown_types.empty()) {
        spdlog::warn("[assembly] {} type(s) without pinout data, skipped for auto-detection",
                     stats.unknown_types.size());
    }
    spdlog::info("[assembly] detected {} power, {} ground, {} signal connection(s)", stats.power,
                 stats.ground, stats.signal);
    return result;
}

std::vector<SkippedConnection> validate_connections(const std::vector<Connection>& connections,
                                                    const std::vector<Component>& components) {
    ComponentIndex index(components);
    std::vector<SkippedConnection> skipped;
    for (const Connection& c : connections) {
        if (auto problem = check_connection(index, c)) {
            spdlog::warn("[assembly] connection {} skipped: {}", c.id, problem->reason);
            skipped.push_back(std::move(*problem));
        }
    }
    return skipped;
}

bool add_connection(std::vector<Connection>& connections, Connection connection) {
    auto same_pad = [](const PadRef& a, const PadRef& b) {
        return a.component_id == b.component_id && a.pad_index == b.pad_index;
    };
    bool duplicate = std::any_of(connections.begin(), connections.end(), [&](const Connection& c) {
        return (same_pad(c.from, connection.from) && same_pad(c.to, connection.to)) ||
               (same_pad(c.from, connection.to) && same_pad(c.to, connection.from));
    });
    if (duplicate) {
        return false;
    }

    if (connection.id.empty()) {
        size_t n = connections.size() + 1;
        auto id_taken = [&](const std::string& id) {
            return std::any_of(connections.begin(), connections.end(),
                               [&](const Connection& c) { return c.id == id; });
        };
        while (id_taken("conn_" + std::to_string(n))) {
            n++;
        }
        connection.id = "conn_" + std::to_string(n);
    }
    connections.push_back(std::move(connection));
    return true;
}

} // namespace tapeboard
