/// @file test_connection_inference.cpp
/// @brief Tests for instance expansion, rail detection and connection bookkeeping

#include <catch2/catch_test_macros.hpp>

#include "assembly/connection_inference.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace tapeboard;

namespace {

AssemblyComponent request(const std::string& type, int quantity, const std::string& id = {}) {
    AssemblyComponent c;
    c.type = type;
    c.quantity = quantity;
    c.id = id;
    return c;
}

Component placed(const std::string& id, int pads) {
    Component c;
    c.id = id;
    c.type = "test_part";
    for (int i = 0; i < pads; i++) {
        c.pads.push_back({id + "_pad" + std::to_string(i), {2.5 * i, 0.0}});
    }
    return c;
}

const Connection* find_by_id(const std::vector<Connection>& connections, const std::string& id) {
    auto it = std::find_if(connections.begin(), connections.end(),
                           [&](const Connection& c) { return c.id == id; });
    return it == connections.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("Expansion numbers instances per id base", "[assembly]") {
    auto instances = expand_components(
        {request("pot_9mm", 2), request("led_th", 1), request("pot_9mm", 1)});
    REQUIRE(instances.size() == 4);
    CHECK(instances[0].id == "pot_9mm_0");
    CHECK(instances[1].id == "pot_9mm_1");
    CHECK(instances[2].id == "led_th_0");
    CHECK(instances[3].id == "pot_9mm_2");
    CHECK(instances[3].source_index == 2);
    CHECK(instances[3].instance_index == 0);
}

TEST_CASE("Explicit ids are used as prefix", "[assembly]") {
    auto instances = expand_components({request("pot_9mm", 2, "volume")});
    REQUIRE(instances.size() == 2);
    CHECK(instances[0].id == "volume_0");
    CHECK(instances[1].id == "volume_1");
}

TEST_CASE("Zero quantity expands to nothing, negative throws", "[assembly]") {
    CHECK(expand_components({request("pot_9mm", 0)}).empty());
    CHECK_THROWS_AS(expand_components({request("pot_9mm", -1)}), std::invalid_argument);
}

TEST_CASE("Roles are inferred from type keywords", "[assembly]") {
    CHECK(infer_component_role("pot_9mm") == ComponentRole::INPUT);
    CHECK(infer_component_role("led_th") == ComponentRole::OUTPUT);
    CHECK(infer_component_role("regulator_7805") == ComponentRole::POWER);
    CHECK(infer_component_role("jack_trs_35mm") == ComponentRole::CONNECTOR);
    CHECK(infer_component_role("ic_dip8") == ComponentRole::SIGNAL);
}

TEST_CASE("Net names", "[assembly]") {
    CHECK(generate_net_name("pot_9mm", 0, "pot_9mm", 0, true, false) == "VCC");
    CHECK(generate_net_name("pot_9mm", 2, "ic_dip8", 3, false, true) == "GND");
    CHECK(generate_net_name("pot_9mm", 1, "mcu_arduino_nano", 18, false, false) == "Wiper_A0");
    CHECK(generate_net_name("flux_cap", 0, "warp_core", 2, false, false) == "FLUX1_WARP3");
}

TEST_CASE("Pot and controller are wired to rails and an analog input", "[assembly]") {
    auto instances = expand_components({request("pot_9mm", 1), request("mcu_arduino_nano", 1)});
    DetectionResult result = auto_detect_connections(instances);

    // 5 V pins of pot, 5V and VIN join; the 3V3 pin sits on another rail
    CHECK(result.stats.power == 2);
    CHECK(result.stats.ground == 2);
    CHECK(result.stats.signal == 1);
    CHECK(result.stats.unknown_types.empty());

    const Connection* signal = find_by_id(result.connections, "auto_sig_1");
    REQUIRE(signal != nullptr);
    CHECK(signal->from.component_id == "pot_9mm_0");
    CHECK(signal->from.pad_index == 1);
    CHECK(signal->to.component_id == "mcu_arduino_nano_0");
    CHECK(signal->to.pad_index == 18);
    CHECK(signal->net_name == "Wiper_A0");
    CHECK(signal->auto_detected);

    for (const Connection& c : result.connections) {
        INFO(c.id);
        CHECK_FALSE((c.is_power && c.is_ground));
        if (c.is_power) CHECK(c.net_name == "VCC");
        if (c.is_ground) CHECK(c.net_name == "GND");
    }
}

TEST_CASE("Each pot takes the next free analog input", "[assembly]") {
    auto instances = expand_components({request("mcu_arduino_nano", 1), request("pot_9mm", 3)});
    DetectionResult result = auto_detect_connections(instances);
    REQUIRE(result.stats.signal == 3);

    std::set<int> analog_pads;
    for (const Connection& c : result.connections) {
        if (!c.is_power && !c.is_ground) analog_pads.insert(c.to.pad_index);
    }
    CHECK(analog_pads == std::set<int>{18, 19, 20});
}

TEST_CASE("Existing connections block their pads", "[assembly]") {
    auto instances = expand_components({request("pot_9mm", 1), request("mcu_arduino_nano", 1)});
    Connection manual;
    manual.id = "manual";
    manual.from = {"pot_9mm_0", 1};
    manual.to = {"mcu_arduino_nano_0", 4};

    DetectionResult result = auto_detect_connections(instances, {manual});
    CHECK(result.stats.signal == 0);
    CHECK(find_by_id(result.connections, "manual") == nullptr);
}

TEST_CASE("Types without pinout are listed once", "[assembly]") {
    auto instances = expand_components({request("flux_cap", 2), request("pot_9mm", 1)});
    DetectionResult result = auto_detect_connections(instances);
    CHECK(result.stats.unknown_types == std::vector<std::string>{"flux_cap"});
    CHECK(result.stats.signal == 0);
}

TEST_CASE("Malformed connections become skipped diagnostics", "[assembly]") {
    std::vector<Component> components = {placed("a", 2), placed("b", 3)};
    Connection good{"good", {"a", 0}, {"b", 2}};
    Connection missing{"missing", {"a", 0}, {"ghost", 0}};
    Connection out_of_range{"range", {"a", 5}, {"b", 0}};

    auto skipped = validate_connections({good, missing, out_of_range}, components);
    REQUIRE(skipped.size() == 2);
    CHECK(skipped[0].connection_id == "missing");
    CHECK(skipped[0].reason.find("ghost") != std::string::npos);
    CHECK(skipped[1].connection_id == "range");
}

TEST_CASE("Manual connections are deduplicated in either direction", "[assembly]") {
    std::vector<Connection> connections;
    CHECK(add_connection(connections, {"", {"a", 0}, {"b", 1}}));
    CHECK(connections.back().id == "conn_1");
    CHECK_FALSE(add_connection(connections, {"", {"b", 1}, {"a", 0}}));
    CHECK(add_connection(connections, {"", {"a", 1}, {"b", 1}}));
    CHECK(connections.back().id == "conn_2");
    CHECK(connections.size() == 2);
}
