/// @file test_catalog.cpp
/// @brief Tests for footprint and pinout lookups

#include <catch2/catch_test_macros.hpp>

#include "catalog/catalog.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tapeboard;

TEST_CASE("Footprint lookups are stable across calls", "[catalog]") {
    const Footprint* first = find_footprint("ic_dip8");
    const Footprint* second = find_footprint("ic_dip8");
    REQUIRE(first != nullptr);
    CHECK(first == second);
    CHECK(first->pads.size() == 8);
    CHECK(&footprint("ic_dip8") == first);
}

TEST_CASE("Unknown types are reported, not invented", "[catalog]") {
    CHECK(find_footprint("flux_capacitor") == nullptr);
    CHECK(find_pinout("flux_capacitor") == nullptr);
    CHECK_THROWS_AS(footprint("flux_capacitor"), std::out_of_range);
    CHECK_THROWS_AS(pinout("flux_capacitor"), std::out_of_range);
    CHECK_FALSE(pin_info("flux_capacitor", 0));
}

TEST_CASE("Footprint type list is sorted and complete", "[catalog]") {
    auto types = footprint_types();
    CHECK(std::is_sorted(types.begin(), types.end()));
    for (const char* expected : {"resistor_th", "pot_9mm", "mcu_arduino_nano", "magnet_6x2"}) {
        INFO(expected);
        CHECK(std::find(types.begin(), types.end(), expected) != types.end());
    }
}

TEST_CASE("Every pinout matches its footprint pad count", "[catalog]") {
    for (const std::string& type : footprint_types()) {
        const Pinout* p = find_pinout(type);
        if (p == nullptr) continue;
        INFO(type);
        for (const Pin& pin : p->pins) {
            CHECK(pin.index >= 0);
            CHECK(pin.index < static_cast<int>(footprint(type).pads.size()));
        }
    }
}

TEST_CASE("Supply pins of a potentiometer", "[catalog]") {
    CHECK(is_power_pin("pot_9mm", 0));
    CHECK(is_ground_pin("pot_9mm", 2));
    CHECK_FALSE(is_power_pin("pot_9mm", 1));
    CHECK(vcc_pads("pot_9mm") == std::vector<int>{0});
    CHECK(gnd_pads("pot_9mm") == std::vector<int>{2});
}

TEST_CASE("Pad labels", "[catalog]") {
    CHECK(pad_label("pot_9mm", 1) == "Wiper (output)");
    CHECK(pad_label("flux_capacitor", 0) == "?1");
}

TEST_CASE("Default heights are matched by keyword", "[catalog]") {
    CHECK(default_height("pot_16mm") == 10.0);
    CHECK(default_height("magnet_6x2") == 0.0);
    CHECK(default_height("led_th") == 8.5);
    CHECK(default_height("led_matrix_8x8") == 8.0);
}
