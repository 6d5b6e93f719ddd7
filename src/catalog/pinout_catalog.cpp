/// @file pinout_catalog.cpp
/// @brief Pinout library: role-tagged pin lists and pad labelling

#include "catalog/catalog.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace tapeboard {

namespace {

constexpr double VCC_VOLTAGE = 5.0;
constexpr double GND_VOLTAGE = 0.0;

using R = PinRole;

Pin pin(int index, PinRole role, const char* name) {
    return Pin{index, role, name, std::nullopt};
}

Pin pin(int index, PinRole role, const char* name, double voltage) {
    return Pin{index, role, name, voltage};
}

/// Pins named "1".."count", all signal
std::vector<Pin> numbered_signals(int count) {
    std::vector<Pin> pins;
    for (int i = 0; i < count; i++) {
        pins.push_back(Pin{i, R::SIGNAL, std::to_string(i + 1), std::nullopt});
    }
    return pins;
}

/// Generic DIP: numbered signal pins with ground and supply at the given indices
std::vector<Pin> generic_dip(int count, int gnd_index, int vcc_index) {
    std::vector<Pin> pins = numbered_signals(count);
    pins[static_cast<size_t>(gnd_index)].role = R::GND;
    pins[static_cast<size_t>(gnd_index)].voltage = GND_VOLTAGE;
    pins[static_cast<size_t>(vcc_index)].role = R::VCC;
    pins[static_cast<size_t>(vcc_index)].voltage = VCC_VOLTAGE;
    return pins;
}

std::vector<Pin> pot_pins() {
    return {pin(0, R::VCC, "CW", VCC_VOLTAGE), pin(1, R::OUTPUT, "Wiper"),
            pin(2, R::GND, "CCW", GND_VOLTAGE)};
}

std::vector<Pin> tactile_pins() {
    return {pin(0, R::SIGNAL, "A1"), pin(1, R::SIGNAL, "A2"), pin(2, R::SIGNAL, "B1"),
            pin(3, R::SIGNAL, "B2")};
}

std::vector<Pin> two_terminal(const char* a, const char* b) {
    return {pin(0, R::SIGNAL, a), pin(1, R::SIGNAL, b)};
}

std::vector<Pin> arduino_nano_pins() {
    std::vector<Pin> pins = {
        pin(0, R::SIGNAL, "D1/TX"), pin(1, R::SIGNAL, "D0/RX"),
        pin(2, R::INPUT, "RESET"),  pin(3, R::GND, "GND", GND_VOLTAGE),
    };
    for (int d = 2; d <= 13; d++) {
        pins.push_back(Pin{d + 2, R::SIGNAL, "D" + std::to_string(d), std::nullopt});
    }
    pins.push_back(pin(16, R::VCC, "3V3", 3.3));
    pins.push_back(pin(17, R::SIGNAL, "AREF"));
    for (int a = 0; a <= 7; a++) {
        pins.push_back(Pin{a + 18, R::SIGNAL, "A" + std::to_string(a), std::nullopt});
    }
    pins.push_back(pin(26, R::VCC, "5V", VCC_VOLTAGE));
    pins.push_back(pin(27, R::INPUT, "RESET2"));
    pins.push_back(pin(28, R::GND, "GND2", GND_VOLTAGE));
    pins.push_back(pin(29, R::VCC, "VIN"));
    return pins;
}

std::vector<Pin> atmega328_pins() {
    const char* names[] = {"PC6", "PD0", "PD1", "PD2", "PD3", "PD4", "VCC", "GND", "PB6", "PB7",
                           "PD5", "PD6", "PD7", "PB0", "PB1", "PB2", "PB3", "PB4", "PB5", "AVCC",
                           "AREF", "GND", "PC0", "PC1", "PC2", "PC3", "PC4", "PC5"};
    std::vector<Pin> pins;
    for (int i = 0; i < 28; i++) {
        pins.push_back(Pin{i, R::SIGNAL, names[i], std::nullopt});
    }
    for (int vcc : {6, 19}) {
        pins[static_cast<size_t>(vcc)].role = R::VCC;
        pins[static_cast<size_t>(vcc)].voltage = VCC_VOLTAGE;
    }
    for (int gnd : {7, 21}) {
        pins[static_cast<size_t>(gnd)].role = R::GND;
        pins[static_cast<size_t>(gnd)].voltage = GND_VOLTAGE;
    }
    return pins;
}

std::map<std::string, Pinout> build_pinouts() {
    std::vector<Pinout> list = {
        {"resistor_th", two_terminal("A", "B")},
        {"capacitor_th", {pin(0, R::SIGNAL, "+", VCC_VOLTAGE), pin(1, R::GND, "-", GND_VOLTAGE)}},
        {"led_th", {pin(0, R::INPUT, "Cathode"), pin(1, R::OUTPUT, "Anode")}},
        {"diode_1n4148", two_terminal("A", "C")},
        {"transistor_npn", {pin(0, R::SIGNAL, "C"), pin(1, R::SIGNAL, "B"), pin(2, R::SIGNAL, "E")}},

        {"header_1x2", {pin(0, R::SIGNAL, "Pin1"), pin(1, R::SIGNAL, "Pin2")}},
        {"header_1x4", numbered_signals(4)},
        {"header_1x6", numbered_signals(6)},
        {"header_2x3", numbered_signals(6)},
        {"header_2x5", numbered_signals(10)},

        {"switch_spst", two_terminal("A", "B")},
        {"switch_spdt", {pin(0, R::SIGNAL, "NO"), pin(1, R::SIGNAL, "COM"), pin(2, R::SIGNAL, "NC")}},
        {"button_6mm", tactile_pins()},
        {"button_12mm", tactile_pins()},

        {"pot_9mm", pot_pins()},
        {"pot_16mm", pot_pins()},
        {"encoder_ec11",
         {pin(0, R::SIGNAL, "A"), pin(1, R::GND, "C", GND_VOLTAGE), pin(2, R::SIGNAL, "B"),
          pin(3, R::NC, "Mount1"), pin(4, R::NC, "Mount2")}},

        {"ic_dip8", generic_dip(8, 3, 7)},
        {"ic_dip14", generic_dip(14, 6, 13)},
        {"ic_dip16", generic_dip(16, 7, 15)},
        {"opamp_tl072",
         {pin(0, R::SIGNAL, "1OUT"), pin(1, R::SIGNAL, "1IN-"), pin(2, R::SIGNAL, "1IN+"),
          pin(3, R::GND, "V-", GND_VOLTAGE), pin(4, R::SIGNAL, "2IN+"), pin(5, R::SIGNAL, "2IN-"),
          pin(6, R::SIGNAL, "2OUT"), pin(7, R::VCC, "V+", VCC_VOLTAGE)}},
        {"shift_74hc595",
         {pin(0, R::OUTPUT, "QB"), pin(1, R::OUTPUT, "QC"), pin(2, R::OUTPUT, "QD"),
          pin(3, R::OUTPUT, "QE"), pin(4, R::OUTPUT, "QF"), pin(5, R::OUTPUT, "QG"),
          pin(6, R::OUTPUT, "QH"), pin(7, R::GND, "GND", GND_VOLTAGE), pin(8, R::OUTPUT, "QH'"),
          pin(9, R::INPUT, "SRCLR"), pin(10, R::CLOCK, "SRCLK"), pin(11, R::CLOCK, "RCLK"),
          pin(12, R::ENABLE, "OE"), pin(13, R::DATA, "SER"), pin(14, R::OUTPUT, "QA"),
          pin(15, R::VCC, "VCC", VCC_VOLTAGE)}},
        {"mux_cd4051",
         {pin(0, R::SIGNAL, "Y4"), pin(1, R::SIGNAL, "Y6"), pin(2, R::SIGNAL, "Z"),
          pin(3, R::SIGNAL, "Y7"), pin(4, R::SIGNAL, "Y5"), pin(5, R::ENABLE, "INH"),
          pin(6, R::GND, "VEE", GND_VOLTAGE), pin(7, R::GND, "VSS", GND_VOLTAGE),
          pin(8, R::SIGNAL, "C"), pin(9, R::SIGNAL, "B"), pin(10, R::SIGNAL, "A"),
          pin(11, R::SIGNAL, "Y3"), pin(12, R::SIGNAL, "Y0"), pin(13, R::SIGNAL, "Y1"),
          pin(14, R::SIGNAL, "Y2"), pin(15, R::VCC, "VDD", VCC_VOLTAGE)}},
        {"mcu_attiny85",
         {pin(0, R::INPUT, "RESET/PB5"), pin(1, R::SIGNAL, "PB3"), pin(2, R::SIGNAL, "PB4"),
          pin(3, R::GND, "GND", GND_VOLTAGE), pin(4, R::SIGNAL, "PB0"), pin(5, R::SIGNAL, "PB1"),
          pin(6, R::SIGNAL, "PB2"), pin(7, R::VCC, "VCC", VCC_VOLTAGE)}},
        {"mcu_atmega328", atmega328_pins()},
        {"mcu_arduino_nano", arduino_nano_pins()},

        {"connector_barrel",
         {pin(0, R::GND, "Sleeve", GND_VOLTAGE), pin(1, R::VCC, "Center", VCC_VOLTAGE),
          pin(2, R::NC, "Switch")}},
        {"connector_usb",
         {pin(0, R::VCC, "VBUS", VCC_VOLTAGE), pin(1, R::DATA, "D-"), pin(2, R::DATA, "D+"),
          pin(3, R::GND, "GND", GND_VOLTAGE)}},
        {"regulator_7805",
         {pin(0, R::VCC, "IN", VCC_VOLTAGE), pin(1, R::GND, "GND", GND_VOLTAGE),
          pin(2, R::VCC, "OUT", 5.0)}},
        {"regulator_ams1117",
         {pin(0, R::GND, "GND", GND_VOLTAGE), pin(1, R::VCC, "VOUT", VCC_VOLTAGE),
          pin(2, R::VCC, "VIN", VCC_VOLTAGE)}},
        {"terminal_2p", two_terminal("1", "2")},

        {"jack_trs_35mm",
         {pin(0, R::SIGNAL, "Tip"), pin(1, R::SIGNAL, "Ring"), pin(2, R::GND, "Sleeve", GND_VOLTAGE)}},
        {"buzzer_12mm", {pin(0, R::VCC, "+", VCC_VOLTAGE), pin(1, R::SIGNAL, "I/O")}},
        {"speaker_28mm", two_terminal("+", "-")},
        {"display_oled_128x32",
         {pin(0, R::GND, "GND", GND_VOLTAGE), pin(1, R::VCC, "VCC", 3.3), pin(2, R::CLOCK, "SCL"),
          pin(3, R::DATA, "SDA")}},
        {"photoresistor_ldr", two_terminal("P1", "P2")},
        {"thermistor_ntc", two_terminal("P1", "P2")},
    };

    std::map<std::string, Pinout> table;
    for (Pinout& p : list) {
        std::string key = p.type;
        table.emplace(std::move(key), std::move(p));
    }
    return table;
}

const std::map<std::string, Pinout>& pinout_table() {
    static const std::map<std::string, Pinout> table = build_pinouts();
    return table;
}

bool has_role(const std::string& type, int pad_index, PinRole role) {
    auto info = pin_info(type, pad_index);
    return info && info->role == role;
}

std::vector<int> pads_with_role(const std::string& type, PinRole role) {
    std::vector<int> pads;
    if (const Pinout* p = find_pinout(type)) {
        for (const Pin& pin : p->pins) {
            if (pin.role == role) {
                pads.push_back(pin.index);
            }
        }
    }
    return pads;
}

} // namespace

const Pinout* find_pinout(const std::string& type) {
    const auto& table = pinout_table();
    auto it = table.find(type);
    return it == table.end() ? nullptr : &it->second;
}

const Pinout& pinout(const std::string& type) {
    const Pinout* p = find_pinout(type);
    if (p == nullptr) {
        throw std::out_of_range("No pinout for component type: " + type);
    }
    return *p;
}

std::optional<Pin> pin_info(const std::string& type, int pad_index) {
    const Pinout* p = find_pinout(type);
    if (p == nullptr) {
        return std::nullopt;
    }
    for (const Pin& pin : p->pins) {
        if (pin.index == pad_index) {
            return pin;
        }
    }
    return std::nullopt;
}

bool is_power_pin(const std::string& type, int pad_index) {
    return has_role(type, pad_index, PinRole::VCC);
}

bool is_ground_pin(const std::string& type, int pad_index) {
    return has_role(type, pad_index, PinRole::GND);
}

std::vector<int> vcc_pads(const std::string& type) {
    return pads_with_role(type, PinRole::VCC);
}

std::vector<int> gnd_pads(const std::string& type) {
    return pads_with_role(type, PinRole::GND);
}

std::string pad_label(const std::string& type, int pad_index) {
    if (auto info = pin_info(type, pad_index)) {
        return info->name + " (" + std::string(pin_role_name(info->role)) + ")";
    }
    const Footprint* fp = find_footprint(type);
    if (fp != nullptr && pad_index >= 0 && pad_index < static_cast<int>(fp->pads.size())) {
        return "P" + std::to_string(pad_index + 1);
    }
    return "?" + std::to_string(pad_index + 1);
}

} // namespace tapeboard
