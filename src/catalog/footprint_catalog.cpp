/// @file footprint_catalog.cpp
/// @brief Footprint library: pad, hole and outline geometry for each component type

#include "catalog/catalog.hpp"

#include <algorithm>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <utility>

namespace tapeboard {

namespace {

constexpr double PITCH = 2.54;     // 0.1" pin pitch
constexpr double DIP_ROW = 7.62;   // DIP row spacing
constexpr double HEADER_PAD = 1.7; // Square header pad size

/// Body heights matched by keyword, first match wins
const std::vector<std::pair<const char*, double>> HEIGHT_KEYWORDS = {
    {"resistor", 2.5},   {"capacitor", 8.0},  {"led_matrix", 8.0}, {"led", 8.5},
    {"diode", 3.0},      {"transistor", 5.0}, {"mosfet", 5.0},     {"header", 8.5},
    {"ic_dip", 3.5},     {"opamp", 3.5},      {"mux", 3.5},        {"shift", 3.5},
    {"mcu", 12.0},       {"switch", 6.0},     {"button", 4.5},     {"pot", 10.0},
    {"encoder", 12.0},   {"joystick", 25.0},  {"display", 12.0},   {"jack", 12.0},
    {"midi", 15.0},      {"connector", 10.0}, {"buzzer", 10.0},    {"speaker", 15.0},
    {"regulator", 10.0}, {"relay", 15.0},     {"crystal", 5.0},    {"sensor", 8.0},
    {"magnet", 0.0},
};
constexpr double FALLBACK_HEIGHT = 5.0;

Pad round_pad(double x, double y, double dia) {
    Pad pad;
    pad.pos = {x, y};
    pad.dia = dia;
    return pad;
}

Pad square_pad(double x, double y, double size) {
    Pad pad = round_pad(x, y, size);
    pad.width = size;
    pad.height = size;
    return pad;
}

Polygon rect(double x0, double y0, double x1, double y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

/// Round pads at the given x offsets along y = 0
std::vector<Pad> inline_pads(std::initializer_list<double> xs, double dia) {
    std::vector<Pad> pads;
    for (double x : xs) {
        pads.push_back(round_pad(x, 0.0, dia));
    }
    return pads;
}

/// Round pads at explicit positions
std::vector<Pad> placed_pads(std::initializer_list<Vec2> positions, double dia) {
    std::vector<Pad> pads;
    for (Vec2 p : positions) {
        pads.push_back(round_pad(p.x, p.y, dia));
    }
    return pads;
}

/// Single column of square header pads
std::vector<Pad> header_column(int count) {
    std::vector<Pad> pads;
    for (int i = 0; i < count; i++) {
        pads.push_back(square_pad(0.0, i * PITCH, HEADER_PAD));
    }
    return pads;
}

/// Two columns of square header pads, numbered left-right then down
std::vector<Pad> header_grid(int count) {
    std::vector<Pad> pads;
    for (int i = 0; i < count; i++) {
        pads.push_back(square_pad((i % 2) * PITCH, (i / 2) * PITCH, HEADER_PAD));
    }
    return pads;
}

/// Dual-in-line pads: first half down the left row, second half down the right row
std::vector<Pad> dual_row(int count, double row_spacing, bool square) {
    std::vector<Pad> pads;
    const int half = count / 2;
    for (int i = 0; i < count; i++) {
        double x = i < half ? 0.0 : row_spacing;
        double y = (i % half) * PITCH;
        pads.push_back(square ? square_pad(x, y, HEADER_PAD) : round_pad(x, y, HEADER_PAD));
    }
    return pads;
}

/// Builds a footprint with one drilled hole of `hole_dia` under every pad
Footprint make(const char* type, const char* name, std::vector<Pad> pads, double hole_dia,
               Polygon outline = {}) {
    Footprint fp;
    fp.type = type;
    fp.name = name;
    for (const Pad& pad : pads) {
        fp.holes.push_back({pad.pos, hole_dia});
    }
    fp.pads = std::move(pads);
    fp.outline = std::move(outline);
    fp.height = default_height(fp.type);
    return fp;
}

std::map<std::string, Footprint> build_footprints() {
    std::vector<Footprint> list;

    // Passives and discretes
    list.push_back(make("resistor_th", "Resistor (Through-Hole)", inline_pads({-5.0, 5.0}, 1.2),
                        0.8, rect(-4, -1, 4, 1)));
    list.push_back(make("capacitor_th", "Capacitor (Through-Hole)",
                        inline_pads({-2.5, 2.5}, 1.5), 0.9, rect(-3, -3, 3, 3)));
    list.back().height = 11.0;
    list.push_back(
        make("led_th", "LED 5mm (Through-Hole)", inline_pads({-1.27, 1.27}, 1.5), 0.9));
    list.push_back(make("diode_1n4148", "Diode 1N4148 Signal", inline_pads({0.0, 7.62}, 1.5),
                        0.8, rect(1.5, -1, 6, 1)));
    list.push_back(make("transistor_npn", "NPN Transistor (2N2222/BC547)",
                        inline_pads({0.0, 2.54, 5.08}, 1.5), 0.8, rect(-1, -2, 6.08, 3)));

    // Headers
    list.push_back(make("header_1x2", "Header 1x2 (2.54mm pitch)", header_column(2), 1.0));
    list.push_back(make("header_1x4", "Header 1x4 (2.54mm pitch)", header_column(4), 1.0));
    list.push_back(make("header_1x6", "Header 1x6 (2.54mm pitch)", header_column(6), 1.0));
    list.push_back(make("header_2x3", "Header 2x3 (2.54mm pitch)", header_grid(6), 1.0));
    list.push_back(make("header_2x5", "Header 2x5 (2.54mm pitch)", header_grid(10), 1.0));

    // Switches and buttons
    list.push_back(make("switch_spst", "Switch SPST (Through-Hole)",
                        inline_pads({-2.5, 2.5}, 2.0), 1.2, rect(-3, -3, 3, 3)));
    list.push_back(make("switch_spdt", "Switch SPDT (Through-Hole)",
                        inline_pads({-2.54, 0.0, 2.54}, 2.0), 1.2, rect(-4, -3, 4, 3)));
    list.push_back(make("button_6mm", "Tactile Button 6x6mm",
                        placed_pads({{0, 0}, {6.5, 0}, {0, 4.5}, {6.5, 4.5}}, 1.5), 1.0,
                        rect(-1, -1, 7.5, 5.5)));
    list.push_back(make("button_12mm", "Tactile Button 12x12mm",
                        placed_pads({{0, 0}, {6.5, 0}, {0, 8.5}, {6.5, 8.5}}, 1.5), 1.0,
                        rect(-3, -2, 9.5, 10.5)));

    // Potentiometers and encoders
    list.push_back(make("pot_9mm", "Potentiometer 9mm (Alpha)", inline_pads({0.0, 2.5, 5.0}, 1.5),
                        1.0, rect(-2, -2, 7, 7)));
    list.push_back(make("pot_16mm", "Potentiometer 16mm", inline_pads({0.0, 5.0, 10.0}, 1.7), 1.2,
                        rect(-3, -3, 13, 13)));
    list.push_back(make("encoder_ec11", "Rotary Encoder EC11",
                        placed_pads({{0, 0}, {2.5, 0}, {5, 0}, {0, 7}, {5, 7}}, 1.5), 1.0,
                        rect(-3, -2, 8, 9)));

    // DIP ICs and microcontrollers
    list.push_back(make("ic_dip8", "IC DIP-8 (2.54mm pitch, 7.62mm row)",
                        dual_row(8, DIP_ROW, true), 0.9, rect(-1, -1, 8.62, 8.62)));
    list.push_back(make("ic_dip14", "IC DIP-14 (2.54mm pitch, 7.62mm row)",
                        dual_row(14, DIP_ROW, true), 0.9, rect(-1, -1, 8.62, 16.78)));
    list.push_back(make("ic_dip16", "IC DIP-16 (2.54mm pitch, 7.62mm row)",
                        dual_row(16, DIP_ROW, true), 0.9, rect(-1, -1, 8.62, 19.32)));
    list.push_back(make("opamp_tl072", "TL072 Dual Op-Amp DIP-8", dual_row(8, DIP_ROW, false),
                        0.9, rect(-1, -1, 8.62, 8.62)));
    list.push_back(make("shift_74hc595", "74HC595 Shift Register DIP-16",
                        dual_row(16, DIP_ROW, false), 0.9, rect(-1, -1, 8.62, 19.32)));
    list.push_back(make("mux_cd4051", "CD4051 8-ch Analog Mux DIP-16",
                        dual_row(16, DIP_ROW, false), 0.9, rect(-1, -1, 8.62, 19.32)));
    list.push_back(make("mcu_attiny85", "ATtiny85 DIP-8", dual_row(8, DIP_ROW, true), 0.9,
                        rect(-1, -1, 8.62, 8.62)));
    list.push_back(make("mcu_atmega328", "ATmega328P DIP-28", dual_row(28, DIP_ROW, true), 0.9,
                        rect(-1, -1, 8.62, 34.54)));
    list.push_back(make("mcu_arduino_nano", "Arduino Nano (30-pin)", dual_row(30, 15.24, true),
                        1.0, rect(-2, -3, 17.24, 38.1)));

    // Power
    list.push_back(make("connector_barrel", "Barrel Jack Connector",
                        placed_pads({{0, 0}, {6, 0}, {3, 4.8}}, 3.0), 2.0, rect(-3, -3, 9, 7)));
    list.push_back(make("connector_usb", "USB Type-A Connector",
                        inline_pads({0.0, 2.5, 5.0, 7.5}, 1.5), 1.0, rect(-2, -2, 9.5, 6)));
    list.push_back(make("regulator_7805", "7805 Voltage Regulator (TO-220)",
                        inline_pads({0.0, 2.54, 5.08}, 1.7), 1.0, rect(-2, -2, 7.08, 8)));
    list.push_back(make("regulator_ams1117", "AMS1117 3.3V LDO (SOT-223 breakout)",
                        inline_pads({0.0, 2.54, 5.08}, 1.7), 1.0, rect(-2, -2, 7.08, 5)));
    list.push_back(make("terminal_2p", "Screw Terminal 2-pin (5mm)", inline_pads({0.0, 5.0}, 2.0),
                        1.3, rect(-2.5, -4, 7.5, 6)));

    // Audio, display and sensors
    list.push_back(make("jack_trs_35mm", "3.5mm TRS Jack (Stereo)",
                        inline_pads({0.0, 5.0, 10.0}, 2.0), 1.2, rect(-2, -3, 12, 6)));
    list.push_back(make("buzzer_12mm", "Piezo Buzzer 12mm", inline_pads({0.0, 7.62}, 1.5), 0.8,
                        rect(-2, -6, 10, 6)));
    list.push_back(make("speaker_28mm", "Speaker 28mm 8 Ohm", inline_pads({0.0, 20.0}, 2.0), 1.2,
                        rect(-4, -14, 24, 14)));
    list.push_back(make("display_oled_128x32", "OLED Display 0.91\" 128x32 I2C",
                        inline_pads({0.0, 2.54, 5.08, 7.62}, 1.7), 1.0,
                        rect(-3, -2, 10.62, 12)));
    list.push_back(make("photoresistor_ldr", "Photoresistor LDR", inline_pads({0.0, 5.0}, 1.5),
                        0.8, rect(-2.5, -5, 7.5, 5)));
    list.push_back(make("thermistor_ntc", "NTC Thermistor 10K", inline_pads({0.0, 5.08}, 1.5),
                        0.8, rect(0.5, -2, 4.58, 2)));

    // Mechanical
    Footprint magnet = make("magnet_6x2", "Magnet 6mm x 2mm (Round)", {}, 0.0,
                            rect(-3.5, -3.5, 3.5, 3.5));
    magnet.holes.push_back({{0.0, 0.0}, 6.1});
    list.push_back(std::move(magnet));

    std::map<std::string, Footprint> table;
    for (Footprint& fp : list) {
        std::string key = fp.type;
        table.emplace(std::move(key), std::move(fp));
    }
    return table;
}

const std::map<std::string, Footprint>& footprint_table() {
    static const std::map<std::string, Footprint> table = build_footprints();
    return table;
}

} // namespace

const Footprint* find_footprint(const std::string& type) {
    const auto& table = footprint_table();
    auto it = table.find(type);
    return it == table.end() ? nullptr : &it->second;
}

const Footprint& footprint(const std::string& type) {
    const Footprint* fp = find_footprint(type);
    if (fp == nullptr) {
        throw std::out_of_range("Unknown footprint type: " + type);
    }
    return *fp;
}

std::vector<std::string> footprint_types() {
    std::vector<std::string> types;
    for (const auto& [type, fp] : footprint_table()) {
        types.push_back(type);
    }
    return types;
}

double default_height(const std::string& type) {
    auto it = std::find_if(HEIGHT_KEYWORDS.begin(), HEIGHT_KEYWORDS.end(),
                           [&](const auto& entry) { return type.find(entry.first) != std::string::npos; });
    return it == HEIGHT_KEYWORDS.end() ? FALLBACK_HEIGHT : it->second;
}

} // namespace tapeboard
