#pragma once

/// @file footprint.hpp
/// @brief Footprint and pinout templates: pads, holes, outlines and role-tagged pins

#include "geometry/geometry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tapeboard {

/// A solder or contact location, in the footprint's local frame
struct Pad {
    std::string id; ///< Empty on catalog templates; set on component instances
    Vec2 pos;
    double dia = 0.0;    ///< 0 when the pad is described by width/height
    double width = 0.0;  ///< 0 when absent
    double height = 0.0; ///< 0 when absent

    /// Pad radius: diameter, else width, else `fallback_diameter`, halved
    [[nodiscard]] double radius(double fallback_diameter) const {
        if (dia > 0.0) return dia / 2.0;
        if (width > 0.0) return width / 2.0;
        return fallback_diameter / 2.0;
    }
};

/// A drilled hole in the footprint's local frame
struct Hole {
    Vec2 pos;
    double dia = 0.0;
};

/// Immutable physical template for a component type
struct Footprint {
    std::string type;
    std::string name;
    std::vector<Pad> pads;
    std::vector<Hole> holes;
    Polygon outline; ///< Empty when the footprint has no body outline
    double height = 5.0;
};

/// Electrical role of a pin
enum class PinRole { VCC, GND, SIGNAL, DATA, CLOCK, ENABLE, INPUT, OUTPUT, NC };

[[nodiscard]] constexpr std::string_view pin_role_name(PinRole role) {
    switch (role) {
    case PinRole::VCC:
        return "vcc";
    case PinRole::GND:
        return "gnd";
    case PinRole::SIGNAL:
        return "signal";
    case PinRole::DATA:
        return "data";
    case PinRole::CLOCK:
        return "clock";
    case PinRole::ENABLE:
        return "enable";
    case PinRole::INPUT:
        return "input";
    case PinRole::OUTPUT:
        return "output";
    case PinRole::NC:
        return "nc";
    }
    return "unknown";
}

/// One named pin of a pinout. `index` addresses the footprint pad of the same index.
struct Pin {
    int index = 0;
    PinRole role = PinRole::SIGNAL;
    std::string name;
    std::optional<double> voltage;
};

/// Immutable pin list for a component type
struct Pinout {
    std::string type;
    std::vector<Pin> pins;
};

} // namespace tapeboard
