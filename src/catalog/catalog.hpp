#pragma once

/// @file catalog.hpp
/// @brief Static footprint and pinout library keyed by component type
///
/// Both tables are built once on first access and never change afterwards, so every
/// lookup is a pure function of its arguments.

#include "model/footprint.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tapeboard {

/// Returns the footprint for `type`, or nullptr when the type is not in the library
[[nodiscard]] const Footprint* find_footprint(const std::string& type);

/// Returns the footprint for `type`.
/// @throws std::out_of_range if the type is not in the library
[[nodiscard]] const Footprint& footprint(const std::string& type);

/// All footprint types in the library, sorted
[[nodiscard]] std::vector<std::string> footprint_types();

/// Default body height for a type, matched by keyword (e.g. "pot" -> 10 mm)
[[nodiscard]] double default_height(const std::string& type);

/// Returns the pinout for `type`, or nullptr when none is known
[[nodiscard]] const Pinout* find_pinout(const std::string& type);

/// Returns the pinout for `type`.
/// @throws std::out_of_range if no pinout is known for the type
[[nodiscard]] const Pinout& pinout(const std::string& type);

/// Returns the pin with index `pad_index`, or empty when the type or pin is unknown
[[nodiscard]] std::optional<Pin> pin_info(const std::string& type, int pad_index);

[[nodiscard]] bool is_power_pin(const std::string& type, int pad_index);
[[nodiscard]] bool is_ground_pin(const std::string& type, int pad_index);

/// Pad indices with role vcc, in pin order
[[nodiscard]] std::vector<int> vcc_pads(const std::string& type);

/// Pad indices with role gnd, in pin order
[[nodiscard]] std::vector<int> gnd_pads(const std::string& type);

/// Human-readable pad label: "<name> (<role>)" when the pin is known, "P<n>" for a
/// footprint pad without pin data, "?<n>" otherwise (n is 1-based).
[[nodiscard]] std::string pad_label(const std::string& type, int pad_index);

} // namespace tapeboard
