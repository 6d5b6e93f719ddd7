#pragma once

/// @file drc_engine.hpp
/// @brief Manufacturing and electrical design-rule checks over a project snapshot

#include "geometry/geometry.hpp"
#include "model/board.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tapeboard {

enum class ViolationType { SPACING, WALL, BEND, PAD, OVERHANG, COLLISION, OVERLAP };

[[nodiscard]] constexpr std::string_view violation_type_name(ViolationType type) {
    switch (type) {
    case ViolationType::SPACING:
        return "spacing";
    case ViolationType::WALL:
        return "wall";
    case ViolationType::BEND:
        return "bend";
    case ViolationType::PAD:
        return "pad";
    case ViolationType::OVERHANG:
        return "overhang";
    case ViolationType::COLLISION:
        return "collision";
    case ViolationType::OVERLAP:
        return "overlap";
    }
    return "unknown";
}

enum class Severity { ERROR, WARNING };

[[nodiscard]] constexpr std::string_view severity_name(Severity severity) {
    return severity == Severity::ERROR ? "error" : "warning";
}

struct Violation {
    ViolationType type = ViolationType::SPACING;
    std::string message;
    Vec2 position;
    Severity severity = Severity::ERROR;
};

struct DrcSummary {
    int errors = 0;
    int warnings = 0;

    [[nodiscard]] bool has_errors() const { return errors > 0; }
};

// Individual checks. Each reads only the project and is independent of the others.

/// Route pairs whose closest vertices are nearer than `min_spacing`
[[nodiscard]] std::vector<Violation> check_min_spacing(const Project& project);

/// Route pairs whose channel wall (vertex gap minus half widths) is thinner than `min_wall`
[[nodiscard]] std::vector<Violation> check_wall_thickness(const Project& project);

/// Route corners sharper than the tape can follow (heuristic, warning)
[[nodiscard]] std::vector<Violation> check_bend_radius(const Project& project);

/// Routes passing closer to a pad than its radius plus `min_pad_clearance`
[[nodiscard]] std::vector<Violation> check_pad_clearance(const Project& project);

/// Route points outside the board outline
[[nodiscard]] std::vector<Violation> check_overhangs(const Project& project);

/// Overlapping drilled holes among component holes, vias and mount features
[[nodiscard]] std::vector<Violation> check_hole_collisions(const Project& project);

/// Vias not covered by any tape route (warning)
[[nodiscard]] std::vector<Violation> check_tape_overlap(const Project& project);

/// Pads no route reaches (warning). Magnets are exempt.
[[nodiscard]] std::vector<Violation> check_unconnected_pads(const Project& project);

/// ICs without a power source, and power sources without routes (warnings)
[[nodiscard]] std::vector<Violation> check_power_connections(const Project& project);

/// Component pairs whose estimated footprints overlap
[[nodiscard]] std::vector<Violation> check_component_overlap(const Project& project);

/// Runs every check with the project's rules, in a fixed order
[[nodiscard]] std::vector<Violation> run_drc(const Project& project);

[[nodiscard]] DrcSummary summarize(const std::vector<Violation>& violations);

} // namespace tapeboard
