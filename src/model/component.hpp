#pragma once

/// @file component.hpp
/// @brief Placed component instances and the assembly requests they are expanded from

#include "geometry/geometry.hpp"
#include "model/footprint.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tapeboard {

/// Functional role of a component, used by the signal-flow placement strategy
enum class ComponentRole { INPUT, OUTPUT, POWER, SIGNAL, CONNECTOR };

[[nodiscard]] constexpr std::string_view component_role_name(ComponentRole role) {
    switch (role) {
    case ComponentRole::INPUT:
        return "input";
    case ComponentRole::OUTPUT:
        return "output";
    case ComponentRole::POWER:
        return "power";
    case ComponentRole::SIGNAL:
        return "signal";
    case ComponentRole::CONNECTOR:
        return "connector";
    }
    return "unknown";
}

/// Pins an instance to a fixed position. Locked instances are never moved by the optimizer.
struct PlacementConstraint {
    bool locked = false;
    Vec2 locked_pos;
    double locked_rotation = 0.0;
};

/// A user request for `quantity` copies of a footprint type
struct AssemblyComponent {
    std::string id; ///< Optional; the type is used as id prefix when empty
    std::string type;
    int quantity = 1;
    std::optional<ComponentRole> role;
    std::optional<PlacementConstraint> constraint;
};

/// One expanded unit of an AssemblyComponent, before placement
struct ComponentInstance {
    std::string id; ///< Stable across strategies and re-orderings
    std::string type;
    int instance_index = 0; ///< Copy number within its AssemblyComponent
    int source_index = 0;   ///< Position of the AssemblyComponent in the request
    std::optional<ComponentRole> role;
    std::optional<PlacementConstraint> constraint;
};

/// A placed component. Pads and holes stay in the local frame; `pos` and `rotation`
/// (degrees) are applied on demand.
struct Component {
    std::string id;
    std::string type;
    Vec2 pos;
    double rotation = 0.0;
    std::vector<Pad> pads;
    std::vector<Hole> holes;
};

/// World position of a local point on a component
[[nodiscard]] inline Vec2 to_world(const Component& component, Vec2 local) {
    return transform_point(local, component.pos, component.rotation);
}

} // namespace tapeboard
