#pragma once

/// @file connection.hpp
/// @brief Pad-to-pad electrical connections and id-based component lookup

#include "model/component.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tapeboard {

/// One end of a connection: a pad on a component identified by its stable id
struct PadRef {
    std::string component_id;
    int pad_index = 0;
};

/// A required electrical link between two pads
struct Connection {
    std::string id;
    PadRef from;
    PadRef to;
    std::string net_name; ///< Empty when unnamed
    bool is_power = false;
    bool is_ground = false;
    bool auto_detected = false;
};

/// Diagnostic for a connection that could not be resolved against the components
struct SkippedConnection {
    std::string connection_id;
    std::string reason;
};

/// O(1) lookup of components by id over a component list.
///
/// The index is built on first use and holds pointers into the list, so the list must
/// outlive the index and must not be resized while it is in use.
class ComponentIndex {
  public:
    explicit ComponentIndex(const std::vector<Component>& components)
        : components_(components) {}

    /// Returns the component with `id`, or nullptr
    [[nodiscard]] const Component* find(const std::string& id) const;

    /// Returns the position of `id` in the list
    [[nodiscard]] std::optional<size_t> position_of(const std::string& id) const;

  private:
    void build() const;

    const std::vector<Component>& components_;
    mutable std::unordered_map<std::string, size_t> by_id_;
    mutable bool built_ = false;
};

/// A connection endpoint resolved to world coordinates
struct ResolvedEndpoint {
    const Component* component = nullptr;
    const Pad* pad = nullptr;
    Vec2 world;
};

/// Resolves a pad reference. Empty when the component id is unknown or the pad index is out
/// of range.
[[nodiscard]] std::optional<ResolvedEndpoint> resolve_pad(const ComponentIndex& index,
                                                          const PadRef& ref);

/// Explains why a connection cannot be resolved, or returns empty when it can
[[nodiscard]] std::optional<SkippedConnection> check_connection(const ComponentIndex& index,
                                                                const Connection& connection);

} // namespace tapeboard
