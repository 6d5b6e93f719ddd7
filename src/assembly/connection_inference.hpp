#pragma once

/// @file connection_inference.hpp
/// @brief Expands assembly requests into instances and infers power, ground and signal wiring

#include "model/component.hpp"
#include "model/connection.hpp"

#include <string>
#include <vector>

namespace tapeboard {

/// Expands each request into `quantity` instances, in request order.
/// Ids are `<id or type>_<n>` where n counts per id base, so they stay unique even when
/// several requests share a type.
/// @throws std::invalid_argument if a quantity is negative
[[nodiscard]] std::vector<ComponentInstance>
expand_components(const std::vector<AssemblyComponent>& assembly);

/// Guesses the functional role of a type from keywords in its name
[[nodiscard]] ComponentRole infer_component_role(const std::string& type);

/// Net name for a connection: "VCC"/"GND" for supply nets, "<fromPin>_<toPin>" when both
/// pins are named in the pinout library, else "<FROM><pad+1>_<TO><pad+1>" using the
/// upper-cased first word of each type.
[[nodiscard]] std::string generate_net_name(const std::string& from_type, int from_pad,
                                            const std::string& to_type, int to_pad,
                                            bool is_power, bool is_ground);

struct DetectionStats {
    int power = 0;
    int ground = 0;
    int signal = 0;
    std::vector<std::string> unknown_types; ///< Types without pinout, first-seen order
};

struct DetectionResult {
    std::vector<Connection> connections;
    DetectionStats stats;
};

/// Infers supply rails and pot/encoder-to-controller links for a set of instances.
///
/// Pads already used by `existing` connections are treated as taken. Returned connections
/// are new only; `existing` is not included.
[[nodiscard]] DetectionResult auto_detect_connections(const std::vector<ComponentInstance>& instances,
                                                      const std::vector<Connection>& existing = {});

/// One diagnostic per connection that does not resolve against `components`
[[nodiscard]] std::vector<SkippedConnection>
validate_connections(const std::vector<Connection>& connections,
                     const std::vector<Component>& components);

/// Appends a manual connection unless the same pad pair is already connected in either
/// direction. An empty id is replaced by a generated `conn_<n>`.
/// @return false when the connection was a duplicate
bool add_connection(std::vector<Connection>& connections, Connection connection);

} // namespace tapeboard
