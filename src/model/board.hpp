#pragma once

/// @file board.hpp
/// @brief Board outline, copper-tape routes, vias, design rules and the project snapshot

#include "geometry/geometry.hpp"
#include "model/component.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tapeboard {

enum class BoardShape { RECTANGULAR, CIRCULAR, FREEFORM };

[[nodiscard]] constexpr std::string_view board_shape_name(BoardShape shape) {
    switch (shape) {
    case BoardShape::RECTANGULAR:
        return "rectangular";
    case BoardShape::CIRCULAR:
        return "circular";
    case BoardShape::FREEFORM:
        return "freeform";
    }
    return "unknown";
}

/// A circular cut-out in the board (mounting hole, magnet pocket)
struct MountFeature {
    Vec2 pos;
    double dia = 0.0;
};

struct Board {
    BoardShape shape = BoardShape::RECTANGULAR;
    Polygon boundary; ///< Closed polygon, implicit closing edge
    double thickness = 2.0;
    std::vector<MountFeature> features;

    /// Extent of the boundary. An empty boundary stands for a 100 x 100 mm board.
    [[nodiscard]] BoundingBox bounds() const {
        if (boundary.empty()) {
            return {0.0, 0.0, 100.0, 100.0};
        }
        return bounds_of(boundary);
    }
};

/// Builds a rectangular board with its corner at the origin
[[nodiscard]] inline Board make_rectangular_board(double width, double height) {
    Board board;
    board.boundary = {{0.0, 0.0}, {width, 0.0}, {width, height}, {0.0, height}};
    return board;
}

enum class Layer { TOP, BOTTOM };

[[nodiscard]] constexpr std::string_view layer_name(Layer layer) {
    return layer == Layer::TOP ? "top" : "bottom";
}

/// Cross-section of a tape channel
enum class ChannelProfile { U, V, FLAT };

[[nodiscard]] constexpr std::string_view channel_profile_name(ChannelProfile profile) {
    switch (profile) {
    case ChannelProfile::U:
        return "U";
    case ChannelProfile::V:
        return "V";
    case ChannelProfile::FLAT:
        return "flat";
    }
    return "unknown";
}

/// Physical tape path realizing one connection
struct Route {
    std::string net;
    std::string connection_id; ///< Empty for hand-drawn routes
    Layer layer = Layer::TOP;
    Polyline polyline;
    double width = 5.0;
    ChannelProfile profile = ChannelProfile::U;
    double depth = 0.8;
};

/// Through-board connection between the two layers
struct Via {
    Vec2 pos;
    double dia = 3.0;
    double chamfer = 0.0;
};

/// Manufacturing limits checked by the DRC engine, in millimetres
struct DrcRules {
    double min_spacing = 1.0;
    double min_wall = 0.8;
    double nozzle_width = 0.4;
    double layer_height = 0.2;
    double min_bend_radius = 2.0;
    double min_pad_clearance = 0.5;
};

/// Complete design snapshot: the input of the DRC engine and the unit exchanged by the CLI
struct Project {
    std::string name = "Untitled";
    Board board = make_rectangular_board(100.0, 60.0);
    std::vector<Component> components;
    std::vector<Route> routes;
    std::vector<Via> vias;
    DrcRules rules;
};

} // namespace tapeboard
