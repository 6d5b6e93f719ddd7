/// @file board_renderer.hpp
/// @brief Draws the board outline, components, tape routes and DRC markers

#pragma once

#include "drc/drc_engine.hpp"
#include "geometry/geometry.hpp"
#include "model/board.hpp"
#include "model/component.hpp"

#include <raylib.h>

#include <vector>

namespace tapeboard {

/// Board-to-screen mapping: screen = board * scale + offset
struct BoardView {
    float scale = 1.0f; ///< Pixels per millimetre
    Vector2 offset = {0, 0};
};

/// Largest view that fits `bounds` centred in the area, capped at `max_scale`
[[nodiscard]] BoardView fit_board_view(const BoundingBox& bounds, Rectangle area, float padding,
                                       float max_scale);

[[nodiscard]] Vector2 to_screen(Vec2 p, const BoardView& view);

/// Draws the outline and mount features
void draw_board(const Board& board, const BoardView& view);

/// Draws tape routes at their physical width with rounded joints
void draw_routes(const std::vector<Route>& routes, const BoardView& view);

/// Draws component bodies coloured by role, their pads and holes, and id labels
void draw_components(const std::vector<Component>& components, const BoardView& view);

/// Draws a marker per violation: red for errors, amber for warnings
void draw_violations(const std::vector<Violation>& violations, const BoardView& view);

} // namespace tapeboard
