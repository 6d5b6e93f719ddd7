/// @file ui_scale.hpp
/// @brief Window-size dependent layout metrics for the viewer.
///
/// Recomputed once per frame so the side panel, fonts and board viewport follow the
/// window without threading sizes through every draw call.

#pragma once

namespace tapeboard {

struct UIScale {
    float factor = 1.0f;    ///< screen_h / 720 blended with width, clamped
    float panel_w = 320.0f; ///< Right-side panel width
    float margin = 10.0f;

    int font_normal = 16;
    int font_small = 14;
    int font_big = 21;
    int font_tiny = 12;

    float row_height = 23.0f;
    float padding = 10.0f;

    // Board viewport
    float board_padding = 40.0f; ///< Pixels around the board outline
    float max_ppm = 12.0f;       ///< Max pixels per millimetre
    int title_font = 24;
    int hud_font = 14;
};

/// Updates the global UI scale from the current screen dimensions.
void update_ui_scale(int screen_w, int screen_h);

const UIScale& ui_scale();

} // namespace tapeboard
