/// @file ui_scale.cpp
/// @brief Computes per-frame responsive viewer metrics from the window size.

#include "viewer/ui_scale.hpp"

#include <algorithm>
#include <cmath>

namespace tapeboard {

namespace {

constexpr float BASELINE_W = 1280.0f;
constexpr float BASELINE_H = 720.0f;

UIScale g_scale;

int scaled_font(float base, float factor) {
    int v = static_cast<int>(std::round(base * factor));
    return std::clamp(v, static_cast<int>(base * 0.65f), static_cast<int>(base * 1.6f));
}

} // namespace

void update_ui_scale(int screen_w, int screen_h) {
    float sw = static_cast<float>(screen_w);
    float sh = static_cast<float>(screen_h);

    // Height-dominant blend
    g_scale.factor = std::clamp((sh / BASELINE_H) * 0.7f + (sw / BASELINE_W) * 0.3f, 0.6f, 1.8f);
    g_scale.panel_w = std::clamp(sw * 0.26f, 260.0f, 440.0f);
    g_scale.margin = std::clamp(10.0f * g_scale.factor, 6.0f, 16.0f);

    // Panel text never grows past the 720p baseline
    float f = g_scale.factor;
    float pf = std::min(f, 1.0f);

    g_scale.font_normal = scaled_font(16.0f, pf);
    g_scale.font_small = scaled_font(14.0f, pf);
    g_scale.font_big = scaled_font(21.0f, pf);
    g_scale.font_tiny = scaled_font(12.0f, pf);
    g_scale.row_height = std::round(23.0f * pf);
    g_scale.padding = std::round(10.0f * pf);

    g_scale.board_padding = std::clamp(40.0f * f, 20.0f, 70.0f);
    g_scale.max_ppm = std::clamp(12.0f * f, 6.0f, 24.0f);
    g_scale.title_font = scaled_font(24.0f, f);
    g_scale.hud_font = scaled_font(14.0f, f);
}

const UIScale& ui_scale() {
    return g_scale;
}

} // namespace tapeboard
