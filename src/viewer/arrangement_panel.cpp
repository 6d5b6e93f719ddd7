/// @file arrangement_panel.cpp
/// @brief Arrangement and violation panels

#include "viewer/arrangement_panel.hpp"

#include "viewer/app_font.hpp"
#include "viewer/ui_scale.hpp"

#include <raylib.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

namespace tapeboard {

namespace {

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color SELECTED_BG = {60, 80, 110, 255};
const Color SCORE_GOOD = {80, 220, 130, 255};
const Color SCORE_FAIR = {230, 200, 90, 255};
const Color SCORE_POOR = {230, 110, 90, 255};
const Color ERROR_COLOR = {240, 90, 90, 255};
const Color WARNING_COLOR = {245, 190, 70, 255};

constexpr int SCORE_GOOD_MIN = 70;
constexpr int SCORE_FAIR_MIN = 40;

Color score_color(int score) {
    if (score >= SCORE_GOOD_MIN) return SCORE_GOOD;
    if (score >= SCORE_FAIR_MIN) return SCORE_FAIR;
    return SCORE_POOR;
}

/// Draws wrapped text and returns consumed height.
float draw_wrapped_text(const std::string& text, float x, float y, float max_width, int font_size,
                        Color color, float line_gap = 2.0f) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float cy = y;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureAppText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                DrawAppText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
                cy += static_cast<float>(font_size) + line_gap;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        DrawAppText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size);
    }
    return cy - y;
}

void draw_row(const char* label, const std::string& value, float x, float y, float value_x,
              int font_size) {
    DrawAppText(label, static_cast<int>(x), static_cast<int>(y), font_size, LABEL_COLOR);
    DrawAppText(value.c_str(), static_cast<int>(value_x), static_cast<int>(y), font_size, TEXT_COLOR);
}

} // namespace

float draw_arrangement_panel(const std::vector<Arrangement>& arrangements, int selected,
                             std::uint32_t seed, float panel_x, float panel_y, float panel_w) {
    const auto& sc = ui_scale();
    const float PADDING = sc.padding;
    const float ROW_HEIGHT = sc.row_height;

    // Title, one row per arrangement, separator, five metric rows, description
    float panel_h = PADDING * 2.0f + ROW_HEIGHT * (2.0f + static_cast<float>(arrangements.size()));
    panel_h += 8.0f + ROW_HEIGHT * 5.0f + ROW_HEIGHT * 2.0f;

    DrawRectangleRec({panel_x, panel_y, panel_w, panel_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, panel_h}, 1.0f, BORDER_COLOR);

    float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;
    char buf[128];

    std::snprintf(buf, sizeof(buf), "ARRANGEMENTS  (seed %u)", static_cast<unsigned>(seed));
    DrawAppText(buf, static_cast<int>(cx), static_cast<int>(cy), sc.font_normal, TEXT_COLOR);
    cy += ROW_HEIGHT + 4.0f;

    if (arrangements.empty()) {
        DrawAppText("No components to place", static_cast<int>(cx), static_cast<int>(cy),
                    sc.font_small, LABEL_COLOR);
        return panel_h;
    }

    for (size_t i = 0; i < arrangements.size(); i++) {
        const Arrangement& a = arrangements[i];
        if (static_cast<int>(i) == selected) {
            DrawRectangleRec({panel_x + 2.0f, cy - 2.0f, panel_w - 4.0f, ROW_HEIGHT}, SELECTED_BG);
        }
        std::snprintf(buf, sizeof(buf), "%zu. %s", i + 1, a.name.c_str());
        DrawAppText(buf, static_cast<int>(cx), static_cast<int>(cy), sc.font_small, TEXT_COLOR);

        std::string score = std::to_string(a.score);
        int w = MeasureAppText(score.c_str(), sc.font_small);
        DrawAppText(score.c_str(), static_cast<int>(panel_x + panel_w - PADDING) - w,
                    static_cast<int>(cy), sc.font_small, score_color(a.score));
        cy += ROW_HEIGHT;
    }

    DrawLine(static_cast<int>(cx), static_cast<int>(cy + 2.0f),
             static_cast<int>(panel_x + panel_w - PADDING), static_cast<int>(cy + 2.0f),
             BORDER_COLOR);
    cy += 8.0f;

    const Arrangement& current = arrangements[static_cast<size_t>(selected)];
    const float value_x = cx + panel_w * 0.55f;

    std::snprintf(buf, sizeof(buf), "%.0f mm", current.metrics.total_route_length);
    draw_row("Route length", buf, cx, cy, value_x, sc.font_small);
    cy += ROW_HEIGHT;
    draw_row("Crossings", std::to_string(current.metrics.route_crossings), cx, cy, value_x,
             sc.font_small);
    cy += ROW_HEIGHT;
    std::snprintf(buf, sizeof(buf), "%.0f %%", current.metrics.board_utilization * 100.0);
    draw_row("Utilization", buf, cx, cy, value_x, sc.font_small);
    cy += ROW_HEIGHT;
    std::snprintf(buf, sizeof(buf), "%.2f", current.metrics.symmetry_score);
    draw_row("Symmetry", buf, cx, cy, value_x, sc.font_small);
    cy += ROW_HEIGHT;
    std::snprintf(buf, sizeof(buf), "%zu / %zu skipped", current.routes.size(),
                  current.skipped.size());
    draw_row("Routes", buf, cx, cy, value_x, sc.font_small);
    cy += ROW_HEIGHT;

    draw_wrapped_text(current.description, cx, cy, panel_w - 2.0f * PADDING, sc.font_tiny,
                      LABEL_COLOR);
    return panel_h;
}

float draw_violation_panel(const std::vector<Violation>& violations, float panel_x, float panel_y,
                           float panel_w, float max_h) {
    const auto& sc = ui_scale();
    const float PADDING = sc.padding;
    const float ROW_HEIGHT = sc.row_height;

    DrawRectangleRec({panel_x, panel_y, panel_w, max_h}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, max_h}, 1.0f, BORDER_COLOR);

    float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;
    const float bottom = panel_y + max_h - PADDING;

    DrcSummary summary = summarize(violations);
    char buf[96];
    std::snprintf(buf, sizeof(buf), "DRC  %d error(s)  %d warning(s)", summary.errors,
                  summary.warnings);
    DrawAppText(buf, static_cast<int>(cx), static_cast<int>(cy), sc.font_normal,
                summary.has_errors() ? ERROR_COLOR : TEXT_COLOR);
    cy += ROW_HEIGHT + 4.0f;

    size_t shown = 0;
    for (const Violation& v : violations) {
        if (cy + ROW_HEIGHT > bottom) break;
        Color color = v.severity == Severity::ERROR ? ERROR_COLOR : WARNING_COLOR;
        cy += draw_wrapped_text(v.message, cx, cy, panel_w - 2.0f * PADDING, sc.font_tiny, color);
        cy += 4.0f;
        shown++;
    }
    if (shown < violations.size() && cy + ROW_HEIGHT <= panel_y + max_h) {
        std::snprintf(buf, sizeof(buf), "... %zu more", violations.size() - shown);
        DrawAppText(buf, static_cast<int>(cx), static_cast<int>(cy), sc.font_tiny, LABEL_COLOR);
    }
    return max_h;
}

} // namespace tapeboard
