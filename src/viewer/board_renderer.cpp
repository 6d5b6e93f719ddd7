/// @file board_renderer.cpp
/// @brief Board, component, route and violation drawing

#include "viewer/board_renderer.hpp"

#include "assembly/connection_inference.hpp"
#include "catalog/catalog.hpp"
#include "viewer/app_font.hpp"
#include "viewer/ui_scale.hpp"

#include <algorithm>
#include <cmath>

namespace tapeboard {

namespace {

// --- Color palette ---
const Color BOARD_FILL = {32, 58, 44, 255};      // Printed substrate
const Color BOARD_OUTLINE = {90, 160, 110, 255};
const Color FEATURE_COLOR = {20, 20, 24, 255};
const Color ROUTE_COLOR = {200, 120, 60, 220};   // Copper
const Color ROUTE_CENTER = {255, 190, 120, 255};
const Color PAD_COLOR = {230, 200, 90, 255};
const Color HOLE_COLOR = {15, 15, 18, 255};
const Color LABEL_COLOR = {235, 235, 240, 255};
const Color ERROR_COLOR = {240, 70, 70, 255};
const Color WARNING_COLOR = {245, 190, 70, 255};

const Color ROLE_INPUT = {70, 130, 210, 200};
const Color ROLE_OUTPUT = {210, 90, 90, 200};
const Color ROLE_POWER = {200, 170, 60, 200};
const Color ROLE_SIGNAL = {110, 110, 140, 200};
const Color ROLE_CONNECTOR = {150, 100, 200, 200};

constexpr float OUTLINE_THICKNESS = 2.0f;
constexpr float DEFAULT_PAD_DIA = 1.5f;   // mm
constexpr float PAD_BOX_MARGIN = 2.0f;    // mm around pad centres without an outline
constexpr float MARKER_RADIUS = 7.0f;     // px
constexpr float MIN_SCALE = 1.0f;

Color role_color(ComponentRole role) {
    switch (role) {
    case ComponentRole::INPUT:
        return ROLE_INPUT;
    case ComponentRole::OUTPUT:
        return ROLE_OUTPUT;
    case ComponentRole::POWER:
        return ROLE_POWER;
    case ComponentRole::SIGNAL:
        return ROLE_SIGNAL;
    case ComponentRole::CONNECTOR:
        return ROLE_CONNECTOR;
    }
    return ROLE_SIGNAL;
}

void draw_closed_polygon(const Polygon& polygon, const BoardView& view, float thickness,
                         Color color) {
    for (size_t i = 0; i < polygon.size(); i++) {
        Vector2 a = to_screen(polygon[i], view);
        Vector2 b = to_screen(polygon[(i + 1) % polygon.size()], view);
        DrawLineEx(a, b, thickness, color);
    }
}

/// Local body outline: the catalog outline, else the grown pad-centre box
Polygon body_outline(const Component& component) {
    const Footprint* fp = find_footprint(component.type);
    if (fp != nullptr && fp->outline.size() >= 3) {
        return fp->outline;
    }
    if (component.pads.empty()) {
        return {};
    }
    std::vector<Vec2> centres;
    for (const Pad& pad : component.pads) {
        centres.push_back(pad.pos);
    }
    return bounds_of(centres).expanded(PAD_BOX_MARGIN).corners();
}

} // namespace

BoardView fit_board_view(const BoundingBox& bounds, Rectangle area, float padding,
                         float max_scale) {
    BoardView view;
    float bw = static_cast<float>(bounds.width());
    float bh = static_cast<float>(bounds.height());
    if (bw <= 0.0f || bh <= 0.0f) {
        view.scale = max_scale;
        view.offset = {area.x, area.y};
        return view;
    }

    float available_w = area.width - 2.0f * padding;
    float available_h = area.height - 2.0f * padding;
    view.scale = std::max(std::min({available_w / bw, available_h / bh, max_scale}), MIN_SCALE);

    view.offset = {
        area.x + (area.width - bw * view.scale) / 2.0f - static_cast<float>(bounds.min_x) * view.scale,
        area.y + (area.height - bh * view.scale) / 2.0f - static_cast<float>(bounds.min_y) * view.scale};
    return view;
}

Vector2 to_screen(Vec2 p, const BoardView& view) {
    return {static_cast<float>(p.x) * view.scale + view.offset.x,
            static_cast<float>(p.y) * view.scale + view.offset.y};
}

void draw_board(const Board& board, const BoardView& view) {
    Polygon outline = board.boundary.size() >= 3 ? board.boundary : board.bounds().corners();

    // Fill via the bounding box; outlines are drawn exactly on top
    BoundingBox box = bounds_of(outline);
    Vector2 min = to_screen({box.min_x, box.min_y}, view);
    DrawRectangleRec({min.x, min.y, static_cast<float>(box.width()) * view.scale,
                      static_cast<float>(box.height()) * view.scale},
                     BOARD_FILL);
    draw_closed_polygon(outline, view, OUTLINE_THICKNESS, BOARD_OUTLINE);

    for (const MountFeature& feature : board.features) {
        DrawCircleV(to_screen(feature.pos, view), static_cast<float>(feature.dia) / 2.0f * view.scale,
                    FEATURE_COLOR);
    }
}

void draw_routes(const std::vector<Route>& routes, const BoardView& view) {
    for (const Route& route : routes) {
        const float width = static_cast<float>(route.width) * view.scale;
        for (size_t i = 0; i + 1 < route.polyline.size(); i++) {
            DrawLineEx(to_screen(route.polyline[i], view), to_screen(route.polyline[i + 1], view),
                       width, ROUTE_COLOR);
        }
        for (const Vec2& p : route.polyline) {
            DrawCircleV(to_screen(p, view), width / 2.0f, ROUTE_COLOR);
        }
        for (size_t i = 0; i + 1 < route.polyline.size(); i++) {
            DrawLineEx(to_screen(route.polyline[i], view), to_screen(route.polyline[i + 1], view),
                       1.0f, ROUTE_CENTER);
        }
    }
}

void draw_components(const std::vector<Component>& components, const BoardView& view) {
    const auto& sc = ui_scale();
    for (const Component& component : components) {
        Polygon body;
        for (const Vec2& p : body_outline(component)) {
            body.push_back(to_world(component, p));
        }
        if (!body.empty()) {
            Color fill = role_color(infer_component_role(component.type));
            BoundingBox box = bounds_of(body);
            Vector2 min = to_screen({box.min_x, box.min_y}, view);
            DrawRectangleRec({min.x, min.y, static_cast<float>(box.width()) * view.scale,
                              static_cast<float>(box.height()) * view.scale},
                             ColorAlpha(fill, 0.35f));
            draw_closed_polygon(body, view, OUTLINE_THICKNESS, fill);
        }

        for (const Pad& pad : component.pads) {
            float r = static_cast<float>(pad.radius(DEFAULT_PAD_DIA)) * view.scale;
            DrawCircleV(to_screen(to_world(component, pad.pos), view), r, PAD_COLOR);
        }
        for (const Hole& hole : component.holes) {
            DrawCircleV(to_screen(to_world(component, hole.pos), view),
                        static_cast<float>(hole.dia) / 2.0f * view.scale, HOLE_COLOR);
        }

        Vector2 c = to_screen(component.pos, view);
        int w = MeasureAppText(component.id.c_str(), sc.font_tiny);
        DrawAppText(component.id.c_str(), static_cast<int>(c.x) - w / 2,
                    static_cast<int>(c.y) - sc.font_tiny / 2, sc.font_tiny, LABEL_COLOR);
    }
}

void draw_violations(const std::vector<Violation>& violations, const BoardView& view) {
    for (const Violation& v : violations) {
        Color color = v.severity == Severity::ERROR ? ERROR_COLOR : WARNING_COLOR;
        Vector2 p = to_screen(v.position, view);
        DrawCircleLines(static_cast<int>(p.x), static_cast<int>(p.y), MARKER_RADIUS, color);
        DrawLineEx({p.x - MARKER_RADIUS, p.y}, {p.x + MARKER_RADIUS, p.y}, 1.5f, color);
        DrawLineEx({p.x, p.y - MARKER_RADIUS}, {p.x, p.y + MARKER_RADIUS}, 1.5f, color);
    }
}

} // namespace tapeboard
