/// @file viewer_main.cpp
/// @brief tapeboard_viewer entry point: interactive view of placed and routed arrangements
///
/// With only a project file the project's own components and routes are shown. With an
/// assembly file every placement strategy is run, each arrangement is routed and checked,
/// and the arrangements can be cycled and re-seeded from the keyboard.

#include "assembly/connection_inference.hpp"
#include "config/engine_config.hpp"
#include "drc/drc_engine.hpp"
#include "io/project_json.hpp"
#include "placement/placement_engine.hpp"
#include "routing/auto_router.hpp"
#include "viewer/app_font.hpp"
#include "viewer/arrangement_panel.hpp"
#include "viewer/board_renderer.hpp"
#include "viewer/ui_scale.hpp"

#include <cxxopts.hpp>
#include <raylib.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace tapeboard;

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr float TITLE_BAR_H = 40.0f;

const Color BACKGROUND = {25, 25, 30, 255};
const Color TITLE_COLOR = {240, 240, 240, 255};
const Color HUD_COLOR = {140, 140, 140, 255};

/// Everything rebuilt when the seed changes
struct AppState {
    Project project;
    std::vector<AssemblyComponent> assembly;
    EngineConfig config;
    std::vector<Arrangement> arrangements;
    std::vector<Violation> violations; ///< For the selected arrangement
    int selected = 0;
    bool show_violations = true;
    BoardView view;
};

/// Project snapshot for the selected arrangement
Project selected_project(const AppState& app) {
    Project project = app.project;
    if (!app.arrangements.empty()) {
        const Arrangement& a = app.arrangements[static_cast<size_t>(app.selected)];
        project.components = a.components;
        project.routes = a.routes;
    }
    return project;
}

void refit_view(AppState& app) {
    const auto& sc = ui_scale();
    float screen_w = static_cast<float>(GetScreenWidth());
    float screen_h = static_cast<float>(GetScreenHeight());
    Rectangle area = {0.0f, TITLE_BAR_H, screen_w - sc.panel_w - 2.0f * sc.margin,
                      screen_h - TITLE_BAR_H};
    app.view = fit_board_view(app.project.board.bounds(), area, sc.board_padding, sc.max_ppm);
}

void select_arrangement(AppState& app, int index) {
    if (!app.arrangements.empty()) {
        int n = static_cast<int>(app.arrangements.size());
        app.selected = ((index % n) + n) % n;
    }
    app.violations = run_drc(selected_project(app));
}

/// Places, routes and ranks the assembly with the current seed
void rebuild_arrangements(AppState& app) {
    app.arrangements.clear();
    if (!app.assembly.empty()) {
        std::vector<ComponentInstance> instances = expand_components(app.assembly);
        std::vector<Connection> connections = auto_detect_connections(instances).connections;
        for (Arrangement& a :
             generate_placements(instances, app.project.board, connections, app.config.placement)) {
            app.arrangements.push_back(
                route_arrangement(std::move(a), connections, app.project.board, app.config.router));
        }
    } else {
        Arrangement current;
        current.id = "arr_project";
        current.name = app.project.name;
        current.description = "Components and routes as stored in the project file";
        current.components = app.project.components;
        current.routes = app.project.routes;
        app.arrangements.push_back(std::move(current));
    }
    select_arrangement(app, 0);
}

void frame_tick(AppState& app) {
    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    update_ui_scale(screen_w, screen_h);
    const auto& sc = ui_scale();

    if (IsWindowResized()) {
        refit_view(app);
    }

    if (IsKeyPressed(KEY_RIGHT) || IsKeyPressed(KEY_DOWN)) {
        select_arrangement(app, app.selected + 1);
    }
    if (IsKeyPressed(KEY_LEFT) || IsKeyPressed(KEY_UP)) {
        select_arrangement(app, app.selected - 1);
    }
    if (IsKeyPressed(KEY_R) && !app.assembly.empty()) {
        app.config.placement.seed++;
        spdlog::info("[viewer] reseeding with {}", app.config.placement.seed);
        rebuild_arrangements(app);
    }
    if (IsKeyPressed(KEY_V)) {
        app.show_violations = !app.show_violations;
    }

    BeginDrawing();
    ClearBackground(BACKGROUND);

    draw_board(app.project.board, app.view);
    if (!app.arrangements.empty()) {
        const Arrangement& a = app.arrangements[static_cast<size_t>(app.selected)];
        draw_routes(a.routes, app.view);
        draw_components(a.components, app.view);
    }
    if (app.show_violations) {
        draw_violations(app.violations, app.view);
    }

    std::string title = app.project.name;
    if (!app.arrangements.empty()) {
        title += "  -  " + app.arrangements[static_cast<size_t>(app.selected)].name;
    }
    float board_area_w = static_cast<float>(screen_w) - sc.panel_w - sc.margin;
    int title_w = MeasureAppText(title.c_str(), sc.title_font);
    DrawAppText(title.c_str(), static_cast<int>((board_area_w - static_cast<float>(title_w)) / 2.0f),
                12, sc.title_font, TITLE_COLOR);

    float panel_x = static_cast<float>(screen_w) - sc.panel_w - sc.margin;
    float used = draw_arrangement_panel(app.arrangements, app.selected, app.config.placement.seed, panel_x,
                                        sc.margin, sc.panel_w);
    float violations_y = sc.margin * 2.0f + used;
    draw_violation_panel(app.violations, panel_x, violations_y, sc.panel_w,
                         static_cast<float>(screen_h) - violations_y - sc.margin);

    DrawAppText("Left/Right: arrangement   R: reseed   V: violations", 10,
                screen_h - sc.hud_font - 10, sc.hud_font, HUD_COLOR);

    EndDrawing();
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("tapeboard_viewer", "Interactive view of placed and routed boards");
    options.positional_help("<project.json> [assembly.json]");
    // clang-format off
    options.add_options()
        ("project", "Project JSON (board, rules, components)", cxxopts::value<std::string>())
        ("assembly", "Assembly request JSON", cxxopts::value<std::string>())
        ("config", "Engine config JSON", cxxopts::value<std::string>())
        ("seed", "Initial placement seed", cxxopts::value<std::uint32_t>())
        ("h,help", "Print usage");
    // clang-format on
    options.parse_positional({"project", "assembly"});

    AppState app;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("project")) {
            std::cout << options.help() << '\n';
            return result.count("help") ? 0 : 1;
        }
        if (result.count("config")) {
            app.config = load_engine_config(result["config"].as<std::string>());
        }
        if (result.count("seed")) {
            app.config.placement.seed = result["seed"].as<std::uint32_t>();
        }
        configure_logging(app.config.log_level);

        app.project = load_project(result["project"].as<std::string>());
        if (result.count("assembly")) {
            app.assembly = load_assembly(result["assembly"].as<std::string>());
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "tapeboard");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);
    init_app_font();

    int status = 0;
    try {
        update_ui_scale(GetScreenWidth(), GetScreenHeight());
        rebuild_arrangements(app);
        refit_view(app);
        while (!WindowShouldClose()) {
            frame_tick(app);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        status = 1;
    }

    cleanup_app_font();
    CloseWindow();
    return status;
}
