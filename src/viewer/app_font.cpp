/// @file app_font.cpp
/// @brief Loads and owns the viewer font.

#include "viewer/app_font.hpp"

#include <spdlog/spdlog.h>

namespace tapeboard {

namespace {

constexpr int FONT_BASE_SIZE = 48;
constexpr int FONT_GLYPHS = 256;

constexpr const char* FONT_PATHS[] = {
    "resources/fonts/Hack-Regular.ttf",
    "/usr/share/fonts/TTF/Hack-Regular.ttf",
    "/usr/share/fonts/truetype/hack/Hack-Regular.ttf",
};

bool g_font_loaded = false;
Font g_font = {};

bool try_load(const char* path) {
    if (!FileExists(path)) {
        return false;
    }
    g_font = LoadFontEx(path, FONT_BASE_SIZE, nullptr, FONT_GLYPHS);
    if (g_font.glyphCount <= 0) {
        return false;
    }
    SetTextureFilter(g_font.texture, TEXTURE_FILTER_BILINEAR);
    return true;
}

float spacing_for(int font_size) {
    return static_cast<float>(font_size) / 10.0f;
}

} // namespace

void init_app_font() {
    for (const char* path : FONT_PATHS) {
        if (try_load(path)) {
            g_font_loaded = true;
            spdlog::debug("[viewer] font {}", path);
            return;
        }
    }
    g_font = GetFontDefault();
    g_font_loaded = false;
    spdlog::info("[viewer] Hack font not found, using the raylib default font");
}

void cleanup_app_font() {
    if (g_font_loaded) {
        UnloadFont(g_font);
        g_font_loaded = false;
    }
}

Font get_app_font() {
    return g_font;
}

void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color) {
    DrawTextEx(g_font, text, {static_cast<float>(posX), static_cast<float>(posY)},
               static_cast<float>(fontSize), spacing_for(fontSize), color);
}

int MeasureAppText(const char* text, int fontSize) {
    Vector2 size = MeasureTextEx(g_font, text, static_cast<float>(fontSize), spacing_for(fontSize));
    return static_cast<int>(size.x);
}

} // namespace tapeboard
