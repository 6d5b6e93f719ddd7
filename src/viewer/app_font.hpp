/// @file app_font.hpp
/// @brief Viewer-wide font loading and text drawing helpers.

#pragma once

#include <raylib.h>

namespace tapeboard {

/// Loads the viewer font. Must be called after InitWindow().
/// Tries resources/fonts/Hack-Regular.ttf, then the system copy, then falls back to the
/// raylib default bitmap font.
void init_app_font();

/// Safe to call when loading failed. Call before CloseWindow().
void cleanup_app_font();

Font get_app_font();

/// DrawText() with the app font
void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color);

/// MeasureText() with the app font
int MeasureAppText(const char* text, int fontSize);

} // namespace tapeboard
