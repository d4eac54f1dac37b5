#pragma once

#include <imgui.h>

// Builds the shared atlas: a text font with a symbol font merged into it so
// activity pictographs have glyphs.
class FontManager
{
public:
    // Call once after the ImGui context exists, before the first frame
    bool load(float size);

    ImFont* textFont() const { return text_font_; }
    ImFont* badgeFont() const { return badge_font_; }
    bool hasCustomFont() const { return has_custom_font_; }
    bool hasSymbolFont() const { return has_symbol_font_; }

private:
    ImFont* loadFirst(const char* const* candidates, std::size_t count, float size, bool merge);

    ImFont* text_font_ = nullptr;
    ImFont* badge_font_ = nullptr;
    bool has_custom_font_ = false;
    bool has_symbol_font_ = false;
};
