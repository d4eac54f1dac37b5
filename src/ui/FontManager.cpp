#include "FontManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <array>
#include <filesystem>
#include <string>

namespace
{
    constexpr float kBadgeScale = 2.0f;

    constexpr std::array<const char*, 6> kTextFontCandidates = {
        "assets/fonts/Inter-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/Library/Fonts/Arial Unicode.ttf",
        "C:/Windows/Fonts/segoeui.ttf"
    };

    // Monochrome outlines only; the atlas cannot hold color bitmaps
    constexpr std::array<const char*, 5> kSymbolFontCandidates = {
        "assets/fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/noto/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/ancient-scripts/Symbola_hint.ttf",
        "C:/Windows/Fonts/seguisym.ttf"
    };
}

ImFont* FontManager::loadFirst(const char* const* candidates, std::size_t count, float size, bool merge)
{
    ImGuiIO& io = ImGui::GetIO();
    for (std::size_t i = 0; i < count; ++i)
    {
        const char* path = candidates[i];
        if (!std::filesystem::exists(path))
            continue;

        ImFontConfig config;
        config.OversampleH = 2;
        config.OversampleV = 2;
        config.MergeMode = merge;
        if (ImFont* font = io.Fonts->AddFontFromFileTTF(path, size, &config))
        {
            PLOG_INFO << "Loaded " << (merge ? "symbol" : "text") << " font: " << path;
            return font;
        }
        PLOG_WARNING << "Failed to load font: " << path;
    }
    return nullptr;
}

bool FontManager::load(float size)
{
    ImGuiIO& io = ImGui::GetIO();
    io.Fonts->Clear();

    text_font_ = loadFirst(kTextFontCandidates.data(), kTextFontCandidates.size(), size, false);
    has_custom_font_ = text_font_ != nullptr;
    if (!text_font_)
    {
        PLOG_WARNING << "No text font found, using the ImGui default font";
        text_font_ = io.Fonts->AddFontDefault();
    }
    has_symbol_font_ = loadFirst(kSymbolFontCandidates.data(), kSymbolFontCandidates.size(), size, true) != nullptr;

    // Second, larger face for the badge, with its own symbol merge
    badge_font_ = loadFirst(kTextFontCandidates.data(), kTextFontCandidates.size(), size * kBadgeScale, false);
    if (badge_font_)
        loadFirst(kSymbolFontCandidates.data(), kSymbolFontCandidates.size(), size * kBadgeScale, true);
    else
        badge_font_ = text_font_;

    if (!has_symbol_font_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Activity symbols may not display",
                                            "No symbol font found; install Noto Emoji or place NotoEmoji-Regular.ttf "
                                            "under assets/fonts");
    }

    io.FontDefault = text_font_;
    return has_custom_font_;
}
