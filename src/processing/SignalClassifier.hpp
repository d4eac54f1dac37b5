#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace processing
{

enum class SignalCategory
{
    None,    // neither activates nor deactivates
    Working, // requests working + waiting
    Idle     // terminal symbol, clears activity
};

// Palette groups in lookup priority order. A code point belongs to at most
// one group; the order only matters for documentation of the colors.
enum class PaletteGroup
{
    Thinking,
    Build,
    Lookup,
    Network,
    Alert,
    Rest,
    Default
};

struct SignalEntry
{
    char32_t code_point;
    SignalCategory category;
    bool alert;
    PaletteGroup group;
};

struct SignalClassification
{
    std::string symbol;        // UTF-8, includes a trailing U+FE0F if the text had one
    char32_t code_point = 0;   // 0 when no pictograph was found
    SignalCategory category = SignalCategory::None;
    bool alert = false;
    PaletteGroup group = PaletteGroup::Default;
    std::uint32_t color = 0;   // 0xRRGGBB

    bool hasSymbol() const { return code_point != 0; }
};

constexpr std::uint32_t kDefaultAccentColor = 0xbd00ff;

constexpr std::uint32_t paletteColor(PaletteGroup group)
{
    switch (group)
    {
    case PaletteGroup::Thinking:
        return 0x00f3ff;
    case PaletteGroup::Build:
        return 0x00ff9d;
    case PaletteGroup::Lookup:
        return 0xffaa00;
    case PaletteGroup::Network:
        return 0x1e90ff;
    case PaletteGroup::Alert:
        return 0xff2a2a;
    case PaletteGroup::Rest:
        return 0xffffff;
    case PaletteGroup::Default:
        break;
    }
    return kDefaultAccentColor;
}

// Every symbol the agent is known to emit. Keyed by the base code point so
// that U+2699 and U+2699 U+FE0F classify the same.
inline constexpr std::array<SignalEntry, 29> kSignalTable{ {
    { U'\U0001F9E0', SignalCategory::Working, false, PaletteGroup::Thinking }, // brain
    { U'\U0001F4A1', SignalCategory::Working, false, PaletteGroup::Thinking }, // light bulb
    { U'\U0001F52E', SignalCategory::Working, false, PaletteGroup::Thinking }, // crystal ball
    { U'\U0001F9EC', SignalCategory::Working, false, PaletteGroup::Thinking }, // dna
    { U'\U0001F9E9', SignalCategory::Working, false, PaletteGroup::Thinking }, // puzzle piece

    { U'\u2705', SignalCategory::Idle, false, PaletteGroup::Build }, // check mark
    { U'\U0001F527', SignalCategory::None, false, PaletteGroup::Build }, // wrench
    { U'\U0001F528', SignalCategory::Working, false, PaletteGroup::Build }, // hammer
    { U'\u2699', SignalCategory::Working, false, PaletteGroup::Build }, // gear
    { U'\U0001F6E1', SignalCategory::Working, false, PaletteGroup::Build }, // shield
    { U'\U0001F513', SignalCategory::Working, false, PaletteGroup::Build }, // unlocked

    { U'\U0001F50D', SignalCategory::Working, false, PaletteGroup::Lookup }, // magnifier
    { U'\U0001F4BE', SignalCategory::Working, false, PaletteGroup::Lookup }, // floppy disk
    { U'\U0001F4C8', SignalCategory::Working, false, PaletteGroup::Lookup }, // chart increasing
    { U'\U0001F4CA', SignalCategory::Working, false, PaletteGroup::Lookup }, // bar chart
    { U'\U0001F4CB', SignalCategory::Working, false, PaletteGroup::Lookup }, // clipboard
    { U'\U0001F511', SignalCategory::Working, false, PaletteGroup::Lookup }, // key

    { U'\U0001F4E1', SignalCategory::Working, false, PaletteGroup::Network }, // satellite antenna
    { U'\u26A1', SignalCategory::Working, false, PaletteGroup::Network }, // high voltage
    { U'\U0001F680', SignalCategory::Working, false, PaletteGroup::Network }, // rocket
    { U'\U0001F52D', SignalCategory::Working, false, PaletteGroup::Network }, // telescope

    { U'\u274C', SignalCategory::Idle, true, PaletteGroup::Alert }, // cross mark
    { U'\U0001F6D1', SignalCategory::Idle, true, PaletteGroup::Alert }, // stop sign
    { U'\u26A0', SignalCategory::None, true, PaletteGroup::Alert }, // warning
    { U'\U0001F525', SignalCategory::None, true, PaletteGroup::Alert }, // fire

    { U'\U0001F634', SignalCategory::Idle, false, PaletteGroup::Rest }, // sleeping face
    { U'\U0001F4A4', SignalCategory::Idle, false, PaletteGroup::Rest }, // zzz
    { U'\U0001FA7A', SignalCategory::Working, false, PaletteGroup::Rest }, // stethoscope
    { U'\U0001F52C', SignalCategory::Working, false, PaletteGroup::Rest }, // microscope
} };

constexpr bool signalTableIsUnique()
{
    for (std::size_t i = 0; i < kSignalTable.size(); ++i)
        for (std::size_t j = i + 1; j < kSignalTable.size(); ++j)
            if (kSignalTable[i].code_point == kSignalTable[j].code_point)
                return false;
    return true;
}

static_assert(signalTableIsUnique(), "duplicate code point in kSignalTable");

constexpr const SignalEntry* findSignal(char32_t cp)
{
    for (const auto& entry : kSignalTable)
    {
        if (entry.code_point == cp)
            return &entry;
    }
    return nullptr;
}

// First Extended_Pictographic code point in text. Sets symbol to its UTF-8
// bytes plus a directly following U+FE0F. Returns 0 when none is present.
// Invalid UTF-8 bytes are skipped.
char32_t extractSymbol(std::string_view text, std::string* symbol = nullptr);

bool isExtendedPictographic(char32_t cp);

// Pure and total: text without a known pictograph yields category None and
// the default accent color.
SignalClassification classify(std::string_view text);

const char* categoryName(SignalCategory category);

} // namespace processing
