#include <catch2/catch_test_macros.hpp>

#include "processing/SignalClassifier.hpp"

#include <string>

using processing::PaletteGroup;
using processing::SignalCategory;

TEST_CASE("Known symbols classify by table", "[signal_classifier]")
{
    auto brain = processing::classify("🧠 planning the next step");
    REQUIRE(brain.hasSymbol());
    REQUIRE(brain.symbol == "🧠");
    REQUIRE(brain.category == SignalCategory::Working);
    REQUIRE(brain.group == PaletteGroup::Thinking);
    REQUIRE(brain.color == 0x00f3ff);
    REQUIRE_FALSE(brain.alert);

    auto stop = processing::classify("🛑 halted");
    REQUIRE(stop.category == SignalCategory::Idle);
    REQUIRE(stop.alert);
    REQUIRE(stop.color == 0xff2a2a);

    auto wrench = processing::classify("🔧 tweaking config");
    REQUIRE(wrench.category == SignalCategory::None);
    REQUIRE(wrench.group == PaletteGroup::Build);

    auto sleep = processing::classify("💤");
    REQUIRE(sleep.category == SignalCategory::Idle);
    REQUIRE(sleep.color == 0xffffff);
}

TEST_CASE("Variation selector does not change the classification", "[signal_classifier]")
{
    auto bare = processing::classify("⚙ gear");
    auto selected = processing::classify("⚙️ gear");

    REQUIRE(bare.code_point == selected.code_point);
    REQUIRE(bare.category == SignalCategory::Working);
    REQUIRE(selected.category == SignalCategory::Working);
    REQUIRE(bare.symbol == "⚙");
    REQUIRE(selected.symbol == "⚙️");

    auto warning = processing::classify("⚠️ careful");
    REQUIRE(warning.alert);
    REQUIRE(warning.category == SignalCategory::None);
}

TEST_CASE("Only the first pictograph counts", "[signal_classifier]")
{
    auto cls = processing::classify("step 3: 🔍 then ✅");
    REQUIRE(cls.symbol == "🔍");
    REQUIRE(cls.category == SignalCategory::Working);
}

TEST_CASE("Text without a known symbol uses the default accent", "[signal_classifier]")
{
    auto none = processing::classify("plain text, no symbols");
    REQUIRE_FALSE(none.hasSymbol());
    REQUIRE(none.symbol.empty());
    REQUIRE(none.category == SignalCategory::None);
    REQUIRE(none.color == processing::kDefaultAccentColor);

    auto unknown = processing::classify("🦄 unknown creature");
    REQUIRE(unknown.hasSymbol());
    REQUIRE(unknown.symbol == "🦄");
    REQUIRE(unknown.category == SignalCategory::None);
    REQUIRE(unknown.group == PaletteGroup::Default);
    REQUIRE(unknown.color == processing::kDefaultAccentColor);

    REQUIRE(processing::classify("").color == processing::kDefaultAccentColor);
}

TEST_CASE("Invalid UTF-8 is skipped", "[signal_classifier]")
{
    std::string text = "\xff\xfe broken ";
    text += "🚀";
    auto cls = processing::classify(text);
    REQUIRE(cls.symbol == "🚀");
    REQUIRE(cls.group == PaletteGroup::Network);

    REQUIRE_FALSE(processing::classify("\xc3").hasSymbol());
}

TEST_CASE("Every table entry is a pictograph that classifies to itself", "[signal_classifier]")
{
    for (const auto& entry : processing::kSignalTable) {
        REQUIRE(processing::isExtendedPictographic(entry.code_point));
        REQUIRE(processing::findSignal(entry.code_point) == &entry);
    }
    REQUIRE_FALSE(processing::isExtendedPictographic(U'a'));
    REQUIRE(std::string(processing::categoryName(SignalCategory::Working)) == "working");
}
