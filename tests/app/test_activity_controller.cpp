#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "app/ActivityController.hpp"
#include "utils/test_doubles.hpp"

using namespace std::chrono_literals;
using app::ActivityController;

namespace {

ipc::LogEvent logLine(const std::string& content, bool is_error = false)
{
    return ipc::LogEvent{ "log", content, is_error };
}

struct ControllerFixture {
    test_utils::RecordingEngine engine;
    test_utils::ManualClock clock;
    ActivityController controller{ engine };

    void event(const std::string& content, bool is_error = false)
    {
        controller.handleEvent(logLine(content, is_error), clock.now());
    }

    void advance(std::chrono::milliseconds ms)
    {
        clock.advance(ms);
        controller.update(clock.now());
    }
};

} // namespace

TEST_CASE("Non-log events are ignored", "[activity]")
{
    ControllerFixture fx;
    fx.controller.handleEvent(ipc::LogEvent{ "heartbeat", "🧠", false }, fx.clock.now());
    REQUIRE(fx.controller.eventCount() == 0);
    REQUIRE(fx.engine.pulses.empty());
    REQUIRE(fx.engine.working.empty());
}

TEST_CASE("Every log event pulses in its palette color", "[activity]")
{
    ControllerFixture fx;
    fx.event("plain text without symbols");
    fx.event("🔍 looking something up");

    REQUIRE(fx.controller.eventCount() == 2);
    REQUIRE(fx.engine.pulses.size() == 2);
    REQUIRE(fx.engine.pulses[0].has_value());
    REQUIRE(fx.engine.pulses[0]->toRgb() == processing::kDefaultAccentColor);
    REQUIRE(fx.engine.pulses[1]->toRgb() == 0xffaa00);
}

TEST_CASE("Working symbols drive the engine busy until the idle symbol", "[activity]")
{
    ControllerFixture fx;
    fx.event("⚙️ compiling");

    REQUIRE(fx.engine.lastWorking());
    REQUIRE(fx.engine.lastWaiting());
    REQUIRE(fx.controller.busy());
    REQUIRE(fx.controller.badge().symbol == "⚙️");
    REQUIRE(fx.controller.badge().working);
    REQUIRE(fx.controller.badge().color == 0x00ff9d);

    fx.event("✅ done");
    REQUIRE_FALSE(fx.engine.lastWorking());
    REQUIRE_FALSE(fx.engine.lastWaiting());
    REQUIRE_FALSE(fx.controller.busy());
    REQUIRE(fx.controller.badge().symbol == "✅");
    REQUIRE_FALSE(fx.controller.badge().working);
}

TEST_CASE("Working state times out without further activity", "[activity]")
{
    ControllerFixture fx;
    fx.event("📡 fetching");
    REQUIRE(fx.controller.busy());

    fx.advance(59s);
    REQUIRE(fx.controller.busy());

    SECTION("new working activity extends the timeout")
    {
        fx.event("🚀 deploying");
        fx.advance(2s);
        REQUIRE(fx.controller.busy());
    }

    SECTION("silence goes idle")
    {
        fx.advance(1s);
        REQUIRE_FALSE(fx.controller.busy());
        REQUIRE_FALSE(fx.engine.lastWorking());
    }
}

TEST_CASE("Alert symbols and error events spike", "[activity]")
{
    ControllerFixture fx;
    fx.event("🔥 something is burning");
    REQUIRE(fx.engine.spikes == 1);

    fx.event("plain failure", true);
    REQUIRE(fx.engine.spikes == 2);

    fx.event("❌ aborted", true);
    REQUIRE(fx.engine.spikes == 4);
    REQUIRE_FALSE(fx.engine.lastWorking());
}

TEST_CASE("Neutral symbols leave the busy state alone", "[activity]")
{
    ControllerFixture fx;
    fx.event("🧠 thinking");
    std::size_t calls = fx.engine.working.size();

    fx.event("🔧 adjusting");
    REQUIRE(fx.engine.working.size() == calls);
    REQUIRE(fx.controller.busy());
    REQUIRE(fx.controller.badge().symbol == "🔧");
}

TEST_CASE("Badge flashes and fades out", "[activity]")
{
    ControllerFixture fx;
    fx.event("😴 resting");

    REQUIRE(fx.controller.badge().scale == Catch::Approx(ActivityController::kFlashScale));
    REQUIRE(fx.controller.badge().opacity == 1.0f);

    fx.advance(ActivityController::kFlashDuration);
    REQUIRE(fx.controller.badge().scale == 1.0f);

    fx.advance(ActivityController::kIdleBadgeHold - ActivityController::kFlashDuration + 150ms);
    REQUIRE(fx.controller.badge().opacity == Catch::Approx(0.5f));
    REQUIRE(fx.controller.badge().symbol == "😴");

    fx.advance(150ms);
    REQUIRE(fx.controller.badge().symbol.empty());
    REQUIRE(fx.controller.badge().opacity == 0.0f);
}

TEST_CASE("Working badge does not flash", "[activity]")
{
    ControllerFixture fx;
    fx.event("🧠 planning");
    fx.advance(ActivityController::kFlashDuration);
    REQUIRE(fx.controller.badge().scale == 1.0f);

    fx.event("more output without a symbol");
    REQUIRE(fx.controller.badge().scale == 1.0f);
}

TEST_CASE("Planner monologue becomes a caption with a small pulse", "[activity]")
{
    ControllerFixture fx;
    fx.event("PLANNER MONOLOGUE:   I should check the tests first  ");

    REQUIRE(fx.engine.small_pulses == 1);
    REQUIRE(fx.engine.pulses.empty());
    REQUIRE(fx.controller.caption().visible);
    REQUIRE(fx.controller.caption().text == "I should check the tests first");

    fx.advance(ActivityController::kCaptionHold);
    REQUIRE_FALSE(fx.controller.caption().visible);
}

TEST_CASE("Monologue extraction", "[activity]")
{
    REQUIRE(ActivityController::extractMonologue("x PLANNER MONOLOGUE : go") == std::optional<std::string>("go"));
    REQUIRE_FALSE(ActivityController::extractMonologue("PLANNER MONOLOGUE:").has_value());
    REQUIRE_FALSE(ActivityController::extractMonologue("PLANNER MONOLOGUE:    ").has_value());
    REQUIRE_FALSE(ActivityController::extractMonologue("planner monologue: lower").has_value());
    REQUIRE(ActivityController::mentionsMonologue("PLANNER MONOLOGUE"));
}

TEST_CASE("Chat turns own the busy state while they run", "[activity]")
{
    ControllerFixture fx;
    fx.controller.beginTurn(fx.clock.now());

    REQUIRE(fx.controller.turnActive());
    REQUIRE(fx.engine.lastWorking());
    REQUIRE(fx.controller.badge().symbol == ActivityController::kTurnSymbol);

    SECTION("idle symbols during a turn do not stop it")
    {
        fx.event("💤 background job sleeping");
        REQUIRE(fx.engine.lastWorking());
        fx.advance(2min);
        REQUIRE(fx.controller.busy());
        REQUIRE(fx.controller.badge().opacity == 1.0f);
    }

    SECTION("ending the turn shows the done badge then fades")
    {
        fx.controller.endTurn(fx.clock.now());
        REQUIRE_FALSE(fx.controller.turnActive());
        REQUIRE_FALSE(fx.engine.lastWorking());
        REQUIRE(fx.controller.badge().symbol == ActivityController::kDoneSymbol);

        fx.advance(ActivityController::kIdleBadgeHold + ActivityController::kBadgeFade);
        REQUIRE(fx.controller.badge().symbol.empty());
    }

    SECTION("turn errors spike")
    {
        fx.controller.reportTurnError();
        REQUIRE(fx.engine.spikes == 1);
    }
}

TEST_CASE("A swapped engine is brought back to the current state", "[activity]")
{
    ControllerFixture fx;
    fx.controller.beginTurn(fx.clock.now());
    fx.engine.working.clear();

    fx.controller.syncEngine();
    REQUIRE(fx.engine.lastWorking());

    fx.controller.endTurn(fx.clock.now());
    fx.controller.syncEngine();
    REQUIRE_FALSE(fx.engine.lastWorking());
}
