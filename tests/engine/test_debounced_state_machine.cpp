#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/DebouncedStateMachine.hpp"

using namespace std::chrono_literals;
using engine::ActivationPhase;
using engine::DebouncedStateMachine;

namespace {
engine::TimePoint at(int ms) { return engine::TimePoint{ std::chrono::milliseconds(ms) }; }
} // namespace

TEST_CASE("Working activation waits for the delay", "[state_machine]")
{
    DebouncedStateMachine sm(500ms, engine::SmoothingRates{});

    sm.setWorking(true, at(0));
    REQUIRE(sm.workingPhase() == ActivationPhase::Pending);
    REQUIRE(sm.state().working.target == 0.0f);

    sm.update(at(499));
    REQUIRE(sm.state().working.target == 0.0f);
    REQUIRE(sm.hasPendingActivation());

    sm.update(at(500));
    REQUIRE(sm.state().working.target == 1.0f);
    REQUIRE(sm.workingPhase() == ActivationPhase::Active);
    REQUIRE_FALSE(sm.workingDeadline().has_value());
}

TEST_CASE("Repeated activation requests keep the first deadline", "[state_machine]")
{
    DebouncedStateMachine sm(500ms, engine::SmoothingRates{});

    sm.setWaiting(true, at(0));
    sm.setWaiting(true, at(300));
    sm.setWaiting(true, at(450));
    REQUIRE(sm.waitingDeadline() == at(500));

    sm.update(at(500));
    REQUIRE(sm.state().waiting.target == 1.0f);

    SECTION("requests while active are ignored")
    {
        sm.setWaiting(true, at(600));
        REQUIRE(sm.waitingPhase() == ActivationPhase::Active);
        REQUIRE_FALSE(sm.waitingDeadline().has_value());
    }
}

TEST_CASE("Deactivation is immediate and cancels a pending activation", "[state_machine]")
{
    DebouncedStateMachine sm(2000ms, engine::SmoothingRates{});

    SECTION("cancel while pending")
    {
        sm.setWorking(true, at(0));
        sm.setWorking(false, at(100));
        REQUIRE(sm.workingPhase() == ActivationPhase::Idle);

        sm.update(at(5000));
        REQUIRE(sm.state().working.target == 0.0f);
    }

    SECTION("drop while active")
    {
        sm.setWorking(true, at(0));
        sm.update(at(2000));
        REQUIRE(sm.state().working.target == 1.0f);

        sm.setWorking(false, at(2100));
        REQUIRE(sm.state().working.target == 0.0f);
    }

    SECTION("a fresh request after cancel arms a new deadline")
    {
        sm.setWorking(true, at(0));
        sm.setWorking(false, at(100));
        sm.setWorking(true, at(1000));
        REQUIRE(sm.workingDeadline() == at(3000));
    }
}

TEST_CASE("Spike resets two seconds after the latest trigger", "[state_machine]")
{
    DebouncedStateMachine sm(500ms, engine::SmoothingRates{});

    sm.triggerSpike(at(0));
    REQUIRE(sm.state().error.target == 1.0f);

    SECTION("single trigger")
    {
        sm.update(at(1999));
        REQUIRE(sm.state().error.target == 1.0f);
        sm.update(at(2000));
        REQUIRE(sm.state().error.target == 0.0f);
        REQUIRE_FALSE(sm.spikeResetDeadline().has_value());
    }

    SECTION("overlapping triggers")
    {
        sm.triggerSpike(at(1500));
        sm.update(at(2000));
        REQUIRE(sm.state().error.target == 1.0f);
        sm.update(at(3500));
        REQUIRE(sm.state().error.target == 0.0f);
    }
}

TEST_CASE("Smoothing uses rise, fall and error rates", "[state_machine]")
{
    DebouncedStateMachine sm(0ms, engine::SmoothingRates{ 0.05f, 0.02f, 0.08f });
    auto& s = sm.state();

    s.working.target = 1.0f;
    s.error.target = 1.0f;
    sm.smooth();
    REQUIRE(s.working.current == Catch::Approx(0.05f));
    REQUIRE(s.error.current == Catch::Approx(0.08f));

    s.working.current = 1.0f;
    s.working.target = 0.0f;
    s.error.current = 1.0f;
    s.error.target = 0.0f;
    sm.smooth();
    REQUIRE(s.working.current == Catch::Approx(0.98f));
    REQUIRE(s.error.current == Catch::Approx(0.92f));
}

TEST_CASE("Reset clears gates, deadlines and channels", "[state_machine]")
{
    DebouncedStateMachine sm(500ms, engine::SmoothingRates{});
    sm.setWorking(true, at(0));
    sm.triggerSpike(at(0));
    sm.state().spike.current = 0.7f;

    sm.reset();
    REQUIRE(sm.workingPhase() == ActivationPhase::Idle);
    REQUIRE_FALSE(sm.spikeResetDeadline().has_value());
    REQUIRE(sm.state().error.target == 0.0f);
    REQUIRE(sm.state().spike.current == 0.0f);
}
