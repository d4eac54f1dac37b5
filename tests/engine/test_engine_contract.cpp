#include <catch2/catch_test_macros.hpp>

#include "engine/AnimationEngineBase.hpp"
#include "engine/Canvas.hpp"
#include "engine/EngineHost.hpp"
#include "engine/FrameScheduler.hpp"
#include "engine/GraphEngine.hpp"
#include "engine/SurfaceEngine.hpp"
#include "utils/test_doubles.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using engine::EngineKind;

namespace {

struct EngineFixture {
    engine::Canvas canvas;
    engine::FrameScheduler scheduler;
    test_utils::ManualClock clock;

    engine::EngineContext context(bool with_canvas = true)
    {
        engine::EngineContext ctx;
        ctx.canvas = with_canvas ? &canvas : nullptr;
        ctx.scheduler = &scheduler;
        ctx.clock = clock.fn();
        ctx.seed = 1234;
        ctx.surface_subdivisions = 2;
        return ctx;
    }

    void frame(std::chrono::milliseconds step = 16ms)
    {
        clock.advance(step);
        scheduler.tick(clock.now());
    }
};

std::chrono::milliseconds delayOf(EngineKind kind)
{
    return kind == EngineKind::Graph ? engine::GraphEngine::kActivationDelay : engine::SurfaceEngine::kActivationDelay;
}

} // namespace

TEST_CASE("Engines without a canvas stay idle and ignore triggers", "[engine]")
{
    for (EngineKind kind : { EngineKind::Graph, EngineKind::Surface }) {
        EngineFixture fx;
        auto eng = engine::createEngine(kind, fx.context(false));
        REQUIRE(eng);

        REQUIRE_FALSE(eng->init());
        REQUIRE_FALSE(eng->isInitialized());
        REQUIRE(fx.scheduler.size() == 0);

        eng->setWorkingState(true);
        eng->triggerSpike();
        eng->triggerPulse();
        eng->triggerSmallPulse();
        eng->triggerNextColor();
        REQUIRE(eng->controlState().error.target == 0.0f);
        REQUIRE(eng->controlState().working.target == 0.0f);

        eng->destroy();
        eng->destroy();
        REQUIRE_FALSE(eng->isInitialized());
    }
}

TEST_CASE("Engine lifecycle registers and releases one frame callback", "[engine]")
{
    for (EngineKind kind : { EngineKind::Graph, EngineKind::Surface }) {
        EngineFixture fx;
        fx.canvas.resize(400.0f, 300.0f);
        auto eng = engine::createEngine(kind, fx.context());

        REQUIRE(eng->init());
        REQUIRE(eng->init());
        REQUIRE(fx.scheduler.size() == 1);

        fx.frame();
        REQUIRE(fx.canvas.triangleCount() > 0);

        eng->destroy();
        REQUIRE(fx.scheduler.size() == 0);
        REQUIRE(fx.canvas.triangleCount() == 0);

        eng->destroy();
        REQUIRE(fx.scheduler.size() == 0);

        // Re-init after destroy
        REQUIRE(eng->init());
        REQUIRE(fx.scheduler.size() == 1);
    }
}

TEST_CASE("Engines tolerate a zero-size container", "[engine]")
{
    EngineFixture fx;
    auto eng = engine::createEngine(EngineKind::Graph, fx.context());

    REQUIRE(eng->init());
    fx.frame();
    REQUIRE(fx.canvas.triangleCount() == 0);

    fx.canvas.resize(200.0f, 200.0f);
    fx.frame();
    REQUIRE(fx.canvas.triangleCount() > 0);
}

TEST_CASE("Working state activates after the variant delay", "[engine]")
{
    for (EngineKind kind : { EngineKind::Graph, EngineKind::Surface }) {
        EngineFixture fx;
        fx.canvas.resize(300.0f, 300.0f);
        auto eng = engine::createEngine(kind, fx.context());
        REQUIRE(eng->init());

        const auto delay = delayOf(kind);
        eng->setWorkingState(true);
        eng->setWaitingState(true);

        fx.frame(delay - 1ms);
        REQUIRE(eng->controlState().working.target == 0.0f);
        REQUIRE(eng->controlState().waiting.target == 0.0f);

        fx.frame(1ms);
        REQUIRE(eng->controlState().working.target == 1.0f);
        REQUIRE(eng->controlState().waiting.target == 1.0f);
        REQUIRE(eng->controlState().working.current > 0.0f);

        eng->setWorkingState(false);
        REQUIRE(eng->controlState().working.target == 0.0f);
    }
}

TEST_CASE("Cancelling before the delay never activates", "[engine]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    auto eng = engine::createEngine(EngineKind::Surface, fx.context());
    REQUIRE(eng->init());

    eng->setWorkingState(true);
    fx.frame(1000ms);
    eng->setWorkingState(false);
    fx.frame(5000ms);
    REQUIRE(eng->controlState().working.target == 0.0f);
    REQUIRE(eng->controlState().working.current == 0.0f);
}

TEST_CASE("Spike raises error and clears two seconds later", "[engine]")
{
    for (EngineKind kind : { EngineKind::Graph, EngineKind::Surface }) {
        EngineFixture fx;
        fx.canvas.resize(300.0f, 300.0f);
        auto eng = engine::createEngine(kind, fx.context());
        REQUIRE(eng->init());

        eng->triggerSpike();
        REQUIRE(eng->controlState().error.target == 1.0f);

        fx.frame(1000ms);
        REQUIRE(eng->controlState().error.target == 1.0f);
        REQUIRE(eng->controlState().error.current > 0.0f);

        fx.frame(1000ms);
        REQUIRE(eng->controlState().error.target == 0.0f);
    }
}

TEST_CASE("Graph engine spike suppresses edges", "[engine][graph]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::GraphEngine graph(fx.context());
    REQUIRE(graph.init());

    fx.frame();
    REQUIRE_FALSE(graph.field()->edges().empty());

    graph.triggerSpike();
    for (int i = 0; i < 30; ++i)
        fx.frame();
    REQUIRE(graph.controlState().error.current > 0.5f);
    REQUIRE(graph.field()->edges().empty());
}

TEST_CASE("Graph engine spike follows activity and error", "[engine][graph]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::GraphEngine graph(fx.context());
    REQUIRE(graph.init());

    fx.frame();
    REQUIRE(graph.controlState().spike.target == 0.0f);

    graph.setWorkingState(true);
    fx.frame(engine::GraphEngine::kActivationDelay);
    for (int i = 0; i < 300; ++i)
        fx.frame();
    float busy = graph.controlState().spike.current;
    REQUIRE(busy > 0.3f);
    REQUIRE(busy <= engine::GraphEngine::kActiveSpike + 1e-4f);

    graph.triggerSpike();
    for (int i = 0; i < 60; ++i)
        fx.frame();
    REQUIRE(graph.controlState().spike.target == 1.0f);
    REQUIRE(graph.controlState().spike.current > busy);
}

TEST_CASE("Graph engine shape speed is rate limited", "[engine][graph]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::GraphEngine graph(fx.context());
    REQUIRE(graph.init());

    graph.setWorkingState(true);
    fx.frame(engine::GraphEngine::kActivationDelay);

    float previous = graph.controlState().shapeSpeed.current;
    for (int i = 0; i < 60; ++i) {
        fx.frame();
        float now = graph.controlState().shapeSpeed.current;
        REQUIRE(now - previous <= engine::GraphEngine::kMaxShapeSpeedStep + 1e-6f);
        REQUIRE(now >= previous);
        previous = now;
    }
    REQUIRE(previous > engine::GraphEngine::kIdleShapeSpeed);
}

TEST_CASE("Graph triggers adjust pulse and palette cursor", "[engine][graph]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::GraphEngine graph(fx.context());
    REQUIRE(graph.init());

    graph.triggerPulse(engine::Color::fromRgb(0xff2a2a));
    REQUIRE(graph.pulse() == 1.0f);
    fx.frame();
    REQUIRE(graph.pulse() < 1.0f);

    graph.triggerNextColor();
    REQUIRE(graph.controlState().colorBlend.target == 1.0f);
}

TEST_CASE("Surface pulses are transient boosts", "[engine][surface]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::SurfaceEngine surface(fx.context());
    REQUIRE(surface.init());

    surface.triggerPulse();
    surface.triggerSmallPulse();
    REQUIRE(surface.pulseBoost() > 0.49f);

    float spike_before = surface.controlState().spike.current;
    for (int i = 0; i < 400; ++i)
        fx.frame();
    REQUIRE(surface.pulseBoost() == 0.0f);
    REQUIRE(surface.controlState().spike.current < spike_before + 0.5f);
}

TEST_CASE("EngineHost swaps engines without leaking registrations", "[engine][host]")
{
    EngineFixture fx;
    fx.canvas.resize(300.0f, 300.0f);
    engine::EngineHost host(fx.context());

    REQUIRE(std::string(host.name()) == "none");
    host.triggerSpike();
    REQUIRE_FALSE(host.isInitialized());

    REQUIRE(host.swap(EngineKind::Graph));
    REQUIRE(std::string(host.name()) == "graph");
    REQUIRE(fx.scheduler.size() == 1);

    REQUIRE(host.swap(EngineKind::Surface));
    REQUIRE(std::string(host.name()) == "surface");
    REQUIRE(host.kind() == EngineKind::Surface);
    REQUIRE(fx.scheduler.size() == 1);

    host.destroy();
    REQUIRE(fx.scheduler.size() == 0);
}

TEST_CASE("EngineHost forwards the contract to the current engine", "[engine][host]")
{
    EngineFixture fx;
    test_utils::RecordingEngine* recorder = nullptr;
    engine::EngineHost host(fx.context(), [&](EngineKind, const engine::EngineContext&) {
        auto eng = std::make_unique<test_utils::RecordingEngine>();
        recorder = eng.get();
        return std::unique_ptr<engine::IAnimationEngine>(std::move(eng));
    });

    REQUIRE(host.swap(EngineKind::Graph));
    REQUIRE(recorder->initialized);

    host.setWorkingState(true);
    host.triggerPulse();
    host.triggerNextColor();
    REQUIRE(recorder->lastWorking());
    REQUIRE(recorder->pulses.size() == 1);
    REQUIRE(recorder->next_colors == 1);
}
