#pragma once

#include "Clock.hpp"
#include "Color.hpp"
#include "ControlState.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace engine
{

class Canvas;
class FrameScheduler;

enum class EngineKind
{
    Graph = 0,
    Surface = 1
};

const char* engineKindName(EngineKind kind);

struct EngineContext
{
    Canvas* canvas = nullptr;             // the container; nullptr means no drawing surface
    FrameScheduler* scheduler = nullptr;  // display-refresh registry
    ClockFn clock;                        // defaults to steady_clock when empty
    std::uint32_t seed = 0;               // 0 = nondeterministic
    int surface_subdivisions = 4;
};

// Lifecycle and control surface shared by every indicator engine. Callers
// never see which variant is behind it.
class IAnimationEngine
{
public:
    virtual ~IAnimationEngine() = default;

    // Sizes to the container and registers the frame callback. Returns false
    // (and logs) when there is nothing to draw into; never throws.
    virtual bool init() = 0;
    // Cancels the frame registration and drops geometry. Safe to repeat.
    virtual void destroy() = 0;
    virtual bool isInitialized() const = 0;

    virtual void setWorkingState(bool active) = 0;
    virtual void setWaitingState(bool active) = 0;
    virtual void triggerSpike() = 0;
    virtual void triggerPulse(std::optional<Color> color = std::nullopt) = 0;
    virtual void triggerSmallPulse() = 0;
    virtual void triggerNextColor() = 0;
    virtual void updateSphereColor(const Color& color) = 0;

    virtual const char* name() const = 0;
    virtual const ControlState& controlState() const = 0;
};

std::unique_ptr<IAnimationEngine> createEngine(EngineKind kind, const EngineContext& ctx);

} // namespace engine
