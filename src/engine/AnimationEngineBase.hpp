#pragma once

#include "IAnimationEngine.hpp"
#include "DebouncedStateMachine.hpp"
#include "FrameScheduler.hpp"

#include <chrono>

namespace engine
{

// Shared lifecycle for the engine variants: container checks, frame
// registration, state machine ownership. Variants fill in the hooks.
class AnimationEngineBase : public IAnimationEngine
{
public:
    AnimationEngineBase(const EngineContext& ctx, std::chrono::milliseconds activation_delay, SmoothingRates rates);
    ~AnimationEngineBase() override;

    bool init() override;
    void destroy() override;
    bool isInitialized() const override { return initialized_; }

    void setWorkingState(bool active) override;
    void setWaitingState(bool active) override;
    void triggerSpike() override;
    void updateSphereColor(const Color& color) override;

    const ControlState& controlState() const override { return machine_.state(); }
    const DebouncedStateMachine& stateMachine() const { return machine_; }

    // One display refresh: timers, simulation step, redraw into the canvas.
    void advanceFrame(TimePoint now);

protected:
    virtual void onInit() = 0;
    virtual void onDestroy() = 0;
    virtual void step(TimePoint now) = 0;
    virtual void render(Canvas& canvas) = 0;

    TimePoint now() const { return clock_(); }

    DebouncedStateMachine machine_;
    Canvas* canvas_ = nullptr;
    std::uint32_t seed_ = 0;

private:
    void releaseFrame();

    FrameScheduler* scheduler_ = nullptr;
    FrameScheduler::Handle frame_handle_ = FrameScheduler::kInvalidHandle;
    ClockFn clock_;
    bool initialized_ = false;
};

} // namespace engine
