#include "AnimationEngineBase.hpp"
#include "Canvas.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>
#include <random>

namespace engine
{

AnimationEngineBase::AnimationEngineBase(const EngineContext& ctx, std::chrono::milliseconds activation_delay,
                                         SmoothingRates rates)
    : machine_(activation_delay, rates)
    , canvas_(ctx.canvas)
    , seed_(ctx.seed)
    , scheduler_(ctx.scheduler)
    , clock_(ctx.clock ? ctx.clock : systemClock())
{
    if (seed_ == 0)
    {
        std::random_device rd;
        seed_ = rd();
    }
}

AnimationEngineBase::~AnimationEngineBase()
{
    // Geometry is owned by value in the variants; only the scheduler entry
    // would outlive us.
    releaseFrame();
}

bool AnimationEngineBase::init()
{
    if (initialized_)
        return true;

    if (!canvas_ || !scheduler_)
    {
        PLOG_WARNING << name() << ": no " << (canvas_ ? "frame scheduler" : "canvas") << ", staying idle";
        return false;
    }

    if (!canvas_->hasArea())
    {
        PLOG_INFO << name() << ": container has no area yet, geometry will follow the first resize";
    }

    try
    {
        machine_.reset();
        onInit();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Rendering, "Indicator failed to start", ex.what());
        onDestroy();
        return false;
    }

    frame_handle_ = scheduler_->add([this](TimePoint t) { advanceFrame(t); });
    initialized_ = true;
    PLOG_INFO << name() << " engine initialized (seed " << seed_ << ")";
    return true;
}

void AnimationEngineBase::destroy()
{
    releaseFrame();
    if (!initialized_)
        return;

    onDestroy();
    if (canvas_)
        canvas_->clear();
    initialized_ = false;
    PLOG_INFO << name() << " engine destroyed";
}

void AnimationEngineBase::releaseFrame()
{
    if (scheduler_ && frame_handle_ != FrameScheduler::kInvalidHandle)
    {
        scheduler_->remove(frame_handle_);
    }
    frame_handle_ = FrameScheduler::kInvalidHandle;
}

void AnimationEngineBase::setWorkingState(bool active)
{
    if (!initialized_)
        return;
    machine_.setWorking(active, now());
}

void AnimationEngineBase::setWaitingState(bool active)
{
    if (!initialized_)
        return;
    machine_.setWaiting(active, now());
}

void AnimationEngineBase::triggerSpike()
{
    if (!initialized_)
        return;
    PLOG_DEBUG << name() << ": spike";
    machine_.triggerSpike(now());
}

void AnimationEngineBase::updateSphereColor(const Color& color)
{
    PLOG_VERBOSE << name() << ": updateSphereColor(#" << std::hex << color.toRgb() << ") ignored";
}

void AnimationEngineBase::advanceFrame(TimePoint t)
{
    if (!initialized_)
        return;

    PROFILE_SCOPE_CUSTOM("AnimationEngine::advanceFrame");
    machine_.update(t);
    step(t);

    canvas_->clear();
    if (canvas_->hasArea())
        render(*canvas_);
}

} // namespace engine
