#include "EngineHost.hpp"

#include <plog/Log.h>

namespace engine
{

EngineHost::EngineHost(EngineContext ctx, Factory factory)
    : ctx_(std::move(ctx))
    , factory_(std::move(factory))
{
}

EngineHost::~EngineHost() { destroy(); }

bool EngineHost::swap(EngineKind kind)
{
    if (engine_)
    {
        PLOG_INFO << "Swapping indicator engine " << engine_->name() << " -> " << engineKindName(kind);
        engine_->destroy();
        engine_.reset();
    }

    kind_ = kind;
    engine_ = factory_ ? factory_(kind, ctx_) : nullptr;
    if (!engine_)
    {
        PLOG_ERROR << "No engine available for kind " << engineKindName(kind);
        return false;
    }
    return engine_->init();
}

bool EngineHost::init() { return engine_ ? engine_->init() : false; }

void EngineHost::destroy()
{
    if (engine_)
        engine_->destroy();
}

bool EngineHost::isInitialized() const { return engine_ && engine_->isInitialized(); }

void EngineHost::setWorkingState(bool active)
{
    if (engine_)
        engine_->setWorkingState(active);
}

void EngineHost::setWaitingState(bool active)
{
    if (engine_)
        engine_->setWaitingState(active);
}

void EngineHost::triggerSpike()
{
    if (engine_)
        engine_->triggerSpike();
}

void EngineHost::triggerPulse(std::optional<Color> color)
{
    if (engine_)
        engine_->triggerPulse(color);
}

void EngineHost::triggerSmallPulse()
{
    if (engine_)
        engine_->triggerSmallPulse();
}

void EngineHost::triggerNextColor()
{
    if (engine_)
        engine_->triggerNextColor();
}

void EngineHost::updateSphereColor(const Color& color)
{
    if (engine_)
        engine_->updateSphereColor(color);
}

const char* EngineHost::name() const { return engine_ ? engine_->name() : "none"; }

const ControlState& EngineHost::controlState() const
{
    static const ControlState idle;
    return engine_ ? engine_->controlState() : idle;
}

} // namespace engine
