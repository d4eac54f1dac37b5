#pragma once

#include "IAnimationEngine.hpp"

#include <functional>
#include <memory>

namespace engine
{

// Owns the one active engine of a container and forwards the engine contract
// to it, so callers keep a stable reference across swaps. With no engine
// every call is a no-op.
class EngineHost : public IAnimationEngine
{
public:
    using Factory = std::function<std::unique_ptr<IAnimationEngine>(EngineKind, const EngineContext&)>;

    explicit EngineHost(EngineContext ctx, Factory factory = createEngine);
    ~EngineHost() override;

    // Destroys the outgoing engine completely before the incoming one is
    // created and initialized. Returns the incoming engine's init() result.
    bool swap(EngineKind kind);

    IAnimationEngine* current() { return engine_.get(); }
    const IAnimationEngine* current() const { return engine_.get(); }
    EngineKind kind() const { return kind_; }

    bool init() override;
    void destroy() override;
    bool isInitialized() const override;

    void setWorkingState(bool active) override;
    void setWaitingState(bool active) override;
    void triggerSpike() override;
    void triggerPulse(std::optional<Color> color = std::nullopt) override;
    void triggerSmallPulse() override;
    void triggerNextColor() override;
    void updateSphereColor(const Color& color) override;

    const char* name() const override;
    const ControlState& controlState() const override;

private:
    EngineContext ctx_;
    Factory factory_;
    std::unique_ptr<IAnimationEngine> engine_;
    EngineKind kind_ = EngineKind::Graph;
};

} // namespace engine
