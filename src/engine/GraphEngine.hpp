#pragma once

#include "AnimationEngineBase.hpp"
#include "Camera.hpp"
#include "NodeField.hpp"

#include <array>
#include <memory>

namespace engine
{

// Point-graph indicator: 250 drifting nodes joined by proximity edges.
class GraphEngine : public AnimationEngineBase
{
public:
    static constexpr std::chrono::milliseconds kActivationDelay{ 500 };
    static constexpr float kIdleShapeSpeed = 0.75f;
    static constexpr float kBusyShapeSpeed = 4.0f;
    static constexpr float kMaxShapeSpeedStep = 0.011f;
    // Spike level held while working or waiting; an error forces 1
    static constexpr float kActiveSpike = 0.35f;

    explicit GraphEngine(const EngineContext& ctx);
    ~GraphEngine() override;

    void triggerPulse(std::optional<Color> color = std::nullopt) override;
    void triggerSmallPulse() override;
    void triggerNextColor() override;

    const char* name() const override { return "graph"; }

    const NodeField* field() const { return field_.get(); }
    float shapeTime() const { return shape_time_; }
    float lineTime() const { return time_; }
    float glowStrength() const;
    float pulse() const { return pulse_; }

protected:
    void onInit() override;
    void onDestroy() override;
    void step(TimePoint now) override;
    void render(Canvas& canvas) override;

private:
    Color activeNodeColor() const;
    Color nodeColor(const Vec3& p) const;
    Color edgeColor(float light_pass) const;
    float edgeAlpha(float light_pass) const;

    std::unique_ptr<NodeField> field_;
    Camera camera_{ 5.0f, 55.0f };
    float time_ = 0.0f;
    float shape_time_ = 0.0f;
    float pulse_ = 0.0f;
    Color pulse_color_;
};

} // namespace engine
