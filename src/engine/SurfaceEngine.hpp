#pragma once

#include "AnimationEngineBase.hpp"
#include "Camera.hpp"
#include "SurfaceMesh.hpp"

#include <memory>

namespace engine
{

// Ferrofluid-style indicator: a noise-displaced sphere with metallic shading.
class SurfaceEngine : public AnimationEngineBase
{
public:
    static constexpr std::chrono::milliseconds kActivationDelay{ 2000 };
    static constexpr float kMaxSpike = 2.5f;

    explicit SurfaceEngine(const EngineContext& ctx);
    ~SurfaceEngine() override;

    void triggerPulse(std::optional<Color> color = std::nullopt) override;
    void triggerSmallPulse() override;
    void triggerNextColor() override;

    const char* name() const override { return "surface"; }

    const SurfaceMesh* mesh() const { return mesh_.get(); }
    float time() const { return time_; }
    float effectiveSpike() const { return machine_.state().spike.current + pulse_boost_; }
    float pulseBoost() const { return pulse_boost_; }
    const Color& glowColor() const { return glow_; }
    float bloom() const { return bloom_; }
    float rotationSpeedX() const { return rot_speed_x_; }
    float rotationSpeedY() const { return rot_speed_y_; }

protected:
    void onInit() override;
    void onDestroy() override;
    void step(TimePoint now) override;
    void render(Canvas& canvas) override;

private:
    void updateSpikeTarget();
    void updatePalette();

    int subdivisions_;
    std::unique_ptr<SurfaceMesh> mesh_;
    Camera camera_{ 5.5f, 55.0f };

    float time_ = 0.0f;
    float pulse_boost_ = 0.0f;
    float rot_x_ = 0.0f;
    float rot_y_ = 0.0f;
    float rot_speed_x_ = 0.0005f;
    float rot_speed_y_ = 0.001f;
    float bloom_ = 0.5f;
    Color glow_;
    Color target_glow_;

    struct ProjectedTriangle
    {
        float depth;
        std::uint32_t index;
    };
    std::vector<ProjectedTriangle> draw_order_;
    std::vector<Vec3> world_;
};

} // namespace engine
