#include "GraphEngine.hpp"
#include "Canvas.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <cmath>

namespace engine
{

namespace
{

constexpr Color kNodeBase = Color::fromRgb(0x1a0000);
constexpr Color kNodeError = Color::fromRgb(0xff00ee);
constexpr Color kLineBase = Color::fromRgb(0x300000);
constexpr Color kLineActive = Color::fromRgb(0x450000);
constexpr Color kLineError = Color::fromRgb(0x00fff2);

// Hues the active node color walks through on triggerNextColor()
constexpr std::array<Color, 3> kActivePalette{ Color::fromRgb(0x005eff), Color::fromRgb(0x00a8ff),
                                               Color::fromRgb(0x6a1bff) };

constexpr float kSceneScale = 0.9f;
constexpr float kNodeSize = 0.12f;
constexpr float kPulseDecay = 0.94f;
constexpr float kColorCursorRate = 0.02f;
constexpr int kEdgeSegments = 3;

} // namespace

GraphEngine::GraphEngine(const EngineContext& ctx)
    : AnimationEngineBase(ctx, kActivationDelay, SmoothingRates{ 0.05f, 0.02f, 0.08f })
{
}

GraphEngine::~GraphEngine() = default;

void GraphEngine::onInit()
{
    field_ = std::make_unique<NodeField>(seed_);
    time_ = 0.0f;
    shape_time_ = 0.0f;
    pulse_ = 0.0f;
    pulse_color_ = kActivePalette[0];

    auto& s = machine_.state();
    s.shapeSpeed.current = kIdleShapeSpeed;
    s.shapeSpeed.target = kIdleShapeSpeed;
    s.spike.current = 0.2f;
    s.spike.target = 0.2f;
}

void GraphEngine::onDestroy() { field_.reset(); }

void GraphEngine::triggerPulse(std::optional<Color> color)
{
    if (!isInitialized())
        return;
    pulse_ = 1.0f;
    pulse_color_ = color.value_or(activeNodeColor());
}

void GraphEngine::triggerSmallPulse()
{
    if (!isInitialized())
        return;
    pulse_ = std::max(pulse_, 0.35f);
}

void GraphEngine::triggerNextColor()
{
    if (!isInitialized())
        return;
    machine_.state().colorBlend.target += 1.0f;
}

float GraphEngine::glowStrength() const { return 1.0f + machine_.state().error.current * 2.5f + pulse_ * 0.6f; }

void GraphEngine::step(TimePoint)
{
    auto& s = machine_.state();

    s.spike.target = s.error.target > 0.5f ? 1.0f
                                           : kActiveSpike * std::max(s.working.current, s.waiting.current);
    machine_.smooth();
    s.colorBlend.smooth(kColorCursorRate);

    // Line highlight runs at a fixed pace whatever the state
    time_ += 0.005f;

    s.shapeSpeed.target = kIdleShapeSpeed + s.working.current * (kBusyShapeSpeed - kIdleShapeSpeed);
    float diff = s.shapeSpeed.target - s.shapeSpeed.current;
    if (std::fabs(diff) > 0.001f)
    {
        s.shapeSpeed.current += std::copysign(std::min(std::fabs(diff), kMaxShapeSpeedStep), diff);
    }
    shape_time_ += 0.0025f * s.shapeSpeed.current;

    field_->updatePositions(shape_time_);
    field_->computeEdges(s.error.current > 0.5f);
    field_->smoothScales();

    pulse_ *= kPulseDecay;
    if (pulse_ < 0.001f)
        pulse_ = 0.0f;
}

Color GraphEngine::activeNodeColor() const
{
    float cursor = machine_.state().colorBlend.current;
    const std::size_t n = kActivePalette.size();
    float wrapped = std::fmod(std::max(cursor, 0.0f), static_cast<float>(n));
    std::size_t i0 = static_cast<std::size_t>(wrapped) % n;
    std::size_t i1 = (i0 + 1) % n;
    return mix(kActivePalette[i0], kActivePalette[i1], fract(wrapped));
}

Color GraphEngine::nodeColor(const Vec3& p) const
{
    const auto& s = machine_.state();
    float color_mix = std::sin(p.x * 2.0f + p.y * 2.0f + s.working.current) * 0.5f + 0.5f;
    Color c = mix(kNodeBase, activeNodeColor(), color_mix);
    c = mix(c, pulse_color_, pulse_ * 0.5f);
    return mix(c, kNodeError, s.error.current);
}

Color GraphEngine::edgeColor(float light_pass) const
{
    const auto& s = machine_.state();
    float color_mix = std::sin(light_pass * 10.0f + s.working.current) * 0.5f + 0.5f;
    Color c = mix(kLineBase, kLineActive, color_mix);
    return mix(c, kLineError, s.error.current * 0.8f);
}

float GraphEngine::edgeAlpha(float light_pass) const
{
    float gradient = fract(light_pass * 1.5f - time_ * 2.0f);
    float pulse = smoothstep(0.0f, 0.5f, gradient) * smoothstep(1.0f, 0.9f, gradient);
    return mix(0.4f + machine_.state().working.current * 0.2f, 1.0f, pulse);
}

void GraphEngine::render(Canvas& canvas)
{
    canvas.setBackground(Color{});
    const float w = canvas.width();
    const float h = canvas.height();
    const auto& positions = field_->positions();
    const auto& scales = field_->scales();
    const float glow = glowStrength();

    std::vector<std::optional<ScreenPoint>> projected(positions.size());
    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        projected[i] = camera_.project(positions[i] * kSceneScale, w, h);
    }

    std::array<float, kEdgeSegments + 1> alphas{};
    std::array<std::uint32_t, kEdgeSegments + 1> colors{};
    for (int k = 0; k <= kEdgeSegments; ++k)
    {
        float lp = static_cast<float>(k) / kEdgeSegments;
        alphas[k] = clamp01(edgeAlpha(lp) * (0.55f + 0.15f * glow));
        colors[k] = packColor(edgeColor(lp) * (1.0f + 0.25f * glow), alphas[k]);
    }

    for (const Edge& e : field_->edges())
    {
        const auto& pa = projected[e.a];
        const auto& pb = projected[e.b];
        if (!pa || !pb)
            continue;

        for (int k = 0; k < kEdgeSegments; ++k)
        {
            float t0 = static_cast<float>(k) / kEdgeSegments;
            float t1 = static_cast<float>(k + 1) / kEdgeSegments;
            canvas.addLine(mix(pa->x, pb->x, t0), mix(pa->y, pb->y, t0), mix(pa->x, pb->x, t1),
                           mix(pa->y, pb->y, t1), 1.0f, colors[k], colors[k + 1]);
        }
    }

    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        const auto& p = projected[i];
        float s = scales[i];
        if (!p || s < 0.001f)
            continue;

        Color c = nodeColor(positions[i]);
        float radius = kNodeSize * 0.5f * kSceneScale * s * p->scale;
        // Soft halo stands in for bloom; the core stays crisp
        canvas.addDisc(p->x, p->y, radius * (1.5f + glow), packColor(c, 0.25f * s), packColor(c, 0.0f), 10);
        canvas.addDisc(p->x, p->y, radius, packColor(c * 1.8f, 0.95f * s), packColor(c, 0.2f * s), 8);
    }
}

} // namespace engine
