#include "SurfaceEngine.hpp"
#include "Canvas.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace engine
{

namespace
{

constexpr Color kBaseColor = Color::fromRgb(0x020202);
constexpr Color kInitialGlow = Color::fromRgb(0x1a0044);

// Background cycle the glow drifts through
constexpr std::array<Color, 4> kGlowPalette{ Color::fromRgb(0x1a0525), Color::fromRgb(0x051a25),
                                             Color::fromRgb(0x250505), Color::fromRgb(0x111111) };

constexpr float kCycleSpeed = 0.05f;
constexpr float kColorCursorRate = 0.02f;
constexpr float kTargetGlowRate = 0.05f;
constexpr float kGlowRate = 0.01f;
constexpr float kRotationRate = 0.01f;
constexpr float kPulseRelax = 0.02f;
constexpr float kSphereScale = 1.44f;
constexpr float kSphereLift = 0.25f;

} // namespace

SurfaceEngine::SurfaceEngine(const EngineContext& ctx)
    : AnimationEngineBase(ctx, kActivationDelay, SmoothingRates{ 0.02f, 0.005f, 0.01f })
    , subdivisions_(std::clamp(ctx.surface_subdivisions, 1, 6))
{
}

SurfaceEngine::~SurfaceEngine() = default;

void SurfaceEngine::onInit()
{
    mesh_ = std::make_unique<SurfaceMesh>(subdivisions_);
    PLOG_DEBUG << "surface mesh: " << mesh_->basePositions().size() << " vertices, " << mesh_->triangles().size()
               << " triangles";

    time_ = 0.0f;
    pulse_boost_ = 0.0f;
    rot_x_ = 0.0f;
    rot_y_ = 0.0f;
    rot_speed_x_ = 0.0005f;
    rot_speed_y_ = 0.001f;
    bloom_ = 0.5f;
    glow_ = kInitialGlow;
    target_glow_ = kInitialGlow;

    auto& s = machine_.state();
    s.spike.current = 0.2f;
    s.spike.target = 0.2f;
}

void SurfaceEngine::onDestroy()
{
    mesh_.reset();
    draw_order_.clear();
    draw_order_.shrink_to_fit();
    world_.clear();
    world_.shrink_to_fit();
}

void SurfaceEngine::triggerPulse(std::optional<Color>)
{
    if (!isInitialized())
        return;
    pulse_boost_ += 0.4f;
}

void SurfaceEngine::triggerSmallPulse()
{
    if (!isInitialized())
        return;
    pulse_boost_ += 0.1f;
}

void SurfaceEngine::triggerNextColor()
{
    if (!isInitialized())
        return;
    machine_.state().colorBlend.target += 1.0f;
}

void SurfaceEngine::updateSpikeTarget()
{
    auto& s = machine_.state();
    float target_rot_x = 0.0005f;
    float target_rot_y = 0.001f;

    if (s.error.target > 0.5f)
    {
        s.spike.target = kMaxSpike;
        target_rot_y = 0.02f;
    }
    else
    {
        float a = s.activity();
        float freq = 2.0f + a * 4.0f;
        float base_amp = 0.15f + a * 0.55f;
        float amp_var = 0.05f + a * 0.15f;
        s.spike.target = base_amp + std::sin(time_ * freq) * amp_var;

        if (s.activityRequested())
        {
            target_rot_x = 0.003f;
            target_rot_y = 0.004f;
        }
    }

    rot_speed_x_ += (target_rot_x - rot_speed_x_) * kRotationRate;
    rot_speed_y_ += (target_rot_y - rot_speed_y_) * kRotationRate;
}

void SurfaceEngine::updatePalette()
{
    auto& s = machine_.state();
    s.colorBlend.smooth(kColorCursorRate);

    const float n = static_cast<float>(kGlowPalette.size());
    float index = std::fmod(std::max(time_ * kCycleSpeed + s.colorBlend.current, 0.0f), n);
    std::size_t i0 = static_cast<std::size_t>(index) % kGlowPalette.size();
    std::size_t i1 = (i0 + 1) % kGlowPalette.size();
    Color cycle = mix(kGlowPalette[i0], kGlowPalette[i1], index - std::floor(index));

    target_glow_ = mix(target_glow_, cycle, kTargetGlowRate);
    glow_ = mix(glow_, target_glow_, kGlowRate);
}

void SurfaceEngine::step(TimePoint)
{
    auto& s = machine_.state();
    time_ += 0.01f;

    updateSpikeTarget();
    updatePalette();

    const bool waking = s.working.rising() || s.waiting.rising();
    machine_.smooth();

    pulse_boost_ -= pulse_boost_ * kPulseRelax;
    if (pulse_boost_ < 0.0005f)
        pulse_boost_ = 0.0f;

    rot_x_ = std::fmod(rot_x_ + rot_speed_x_, kTwoPi);
    rot_y_ = std::fmod(rot_y_ + rot_speed_y_, kTwoPi);

    float target_bloom = s.error.current > 0.1f ? 2.5f : 0.5f + s.working.current * 0.6f;
    bloom_ += (target_bloom - bloom_) * (waking ? machine_.rates().rise : machine_.rates().fall);

    mesh_->displace({ time_, s.activity(), effectiveSpike() });
}

void SurfaceEngine::render(Canvas& canvas)
{
    canvas.setBackground(Color{});
    const auto& s = machine_.state();
    const float w = canvas.width();
    const float h = canvas.height();
    const Vec3 eye = camera_.position();

    const auto& local = mesh_->positions();
    const auto& normals = mesh_->normals();
    const auto& disp = mesh_->displacements();
    const auto& tris = mesh_->triangles();

    world_.resize(local.size());
    for (std::size_t i = 0; i < local.size(); ++i)
    {
        Vec3 p = rotateY(rotateX(local[i], rot_x_), rot_y_) * kSphereScale;
        p.y += kSphereLift;
        world_[i] = p;
    }

    // Halo behind the sphere stands in for bloom
    if (auto centre = camera_.project({ 0.0f, kSphereLift, 0.0f }, w, h))
    {
        float radius = kSphereScale * (1.0f + std::min(effectiveSpike(), kMaxSpike) * 0.35f) * centre->scale * 1.25f;
        Color halo = s.error.current > 0.1f ? mix(glow_, Color{ 1.0f, 0.0f, 0.0f }, s.error.current) : glow_;
        canvas.addDisc(centre->x, centre->y, radius, packColor(halo * (1.0f + bloom_), clamp01(0.35f * bloom_)),
                       packColor(halo, 0.0f), 48);
    }

    draw_order_.clear();
    for (std::uint32_t t = 0; t < tris.size(); ++t)
    {
        const auto& tri = tris[t];
        const Vec3& a = world_[tri[0]];
        const Vec3& b = world_[tri[1]];
        const Vec3& c = world_[tri[2]];
        Vec3 centroid = (a + b + c) * (1.0f / 3.0f);
        if (dot(cross(b - a, c - a), eye - centroid) <= 0.0f)
            continue;
        draw_order_.push_back({ eye.z - centroid.z, t });
    }

    // Painter's order: far triangles first
    std::sort(draw_order_.begin(), draw_order_.end(),
              [](const ProjectedTriangle& l, const ProjectedTriangle& r) { return l.depth > r.depth; });

    ShadingParams shading{ kBaseColor, glow_, s.activity(), s.error.current, std::max(effectiveSpike(), 0.001f), time_ };

    for (const auto& entry : draw_order_)
    {
        const auto& tri = tris[entry.index];
        std::array<CanvasVertex, 3> verts{};
        bool visible = true;
        for (int k = 0; k < 3; ++k)
        {
            std::uint32_t vi = tri[k];
            auto sp = camera_.project(world_[vi], w, h);
            if (!sp)
            {
                visible = false;
                break;
            }
            Vec3 n = rotateY(rotateX(normals[vi], rot_x_), rot_y_);
            Color c = shadeSurface(n, eye - world_[vi], disp[vi], shading);
            verts[k] = { sp->x, sp->y, packColor(c) };
        }
        if (visible)
            canvas.addTriangle(verts[0], verts[1], verts[2]);
    }
}

} // namespace engine
