#include "SurfaceMesh.hpp"
#include "Noise.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace engine
{

namespace
{

const Vec3 kLight1 = normalize({ 1.0f, 1.5f, 1.0f });   // key
const Vec3 kLight2 = normalize({ -1.0f, -0.8f, -0.5f }); // rim
const Vec3 kLight3 = normalize({ 0.5f, -1.0f, 1.0f });   // under

Vec3 toVec(const Color& c) { return { c.r, c.g, c.b }; }

} // namespace

float surfaceDisplacement(const Vec3& p, const SurfaceParams& params)
{
    const float t = params.time;
    Vec3 rp = p + Vec3{ t * 0.1f, t * 0.15f, -t * 0.05f };

    float idle = fbmNoise(rp * 1.2f) * 0.25f + simplexNoise(rp * 2.5f - Vec3{ t, t, t } * 0.2f) * 0.1f;
    float active = ferroNoise(rp * 2.0f + Vec3{ t, t, t } * 0.3f) * 1.5f;

    return mix(idle, active, clamp01(params.activity)) * params.spike;
}

Color shadeSurface(const Vec3& normal, const Vec3& view_dir, float displacement, const ShadingParams& params)
{
    const Vec3 n = normalize(normal);
    const Vec3 v = normalize(view_dir);

    float ndotv = std::max(dot(n, v), 0.0f);
    float fresnel = std::pow(1.0f - ndotv, 4.0f);

    float cavity = smoothstep(-0.2f, 0.8f, displacement / std::max(params.spike, 0.001f));

    float diff1 = std::max(dot(n, kLight1), 0.0f);
    float spec1 = std::pow(std::max(dot(n, normalize(kLight1 + v)), 0.0f), 120.0f);
    float spec2 = std::pow(std::max(dot(n, normalize(kLight3 + v)), 0.0f), 70.0f);
    float rim = std::max(dot(n, kLight2), 0.0f);

    const float activity = clamp01(params.activity);
    Vec3 base = toVec(params.base);
    Vec3 glow = toVec(params.glow);

    Vec3 c = base * (diff1 * 0.15f + 0.05f);
    c += glow * (fresnel * 1.5f + rim * 0.1f);
    c += Vec3{ 1.0f, 1.0f, 1.0f } * (spec1 * 2.5f);
    c += glow * (spec2 * 1.2f);
    c += glow * (cavity * activity * 1.2f);
    c = c * mix(1.2f, 1.8f, activity);

    if (params.error > 0.0f)
    {
        float flicker = 0.8f + 0.2f * std::sin(params.time * 30.0f);
        Vec3 alert = Vec3{ 5.0f, 0.0f, 0.0f } * (flicker * (diff1 + fresnel * 2.0f));
        float e = clamp01(params.error);
        c = c + (alert - c) * e;
    }

    return { c.x, c.y, c.z };
}

SurfaceMesh::SurfaceMesh(int subdivisions)
    : subdivisions_(std::clamp(subdivisions, 0, 6))
{
    build();
}

void SurfaceMesh::build()
{
    const float t = (1.0f + std::sqrt(5.0f)) * 0.5f;
    base_ = {
        { -1, t, 0 }, { 1, t, 0 }, { -1, -t, 0 }, { 1, -t, 0 },
        { 0, -1, t }, { 0, 1, t }, { 0, -1, -t }, { 0, 1, -t },
        { t, 0, -1 }, { t, 0, 1 }, { -t, 0, -1 }, { -t, 0, 1 },
    };
    for (auto& v : base_)
        v = normalize(v);

    triangles_ = {
        { 0, 11, 5 }, { 0, 5, 1 },  { 0, 1, 7 },   { 0, 7, 10 }, { 0, 10, 11 },
        { 1, 5, 9 },  { 5, 11, 4 }, { 11, 10, 2 }, { 10, 7, 6 }, { 7, 1, 8 },
        { 3, 9, 4 },  { 3, 4, 2 },  { 3, 2, 6 },   { 3, 6, 8 },  { 3, 8, 9 },
        { 4, 9, 5 },  { 2, 4, 11 }, { 6, 2, 10 },  { 8, 6, 7 },  { 9, 8, 1 },
    };

    for (int level = 0; level < subdivisions_; ++level)
    {
        std::map<std::pair<std::uint32_t, std::uint32_t>, std::uint32_t> midpoints;
        auto midpoint = [&](std::uint32_t a, std::uint32_t b) {
            std::pair<std::uint32_t, std::uint32_t> key = std::minmax(a, b);
            auto it = midpoints.find(key);
            if (it != midpoints.end())
                return it->second;
            base_.push_back(normalize((base_[a] + base_[b]) * 0.5f));
            auto idx = static_cast<std::uint32_t>(base_.size() - 1);
            midpoints.emplace(key, idx);
            return idx;
        };

        std::vector<std::array<std::uint32_t, 3>> next;
        next.reserve(triangles_.size() * 4);
        for (const auto& tri : triangles_)
        {
            std::uint32_t ab = midpoint(tri[0], tri[1]);
            std::uint32_t bc = midpoint(tri[1], tri[2]);
            std::uint32_t ca = midpoint(tri[2], tri[0]);
            next.push_back({ tri[0], ab, ca });
            next.push_back({ tri[1], bc, ab });
            next.push_back({ tri[2], ca, bc });
            next.push_back({ ab, bc, ca });
        }
        triangles_ = std::move(next);
    }

    tangents_.resize(base_.size());
    bitangents_.resize(base_.size());
    for (std::size_t i = 0; i < base_.size(); ++i)
    {
        const Vec3& n = base_[i];
        Vec3 tangent = cross(n, { 0.0f, 1.0f, 0.0f });
        if (length(tangent) < 0.1f)
            tangent = cross(n, { 1.0f, 0.0f, 0.0f });
        tangent = normalize(tangent, { 1.0f, 0.0f, 0.0f });
        tangents_[i] = tangent;
        bitangents_[i] = normalize(cross(n, tangent), { 0.0f, 0.0f, 1.0f });
    }

    positions_ = base_;
    normals_ = base_;
    displacement_.assign(base_.size(), 0.0f);
}

void SurfaceMesh::displace(const SurfaceParams& params)
{
    for (std::size_t i = 0; i < base_.size(); ++i)
    {
        const Vec3& p = base_[i];
        Vec3 p1 = normalize(p + tangents_[i] * kNormalEpsilon, p);
        Vec3 p2 = normalize(p + bitangents_[i] * kNormalEpsilon, p);

        float d0 = surfaceDisplacement(p, params);
        float d1 = surfaceDisplacement(p1, params);
        float d2 = surfaceDisplacement(p2, params);

        Vec3 pos0 = p + p * d0;
        Vec3 pos1 = p1 + p1 * d1;
        Vec3 pos2 = p2 + p2 * d2;

        displacement_[i] = d0;
        positions_[i] = pos0;
        normals_[i] = normalize(cross(pos1 - pos0, pos2 - pos0), p);
    }
}

} // namespace engine
