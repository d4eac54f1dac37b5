#pragma once

#include "Math.hpp"

#include <cmath>
#include <optional>

namespace engine
{

struct ScreenPoint
{
    float x = 0.0f;
    float y = 0.0f;
    float depth = 0.0f;  // distance along the view axis
    float scale = 1.0f;  // pixels per world unit at this depth
};

// Perspective camera on the +z axis looking at the origin.
struct Camera
{
    float distance = 5.0f;
    float fov_degrees = 55.0f;
    float near_plane = 0.1f;

    std::optional<ScreenPoint> project(const Vec3& p, float width, float height) const
    {
        float depth = distance - p.z;
        if (depth < near_plane || height < 1.0f || width < 1.0f)
            return std::nullopt;

        float focal = (height * 0.5f) / std::tan(fov_degrees * 0.5f * kPi / 180.0f);
        float scale = focal / depth;
        return ScreenPoint{ width * 0.5f + p.x * scale, height * 0.5f - p.y * scale, depth, scale };
    }

    Vec3 position() const { return { 0.0f, 0.0f, distance }; }
};

} // namespace engine
