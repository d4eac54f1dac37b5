#pragma once

#include "Color.hpp"
#include "Math.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace engine
{

struct SurfaceParams
{
    float time = 0.0f;
    float activity = 0.0f; // max(working, waiting)
    float spike = 0.2f;    // displacement scale
};

struct ShadingParams
{
    Color base = Color::fromRgb(0x020202);
    Color glow = Color::fromRgb(0x1a0044);
    float activity = 0.0f;
    float error = 0.0f;
    float spike = 0.2f;
    float time = 0.0f;
};

// Signed displacement along the normal of the unit-sphere point p. Blends
// an fbm breathing profile with ridged spikes by activity, scaled by spike.
float surfaceDisplacement(const Vec3& p, const SurfaceParams& params);

// Wet-metal lighting: three directional lights, Fresnel rim, cavity glow.
// error blends toward a flickering red alert.
Color shadeSurface(const Vec3& normal, const Vec3& view_dir, float displacement, const ShadingParams& params);

/**
 * @brief Icosphere displaced every frame on the CPU
 *
 * Normals are not interpolated from the undisplaced sphere: each vertex
 * samples the displacement at two nearby points on the sphere (along a
 * tangent and bitangent) and takes the cross product of the displaced
 * differences.
 */
class SurfaceMesh
{
public:
    static constexpr float kNormalEpsilon = 0.01f;

    explicit SurfaceMesh(int subdivisions);

    void displace(const SurfaceParams& params);

    const std::vector<Vec3>& basePositions() const { return base_; }
    const std::vector<Vec3>& positions() const { return positions_; }
    const std::vector<Vec3>& normals() const { return normals_; }
    const std::vector<float>& displacements() const { return displacement_; }
    const std::vector<std::array<std::uint32_t, 3>>& triangles() const { return triangles_; }
    int subdivisions() const { return subdivisions_; }

private:
    void build();

    int subdivisions_;
    std::vector<Vec3> base_;
    std::vector<Vec3> tangents_;
    std::vector<Vec3> bitangents_;
    std::vector<std::array<std::uint32_t, 3>> triangles_;

    std::vector<Vec3> positions_;
    std::vector<Vec3> normals_;
    std::vector<float> displacement_;
};

} // namespace engine
