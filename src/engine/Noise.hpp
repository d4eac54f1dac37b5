#pragma once

#include "Math.hpp"

namespace engine
{

// 3D simplex noise, roughly in [-1, 1]
float simplexNoise(const Vec3& p);

// Four octaves of simplex, amplitude halving, coordinates doubling
float fbmNoise(Vec3 p);

// Four octaves of (1 - |n|)^2 ridges: sharp crests, flat valleys
float ferroNoise(Vec3 p);

} // namespace engine
