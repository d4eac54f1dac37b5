#include "Noise.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <random>

namespace engine
{

namespace
{

constexpr int kOctaves = 4;
constexpr float kOctaveShift = 100.0f;

constexpr std::array<std::array<float, 3>, 12> kGradients{ {
    { 1, 1, 0 }, { -1, 1, 0 }, { 1, -1, 0 }, { -1, -1, 0 },
    { 1, 0, 1 }, { -1, 0, 1 }, { 1, 0, -1 }, { -1, 0, -1 },
    { 0, 1, 1 }, { 0, -1, 1 }, { 0, 1, -1 }, { 0, -1, -1 },
} };

struct Permutation
{
    std::array<std::uint8_t, 512> perm{};
    std::array<std::uint8_t, 512> mod12{};

    Permutation()
    {
        std::array<std::uint8_t, 256> p{};
        for (int i = 0; i < 256; ++i)
            p[i] = static_cast<std::uint8_t>(i);

        // Fixed seed and a hand-written Fisher-Yates so every standard
        // library produces the same table.
        std::mt19937 rng(0x6057u);
        for (int i = 255; i > 0; --i)
        {
            int j = static_cast<int>(rng() % static_cast<std::uint32_t>(i + 1));
            std::swap(p[i], p[j]);
        }

        for (int i = 0; i < 512; ++i)
        {
            perm[i] = p[i & 255];
            mod12[i] = static_cast<std::uint8_t>(perm[i] % 12);
        }
    }
};

const Permutation& permutation()
{
    static const Permutation table;
    return table;
}

float corner(int gi, float x, float y, float z)
{
    float t = 0.6f - x * x - y * y - z * z;
    if (t < 0.0f)
        return 0.0f;
    t *= t;
    const auto& g = kGradients[gi];
    return t * t * (g[0] * x + g[1] * y + g[2] * z);
}

} // namespace

float simplexNoise(const Vec3& v)
{
    constexpr float F3 = 1.0f / 3.0f;
    constexpr float G3 = 1.0f / 6.0f;
    const auto& t = permutation();

    float s = (v.x + v.y + v.z) * F3;
    int i = static_cast<int>(std::floor(v.x + s));
    int j = static_cast<int>(std::floor(v.y + s));
    int k = static_cast<int>(std::floor(v.z + s));

    float u = static_cast<float>(i + j + k) * G3;
    float x0 = v.x - (static_cast<float>(i) - u);
    float y0 = v.y - (static_cast<float>(j) - u);
    float z0 = v.z - (static_cast<float>(k) - u);

    int i1, j1, k1, i2, j2, k2;
    if (x0 >= y0)
    {
        if (y0 >= z0)
        {
            i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
        }
        else if (x0 >= z0)
        {
            i1 = 1; j1 = 0; k1 = 0; i2 = 1; j2 = 0; k2 = 1;
        }
        else
        {
            i1 = 0; j1 = 0; k1 = 1; i2 = 1; j2 = 0; k2 = 1;
        }
    }
    else
    {
        if (y0 < z0)
        {
            i1 = 0; j1 = 0; k1 = 1; i2 = 0; j2 = 1; k2 = 1;
        }
        else if (x0 < z0)
        {
            i1 = 0; j1 = 1; k1 = 0; i2 = 0; j2 = 1; k2 = 1;
        }
        else
        {
            i1 = 0; j1 = 1; k1 = 0; i2 = 1; j2 = 1; k2 = 0;
        }
    }

    float x1 = x0 - i1 + G3, y1 = y0 - j1 + G3, z1 = z0 - k1 + G3;
    float x2 = x0 - i2 + 2.0f * G3, y2 = y0 - j2 + 2.0f * G3, z2 = z0 - k2 + 2.0f * G3;
    float x3 = x0 - 1.0f + 3.0f * G3, y3 = y0 - 1.0f + 3.0f * G3, z3 = z0 - 1.0f + 3.0f * G3;

    int ii = i & 255;
    int jj = j & 255;
    int kk = k & 255;
    const auto& p = t.perm;
    int g0 = t.mod12[ii + p[jj + p[kk]]];
    int g1 = t.mod12[ii + i1 + p[jj + j1 + p[kk + k1]]];
    int g2 = t.mod12[ii + i2 + p[jj + j2 + p[kk + k2]]];
    int g3 = t.mod12[ii + 1 + p[jj + 1 + p[kk + 1]]];

    float n = corner(g0, x0, y0, z0) + corner(g1, x1, y1, z1) + corner(g2, x2, y2, z2) + corner(g3, x3, y3, z3);
    return 32.0f * n;
}

float fbmNoise(Vec3 p)
{
    float v = 0.0f;
    float a = 0.5f;
    const Vec3 shift{ kOctaveShift, kOctaveShift, kOctaveShift };
    for (int i = 0; i < kOctaves; ++i)
    {
        v += a * simplexNoise(p);
        p = p * 2.0f + shift;
        a *= 0.5f;
    }
    return v;
}

float ferroNoise(Vec3 p)
{
    float v = 0.0f;
    float a = 0.5f;
    const Vec3 shift{ kOctaveShift, kOctaveShift, kOctaveShift };
    for (int i = 0; i < kOctaves; ++i)
    {
        float n = 1.0f - std::fabs(simplexNoise(p));
        v += a * n * n;
        p = p * 2.0f + shift;
        a *= 0.5f;
    }
    return v;
}

} // namespace engine
