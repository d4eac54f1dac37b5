#pragma once

#include <cstdint>

namespace engine
{

// Linear RGB, components nominally in [0,1]. Values above 1 are allowed
// while lighting and get clamped when packed.
struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    static constexpr Color fromRgb(std::uint32_t rgb)
    {
        return { static_cast<float>((rgb >> 16) & 0xFF) / 255.0f, static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
                 static_cast<float>(rgb & 0xFF) / 255.0f };
    }

    std::uint32_t toRgb() const;
};

inline Color operator+(const Color& a, const Color& b) { return { a.r + b.r, a.g + b.g, a.b + b.b }; }
inline Color operator*(const Color& c, float s) { return { c.r * s, c.g * s, c.b * s }; }

Color mix(const Color& a, const Color& b, float t);

// Packs into the 0xAABBGGRR layout ImGui vertex colors use.
std::uint32_t packColor(const Color& c, float alpha = 1.0f);

} // namespace engine
