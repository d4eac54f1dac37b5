#include "Color.hpp"
#include "Math.hpp"

#include <cmath>

namespace engine
{

namespace
{

std::uint32_t toByte(float v)
{
    float c = clamp01(std::isfinite(v) ? v : 0.0f);
    return static_cast<std::uint32_t>(c * 255.0f + 0.5f);
}

} // namespace

std::uint32_t Color::toRgb() const { return (toByte(r) << 16) | (toByte(g) << 8) | toByte(b); }

Color mix(const Color& a, const Color& b, float t)
{
    return { engine::mix(a.r, b.r, t), engine::mix(a.g, b.g, t), engine::mix(a.b, b.b, t) };
}

std::uint32_t packColor(const Color& c, float alpha)
{
    return (toByte(alpha) << 24) | (toByte(c.b) << 16) | (toByte(c.g) << 8) | toByte(c.r);
}

} // namespace engine
