#include "Canvas.hpp"
#include "Math.hpp"

#include <algorithm>
#include <cmath>

namespace engine
{

void Canvas::resize(float width, float height)
{
    width_ = std::isfinite(width) ? std::max(width, 0.0f) : 0.0f;
    height_ = std::isfinite(height) ? std::max(height, 0.0f) : 0.0f;
}

void Canvas::clear()
{
    vertices_.clear();
    indices_.clear();
}

std::uint32_t Canvas::push(const CanvasVertex& v)
{
    vertices_.push_back(v);
    return static_cast<std::uint32_t>(vertices_.size() - 1);
}

void Canvas::addTriangle(const CanvasVertex& a, const CanvasVertex& b, const CanvasVertex& c)
{
    indices_.push_back(push(a));
    indices_.push_back(push(b));
    indices_.push_back(push(c));
}

void Canvas::addLine(float ax, float ay, float bx, float by, float thickness, std::uint32_t colorA,
                     std::uint32_t colorB)
{
    float dx = bx - ax;
    float dy = by - ay;
    float len = std::sqrt(dx * dx + dy * dy);
    if (len < kEpsilon)
        return;

    float half = thickness * 0.5f;
    float nx = -dy / len * half;
    float ny = dx / len * half;

    std::uint32_t i0 = push({ ax + nx, ay + ny, colorA });
    std::uint32_t i1 = push({ bx + nx, by + ny, colorB });
    std::uint32_t i2 = push({ bx - nx, by - ny, colorB });
    std::uint32_t i3 = push({ ax - nx, ay - ny, colorA });
    indices_.insert(indices_.end(), { i0, i1, i2, i0, i2, i3 });
}

void Canvas::addDisc(float cx, float cy, float radius, std::uint32_t centerColor, std::uint32_t rimColor,
                     int segments)
{
    if (radius <= 0.0f || segments < 3)
        return;

    std::uint32_t center = push({ cx, cy, centerColor });
    std::uint32_t first = static_cast<std::uint32_t>(vertices_.size());
    for (int i = 0; i < segments; ++i)
    {
        float a = kTwoPi * static_cast<float>(i) / static_cast<float>(segments);
        push({ cx + std::cos(a) * radius, cy + std::sin(a) * radius, rimColor });
    }
    for (int i = 0; i < segments; ++i)
    {
        std::uint32_t next = first + static_cast<std::uint32_t>((i + 1) % segments);
        indices_.insert(indices_.end(), { center, first + static_cast<std::uint32_t>(i), next });
    }
}

} // namespace engine
