#pragma once

#include "Color.hpp"

#include <cstdint>
#include <vector>

namespace engine
{

struct CanvasVertex
{
    float x;
    float y;
    std::uint32_t color; // packed, see packColor()
};

// CPU-side drawing surface the engines render into. The host sizes it to the
// indicator panel and copies the triangle list into its own draw list.
class Canvas
{
public:
    void resize(float width, float height);
    float width() const { return width_; }
    float height() const { return height_; }
    bool hasArea() const { return width_ >= 1.0f && height_ >= 1.0f; }

    void clear();

    void setBackground(const Color& c) { background_ = c; }
    const Color& background() const { return background_; }

    void addTriangle(const CanvasVertex& a, const CanvasVertex& b, const CanvasVertex& c);

    // Quad of the given thickness from a to b with per-end colors
    void addLine(float ax, float ay, float bx, float by, float thickness, std::uint32_t colorA, std::uint32_t colorB);

    // Triangle fan, centre color fading to the rim color
    void addDisc(float cx, float cy, float radius, std::uint32_t centerColor, std::uint32_t rimColor,
                 int segments = 12);

    const std::vector<CanvasVertex>& vertices() const { return vertices_; }
    const std::vector<std::uint32_t>& indices() const { return indices_; }
    std::size_t triangleCount() const { return indices_.size() / 3; }

private:
    std::uint32_t push(const CanvasVertex& v);

    float width_ = 0.0f;
    float height_ = 0.0f;
    Color background_;
    std::vector<CanvasVertex> vertices_;
    std::vector<std::uint32_t> indices_;
};

} // namespace engine
