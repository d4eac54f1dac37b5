#pragma once

#include <imgui.h>

#include <cstddef>

namespace engine
{
class Canvas;
}

// Copies an engine canvas into an ImGui draw list. Large canvases go out in
// several batches so each stays addressable with 16-bit indices.
class IndicatorView
{
public:
    static constexpr std::size_t kMaxBatchVertices = 60000;

    // Resizes the canvas to the available content region and reserves it.
    // The engine draws into the canvas during the next scheduler tick.
    void layout(engine::Canvas& canvas);

    // Draws the background and the canvas triangles at the reserved origin
    void draw(const engine::Canvas& canvas);

    static std::size_t upload(ImDrawList* draw_list, const engine::Canvas& canvas, ImVec2 origin);

    ImVec2 origin() const { return origin_; }
    ImVec2 size() const { return size_; }

private:
    ImVec2 origin_{ 0.0f, 0.0f };
    ImVec2 size_{ 0.0f, 0.0f };
};
