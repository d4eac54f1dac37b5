#include "IndicatorView.hpp"
#include "engine/Canvas.hpp"
#include "utils/Profile.hpp"

#include <algorithm>
#include <limits>

void IndicatorView::layout(engine::Canvas& canvas)
{
    origin_ = ImGui::GetCursorScreenPos();
    size_ = ImGui::GetContentRegionAvail();
    size_.x = std::max(size_.x, 0.0f);
    size_.y = std::max(size_.y, 0.0f);
    canvas.resize(size_.x, size_.y);
}

void IndicatorView::draw(const engine::Canvas& canvas)
{
    PROFILE_SCOPE_CUSTOM("IndicatorView::draw");

    ImDrawList* dl = ImGui::GetWindowDrawList();
    ImVec2 max(origin_.x + size_.x, origin_.y + size_.y);
    const engine::Color& bg = canvas.background();
    dl->AddRectFilled(origin_, max, engine::packColor(bg, 1.0f));

    dl->PushClipRect(origin_, max, true);
    upload(dl, canvas, origin_);
    dl->PopClipRect();

    // Keep the layout cursor consistent with the space the canvas took
    ImGui::Dummy(size_);
}

std::size_t IndicatorView::upload(ImDrawList* dl, const engine::Canvas& canvas, ImVec2 origin)
{
    const auto& verts = canvas.vertices();
    const auto& idx = canvas.indices();
    const std::size_t tri_count = idx.size() / 3;
    const ImVec2 uv = ImGui::GetFontTexUvWhitePixel();

    std::size_t batches = 0;
    std::size_t tri = 0;
    while (tri < tri_count)
    {
        // Grow the batch while its vertex span fits in one index window
        std::uint32_t lo = std::numeric_limits<std::uint32_t>::max();
        std::uint32_t hi = 0;
        std::size_t end = tri;
        while (end < tri_count)
        {
            std::uint32_t a = idx[end * 3], b = idx[end * 3 + 1], c = idx[end * 3 + 2];
            std::uint32_t nlo = std::min({ lo, a, b, c });
            std::uint32_t nhi = std::max({ hi, a, b, c });
            if (static_cast<std::size_t>(nhi - nlo) + 1 > kMaxBatchVertices)
                break;
            lo = nlo;
            hi = nhi;
            ++end;
        }
        if (end == tri)
        {
            // A single triangle spanning more than a batch cannot be drawn
            ++tri;
            continue;
        }

        const int vtx_count = static_cast<int>(hi - lo + 1);
        const int idx_count = static_cast<int>((end - tri) * 3);
        dl->PrimReserve(idx_count, vtx_count);
        const unsigned int base = dl->_VtxCurrentIdx;
        for (std::uint32_t v = lo; v <= hi; ++v)
        {
            const auto& cv = verts[v];
            dl->PrimWriteVtx(ImVec2(origin.x + cv.x, origin.y + cv.y), uv, cv.color);
        }
        for (std::size_t i = tri * 3; i < end * 3; ++i)
            dl->PrimWriteIdx(static_cast<ImDrawIdx>(base + (idx[i] - lo)));

        ++batches;
        tri = end;
    }
    return batches;
}
