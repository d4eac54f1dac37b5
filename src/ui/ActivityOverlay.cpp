#include "ActivityOverlay.hpp"
#include "UITheme.hpp"
#include "app/ActivityController.hpp"
#include "engine/Color.hpp"

#include <algorithm>
#include <cfloat>

ImVec4 ActivityOverlay::statusColor(ipc::ChannelStatus status)
{
    switch (status)
    {
    case ipc::ChannelStatus::Online:
        return UITheme::onlineColor();
    case ipc::ChannelStatus::Connecting:
        return UITheme::connectingColor();
    case ipc::ChannelStatus::Disconnected:
        return UITheme::offlineColor();
    }
    return UITheme::offlineColor();
}

void ActivityOverlay::draw(ImVec2 origin, ImVec2 size, const app::BadgeState& badge,
                           const app::CaptionState& caption, ipc::ChannelStatus status, ImFont* badge_font)
{
    if (size.x < 1.0f || size.y < 1.0f)
        return;

    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->PushClipRect(origin, ImVec2(origin.x + size.x, origin.y + size.y), true);
    drawStatus(dl, origin, status);
    drawBadge(dl, origin, size, badge, badge_font);
    drawCaption(dl, origin, size, caption);
    dl->PopClipRect();
}

void ActivityOverlay::drawStatus(ImDrawList* dl, ImVec2 origin, ipc::ChannelStatus status)
{
    const float radius = 5.0f;
    ImVec2 center(origin.x + 18.0f, origin.y + 18.0f);
    ImU32 color = ImGui::ColorConvertFloat4ToU32(statusColor(status));

    if (status == ipc::ChannelStatus::Online)
    {
        ImVec4 glow = statusColor(status);
        glow.w = 0.25f;
        dl->AddCircleFilled(center, radius * 2.2f, ImGui::ColorConvertFloat4ToU32(glow), 20);
    }
    dl->AddCircleFilled(center, radius, color, 16);

    ImVec2 text_pos(center.x + radius + 8.0f, center.y - ImGui::GetTextLineHeight() * 0.5f);
    dl->AddText(text_pos, ImGui::ColorConvertFloat4ToU32(UITheme::mutedTextColor()),
                ipc::channelStatusLabel(status));
}

void ActivityOverlay::drawBadge(ImDrawList* dl, ImVec2 origin, ImVec2 size, const app::BadgeState& badge,
                                ImFont* font)
{
    if (badge.symbol.empty() || badge.opacity <= 0.0f)
        return;

    if (!font)
        font = ImGui::GetFont();
    const float font_size = ImGui::GetFontSize() * 2.0f * badge.scale;
    ImVec2 text_size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, badge.symbol.c_str());

    ImVec2 center(origin.x + size.x - 40.0f, origin.y + 40.0f);
    engine::Color accent = engine::Color::fromRgb(badge.color);
    dl->AddCircleFilled(center, 26.0f * badge.scale, engine::packColor(accent, 0.18f * badge.opacity), 32);
    dl->AddCircle(center, 26.0f * badge.scale, engine::packColor(accent, 0.6f * badge.opacity), 32, 1.5f);

    ImVec2 pos(center.x - text_size.x * 0.5f, center.y - text_size.y * 0.5f);
    dl->AddText(font, font_size, pos, IM_COL32(255, 255, 255, static_cast<int>(255.0f * badge.opacity)),
                badge.symbol.c_str());
}

void ActivityOverlay::drawCaption(ImDrawList* dl, ImVec2 origin, ImVec2 size, const app::CaptionState& caption)
{
    if (!caption.visible || caption.text.empty())
        return;

    const float margin = 24.0f;
    const float wrap = std::max(size.x - margin * 4.0f, 80.0f);
    ImFont* font = ImGui::GetFont();
    const float font_size = ImGui::GetFontSize();
    ImVec2 text_size = font->CalcTextSizeA(font_size, FLT_MAX, wrap, caption.text.c_str());

    ImVec2 pos(origin.x + (size.x - text_size.x) * 0.5f, origin.y + size.y - text_size.y - margin);
    ImVec2 pad(12.0f, 8.0f);
    dl->AddRectFilled(ImVec2(pos.x - pad.x, pos.y - pad.y),
                      ImVec2(pos.x + text_size.x + pad.x, pos.y + text_size.y + pad.y), IM_COL32(0, 0, 0, 170),
                      8.0f);
    dl->AddText(font, font_size, pos, ImGui::ColorConvertFloat4ToU32(UITheme::accentColor()), caption.text.c_str(),
                nullptr, wrap);
}
