#pragma once

#include "ipc/LogEvent.hpp"

#include <imgui.h>

namespace app
{
struct BadgeState;
struct CaptionState;
}

// Draws on top of the indicator: connection status, activity badge and the
// monologue caption.
class ActivityOverlay
{
public:
    void draw(ImVec2 origin, ImVec2 size, const app::BadgeState& badge, const app::CaptionState& caption,
              ipc::ChannelStatus status, ImFont* badge_font);

    static ImVec4 statusColor(ipc::ChannelStatus status);

private:
    void drawStatus(ImDrawList* dl, ImVec2 origin, ipc::ChannelStatus status);
    void drawBadge(ImDrawList* dl, ImVec2 origin, ImVec2 size, const app::BadgeState& badge, ImFont* font);
    void drawCaption(ImDrawList* dl, ImVec2 origin, ImVec2 size, const app::CaptionState& caption);
};
