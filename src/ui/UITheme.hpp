#pragma once

#include <imgui.h>

// Dark translucent panels with neon accents, matching the indicator palette
class UITheme
{
public:
    static const ImVec4& panelBgColor() { return panel_bg_; }
    static const ImVec4& panelBorderColor() { return panel_border_; }
    static const ImVec4& textColor() { return text_; }
    static const ImVec4& mutedTextColor() { return muted_text_; }
    static const ImVec4& accentColor() { return accent_; }
    static const ImVec4& userBubbleColor() { return user_bubble_; }
    static const ImVec4& assistantBubbleColor() { return assistant_bubble_; }
    static const ImVec4& systemTextColor() { return system_text_; }
    static const ImVec4& onlineColor() { return online_; }
    static const ImVec4& offlineColor() { return offline_; }
    static const ImVec4& connectingColor() { return connecting_; }

    static float bubbleRounding() { return 10.0f; }
    static float bubblePadding() { return 10.0f; }

    static void pushPanelStyle(float background_alpha, const ImVec2& padding, float rounding, float border_thickness);
    static void popPanelStyle();

    static void applyTheme();

private:
    static constexpr ImVec4 panel_bg_         = ImVec4(0.02f, 0.02f, 0.04f, 0.82f);
    static constexpr ImVec4 panel_border_     = ImVec4(0.74f, 0.0f, 1.0f, 0.35f);
    static constexpr ImVec4 text_             = ImVec4(0.90f, 0.92f, 0.95f, 1.0f);
    static constexpr ImVec4 muted_text_       = ImVec4(0.55f, 0.58f, 0.65f, 1.0f);
    static constexpr ImVec4 accent_           = ImVec4(0.0f, 0.95f, 1.0f, 1.0f);
    static constexpr ImVec4 user_bubble_      = ImVec4(0.0f, 0.37f, 1.0f, 0.35f);
    static constexpr ImVec4 assistant_bubble_ = ImVec4(1.0f, 1.0f, 1.0f, 0.06f);
    static constexpr ImVec4 system_text_      = ImVec4(1.0f, 0.67f, 0.0f, 1.0f);
    static constexpr ImVec4 online_           = ImVec4(0.0f, 1.0f, 0.62f, 1.0f);
    static constexpr ImVec4 offline_          = ImVec4(1.0f, 0.16f, 0.16f, 1.0f);
    static constexpr ImVec4 connecting_       = ImVec4(1.0f, 0.67f, 0.0f, 1.0f);
};
