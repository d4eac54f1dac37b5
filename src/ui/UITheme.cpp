#include "UITheme.hpp"

void UITheme::pushPanelStyle(float background_alpha, const ImVec2& padding, float rounding, float border_thickness)
{
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, padding);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, rounding);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, border_thickness);

    ImVec4 bg = panelBgColor();
    bg.w = background_alpha;
    ImGui::PushStyleColor(ImGuiCol_WindowBg, bg);
    ImGui::PushStyleColor(ImGuiCol_Border, panelBorderColor());
    ImGui::PushStyleColor(ImGuiCol_Text, textColor());
}

void UITheme::popPanelStyle()
{
    ImGui::PopStyleColor(3);
    ImGui::PopStyleVar(3);
}

void UITheme::applyTheme()
{
    ImGuiStyle& s = ImGui::GetStyle();
    ImVec4 bg = panelBgColor();
    s.Colors[ImGuiCol_WindowBg] = bg;
    s.Colors[ImGuiCol_ChildBg] = ImVec4(0, 0, 0, 0);
    s.Colors[ImGuiCol_PopupBg] = ImVec4(bg.x, bg.y, bg.z, 0.96f);
    s.Colors[ImGuiCol_Border] = panelBorderColor();
    s.Colors[ImGuiCol_Text] = textColor();
    s.Colors[ImGuiCol_TextDisabled] = mutedTextColor();

    ImVec4 violet = ImVec4(0.74f, 0.0f, 1.0f, 0.55f);
    ImVec4 violet_hovered = ImVec4(0.74f, 0.0f, 1.0f, 0.75f);
    ImVec4 violet_active = ImVec4(0.84f, 0.25f, 1.0f, 0.9f);
    ImVec4 frame = ImVec4(1.0f, 1.0f, 1.0f, 0.05f);

    s.Colors[ImGuiCol_FrameBg] = frame;
    s.Colors[ImGuiCol_FrameBgHovered] = ImVec4(1.0f, 1.0f, 1.0f, 0.09f);
    s.Colors[ImGuiCol_FrameBgActive] = ImVec4(1.0f, 1.0f, 1.0f, 0.12f);

    s.Colors[ImGuiCol_Button] = violet;
    s.Colors[ImGuiCol_ButtonHovered] = violet_hovered;
    s.Colors[ImGuiCol_ButtonActive] = violet_active;

    s.Colors[ImGuiCol_Header] = violet;
    s.Colors[ImGuiCol_HeaderHovered] = violet_hovered;
    s.Colors[ImGuiCol_HeaderActive] = violet_active;

    s.Colors[ImGuiCol_ScrollbarBg] = ImVec4(0, 0, 0, 0);
    s.Colors[ImGuiCol_ScrollbarGrab] = ImVec4(1.0f, 1.0f, 1.0f, 0.12f);
    s.Colors[ImGuiCol_ScrollbarGrabHovered] = ImVec4(1.0f, 1.0f, 1.0f, 0.2f);
    s.Colors[ImGuiCol_ScrollbarGrabActive] = violet;

    s.Colors[ImGuiCol_TitleBg] = ImVec4(bg.x, bg.y, bg.z, 0.9f);
    s.Colors[ImGuiCol_TitleBgActive] = ImVec4(bg.x + 0.06f, bg.y + 0.02f, bg.z + 0.1f, 0.95f);
    s.Colors[ImGuiCol_TextSelectedBg] = ImVec4(0.0f, 0.95f, 1.0f, 0.3f);
    s.Colors[ImGuiCol_ModalWindowDimBg] = ImVec4(0.0f, 0.0f, 0.0f, 0.6f);

    s.WindowRounding = 12.0f;
    s.FrameRounding = 8.0f;
    s.WindowBorderSize = 1.0f;
    s.ScrollbarSize = 10.0f;
    s.ScrollbarRounding = 9.0f;
    s.GrabRounding = 8.0f;
}
