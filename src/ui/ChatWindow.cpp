#include "ChatWindow.hpp"
#include "UITheme.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace
{
    constexpr float kScrollEaseRate = 14.0f;
    constexpr int kMinScrollFrames = 2;
}

ChatWindow::ChatWindow(SendHandler on_send)
    : on_send_(std::move(on_send))
{
}

chat::MessageId ChatWindow::addMessage(chat::Role role, const std::string& text)
{
    Entry entry;
    entry.id = next_id_++;
    entry.role = role;
    entry.text = text;
    entries_.push_back(std::move(entry));
    return entries_.back().id;
}

ChatWindow::Entry* ChatWindow::find(chat::MessageId id)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

void ChatWindow::setMessageText(chat::MessageId id, const std::string& text)
{
    if (Entry* entry = find(id))
        entry->text = text;
}

void ChatWindow::removeMessage(chat::MessageId id)
{
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; }),
                   entries_.end());
}

void ChatWindow::clear() { entries_.clear(); }

bool ChatWindow::isNearBottom(float threshold) const
{
    return chat::isWithinBottomThreshold(content_height_, scroll_y_, viewport_height_, threshold);
}

void ChatWindow::scrollToBottom()
{
    smooth_scroll_ = true;
    smooth_frames_ = 0;
}

void ChatWindow::render(float delta_time, bool busy)
{
    float input_height = ImGui::GetFrameHeightWithSpacing() + ImGui::GetStyle().ItemSpacing.y;
    ImGui::BeginChild("##chat_log", ImVec2(0, -input_height), false);
    renderLog(delta_time);
    ImGui::EndChild();

    renderInput(busy);
}

void ChatWindow::renderLog(float delta_time)
{
    float wrap_width = ImGui::GetContentRegionAvail().x;
    for (const auto& entry : entries_)
        renderEntry(entry, wrap_width);

    // User wheel input wins over an in-progress follow
    if (smooth_scroll_ && ImGui::IsWindowHovered() && ImGui::GetIO().MouseWheel != 0.0f)
        smooth_scroll_ = false;

    if (smooth_scroll_)
    {
        float target = ImGui::GetScrollMaxY();
        float current = ImGui::GetScrollY();
        float t = std::min(1.0f, std::max(delta_time, 0.0f) * kScrollEaseRate);
        if (std::fabs(target - current) < 1.0f && smooth_frames_ >= kMinScrollFrames)
        {
            ImGui::SetScrollY(target);
            smooth_scroll_ = false;
        }
        else
        {
            ImGui::SetScrollY(current + (target - current) * t);
            ++smooth_frames_;
        }
    }

    viewport_height_ = ImGui::GetWindowHeight();
    scroll_y_ = ImGui::GetScrollY();
    content_height_ = ImGui::GetScrollMaxY() + viewport_height_;
}

void ChatWindow::renderEntry(const Entry& entry, float wrap_width)
{
    const float pad = UITheme::bubblePadding();
    ImDrawList* dl = ImGui::GetWindowDrawList();

    ImGui::PushID(static_cast<int>(entry.id));
    if (entry.role == chat::Role::System)
    {
        ImGui::PushStyleColor(ImGuiCol_Text, UITheme::systemTextColor());
        ImGui::PushTextWrapPos(ImGui::GetCursorPosX() + wrap_width);
        ImGui::TextUnformatted(entry.text.c_str());
        ImGui::PopTextWrapPos();
        ImGui::PopStyleColor();
        ImGui::Spacing();
        ImGui::PopID();
        return;
    }

    const bool user = entry.role == chat::Role::User;
    const float bubble_width = wrap_width * 0.85f;
    const float text_width = std::max(bubble_width - pad * 2.0f, 20.0f);
    ImVec2 text_size = ImGui::CalcTextSize(entry.text.c_str(), nullptr, false, text_width);

    float x = ImGui::GetCursorPosX();
    if (user)
        x += wrap_width - (text_size.x + pad * 2.0f);
    ImGui::SetCursorPosX(x + pad);
    ImGui::SetCursorPosY(ImGui::GetCursorPosY() + pad);

    dl->ChannelsSplit(2);
    dl->ChannelsSetCurrent(1);
    ImGui::PushTextWrapPos(ImGui::GetCursorPosX() + text_width);
    ImGui::TextUnformatted(entry.text.c_str());
    ImGui::PopTextWrapPos();

    ImVec2 min = ImGui::GetItemRectMin();
    ImVec2 max = ImGui::GetItemRectMax();
    dl->ChannelsSetCurrent(0);
    const ImVec4& fill = user ? UITheme::userBubbleColor() : UITheme::assistantBubbleColor();
    dl->AddRectFilled(ImVec2(min.x - pad, min.y - pad), ImVec2(max.x + pad, max.y + pad),
                      ImGui::ColorConvertFloat4ToU32(fill), UITheme::bubbleRounding());
    dl->ChannelsMerge();

    ImGui::Dummy(ImVec2(0.0f, pad));
    ImGui::PopID();
}

void ChatWindow::renderInput(bool busy)
{
    if (refocus_input_)
    {
        ImGui::SetKeyboardFocusHere();
        refocus_input_ = false;
    }

    float button_width = ImGui::CalcTextSize("Send").x + ImGui::GetStyle().FramePadding.x * 2.0f;
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x - button_width - ImGui::GetStyle().ItemSpacing.x);
    bool entered = ImGui::InputTextWithHint("##chat_input", busy ? "Waiting for reply..." : "Message the agent",
                                            input_buf_.data(), input_buf_.size(),
                                            ImGuiInputTextFlags_EnterReturnsTrue);
    input_focused_ = ImGui::IsItemActive();
    ImGui::SameLine();

    ImGui::BeginDisabled(busy);
    bool clicked = ImGui::Button("Send");
    ImGui::EndDisabled();

    if ((entered || clicked) && !busy)
        submit();
    if (entered)
        refocus_input_ = true;
}

void ChatWindow::submit()
{
    std::string text(input_buf_.data());
    if (text.empty())
        return;
    input_buf_.fill('\0');
    if (on_send_)
        on_send_(text);
}
