#pragma once

#include "chat/IChatView.hpp"

#include <array>
#include <functional>
#include <string>
#include <vector>

// Conversation panel: scrolling message log plus the input line.
// Implements the view side of the chat session.
class ChatWindow : public chat::IChatView
{
public:
    using SendHandler = std::function<void(const std::string&)>;

    struct Entry
    {
        chat::MessageId id = 0;
        chat::Role role = chat::Role::User;
        std::string text;
    };

    explicit ChatWindow(SendHandler on_send);

    chat::MessageId addMessage(chat::Role role, const std::string& text) override;
    void setMessageText(chat::MessageId id, const std::string& text) override;
    void removeMessage(chat::MessageId id) override;
    void clear() override;
    bool isNearBottom(float threshold) const override;
    void scrollToBottom() override;

    // Draws into the current window, filling the remaining content region
    void render(float delta_time, bool busy);

    bool inputFocused() const { return input_focused_; }
    const std::vector<Entry>& entries() const { return entries_; }

private:
    void renderLog(float delta_time);
    void renderEntry(const Entry& entry, float wrap_width);
    void renderInput(bool busy);
    void submit();
    Entry* find(chat::MessageId id);

    SendHandler on_send_;
    std::vector<Entry> entries_;
    chat::MessageId next_id_ = 1;

    std::array<char, 4096> input_buf_{};
    bool input_focused_ = false;
    bool refocus_input_ = true;

    // Scroll metrics from the last rendered frame
    float content_height_ = 0.0f;
    float scroll_y_ = 0.0f;
    float viewport_height_ = 0.0f;

    bool smooth_scroll_ = false;
    int smooth_frames_ = 0;
};
