#pragma once

#include "ChatTypes.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace chat
{

using MessageId = std::uint64_t;

// What the chat session needs from whatever displays the conversation.
class IChatView
{
public:
    virtual ~IChatView() = default;

    virtual MessageId addMessage(Role role, const std::string& text) = 0;
    virtual void setMessageText(MessageId id, const std::string& text) = 0;
    virtual void removeMessage(MessageId id) = 0;
    virtual void clear() = 0;

    // True when the bottom edge of the content is within threshold pixels
    // of the bottom of the viewport.
    virtual bool isNearBottom(float threshold) const = 0;
    virtual void scrollToBottom() = 0;
};

inline bool isWithinBottomThreshold(float content_height, float scroll_offset, float viewport_height,
                                    float threshold)
{
    return std::fabs(content_height - scroll_offset - viewport_height) <= threshold;
}

} // namespace chat
