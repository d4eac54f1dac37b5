#pragma once

#include "ChatTypes.hpp"
#include "IChatView.hpp"
#include "StreamAssembly.hpp"
#include "ThinkingAnimation.hpp"
#include "engine/Clock.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chat
{

class IChatTransport;

struct ChatSessionConfig
{
    std::string endpoint;
    std::string model;
    int connect_timeout_ms = 5000;
    int timeout_ms = 600000;
    float scroll_follow_threshold = 50.0f;
};

// Hooks into the indicator. All of them run on the thread calling send()/update().
struct TurnCallbacks
{
    std::function<void()> on_turn_started;
    std::function<void()> on_turn_finished;
    std::function<void()> on_error; // in-stream error record or failed request
};

enum class SendResult
{
    Sent,
    Empty,          // nothing but whitespace
    Busy,           // a turn is already in flight
    Cleared,        // "/clear" handled locally
    TransportError  // the request could not be started
};

const char* sendResultName(SendResult result);

/**
 * @brief One conversation: history, the in-flight turn and its view updates
 *
 * Drives the turn from user input to finished assistant message:
 *   send()   - records the user turn, shows the placeholder, starts the request
 *   update() - once per frame; drains transport events in arrival order,
 *              animates the placeholder and expires transient notices
 */
class ChatSession
{
public:
    static constexpr const char* kClearCommand = "/clear";
    static constexpr const char* kClearedNotice = "Context cleared";
    static constexpr const char* kNoResponse = "No response";
    static constexpr std::chrono::milliseconds kNoticeDuration{ 2000 };

    ChatSession(IChatView& view, IChatTransport& transport, ChatSessionConfig config, TurnCallbacks callbacks = {});
    ~ChatSession();

    SendResult send(const std::string& input, engine::TimePoint now);
    void update(engine::TimePoint now);

    // Abandons the in-flight request, if any, without touching the history
    void cancel();

    bool busy() const { return busy_; }
    const ChatHistory& history() const { return history_; }
    const StreamAssembly& assembly() const { return assembly_; }
    const ChatSessionConfig& config() const { return config_; }
    void setConfig(ChatSessionConfig config) { config_ = std::move(config); }

private:
    void handleEvent(TransportEvent& ev);
    void applyRecord(const StreamRecord& record);
    void appendContent(const std::string& fragment);
    void completeTurn();
    void failTurn(const std::string& message);
    void finishTurn();
    void postSystemMessage(const std::string& text);

    IChatView& view_;
    IChatTransport& transport_;
    ChatSessionConfig config_;
    TurnCallbacks callbacks_;

    ChatHistory history_;
    StreamAssembly assembly_;
    ThinkingAnimation thinking_;

    bool busy_ = false;
    std::optional<MessageId> reply_id_;
    std::optional<engine::TimePoint> last_update_;

    struct Notice
    {
        MessageId id;
        engine::TimePoint expires;
    };
    std::vector<Notice> notices_;
    std::vector<TransportEvent> scratch_;
};

} // namespace chat
