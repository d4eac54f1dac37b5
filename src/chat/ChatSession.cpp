#include "ChatSession.hpp"
#include "IChatTransport.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace chat
{

namespace
{

std::string trimCopy(const std::string& s)
{
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    if (first >= last)
        return {};
    return std::string(first, last);
}

void invoke(const std::function<void()>& fn)
{
    if (fn)
        fn();
}

} // namespace

const char* sendResultName(SendResult result)
{
    switch (result)
    {
    case SendResult::Sent:
        return "sent";
    case SendResult::Empty:
        return "empty";
    case SendResult::Busy:
        return "busy";
    case SendResult::Cleared:
        return "cleared";
    case SendResult::TransportError:
        return "transport_error";
    }
    return "unknown";
}

ChatSession::ChatSession(IChatView& view, IChatTransport& transport, ChatSessionConfig config,
                         TurnCallbacks callbacks)
    : view_(view)
    , transport_(transport)
    , config_(std::move(config))
    , callbacks_(std::move(callbacks))
{
}

ChatSession::~ChatSession() = default;

SendResult ChatSession::send(const std::string& input, engine::TimePoint now)
{
    std::string text = trimCopy(input);
    if (text.empty())
        return SendResult::Empty;
    if (busy_)
    {
        PLOG_DEBUG << "Send ignored, a turn is in flight";
        return SendResult::Busy;
    }

    view_.addMessage(Role::User, text);
    view_.scrollToBottom();

    if (text == kClearCommand)
    {
        history_.clear();
        notices_.clear();
        view_.clear();
        MessageId id = view_.addMessage(Role::System, kClearedNotice);
        notices_.push_back({ id, now + kNoticeDuration });
        PLOG_INFO << "Conversation context cleared";
        return SendResult::Cleared;
    }

    history_.pushUser(text);

    ChatRequest request;
    request.endpoint = config_.endpoint;
    request.model = config_.model;
    request.messages = history_.messages();
    request.connect_timeout_ms = config_.connect_timeout_ms;
    request.timeout_ms = config_.timeout_ms;

    assembly_.reset();
    thinking_.reset();
    reply_id_ = view_.addMessage(Role::Assistant, thinking_.label());
    view_.scrollToBottom();
    last_update_ = now;

    busy_ = true;
    invoke(callbacks_.on_turn_started);

    if (!transport_.begin(request))
    {
        std::string reason = transport_.lastError();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Chat, "Could not start chat request", reason);
        failTurn(reason);
        return SendResult::TransportError;
    }
    return SendResult::Sent;
}

void ChatSession::update(engine::TimePoint now)
{
    float dt = 0.0f;
    if (last_update_)
        dt = std::chrono::duration<float>(now - *last_update_).count();
    last_update_ = now;

    if (busy_)
    {
        scratch_.clear();
        transport_.drain(scratch_);
        for (auto& ev : scratch_)
        {
            handleEvent(ev);
            if (!busy_)
                break;
        }
        scratch_.clear();

        if (busy_ && reply_id_ && !assembly_.hasContent() && thinking_.advance(dt))
            view_.setMessageText(*reply_id_, thinking_.label());
    }

    auto expired = std::remove_if(notices_.begin(), notices_.end(),
                                  [this, now](const Notice& n)
                                  {
                                      if (now < n.expires)
                                          return false;
                                      view_.removeMessage(n.id);
                                      return true;
                                  });
    notices_.erase(expired, notices_.end());
}

void ChatSession::cancel()
{
    if (!busy_)
        return;
    transport_.cancel();
    scratch_.clear();
    transport_.drain(scratch_);
    scratch_.clear();
    finishTurn();
}

void ChatSession::handleEvent(TransportEvent& ev)
{
    switch (ev.kind)
    {
    case TransportEvent::Kind::Data:
        for (const auto& record : assembly_.feed(ev.data))
            applyRecord(record);
        break;
    case TransportEvent::Kind::Completed:
        assembly_.finish();
        completeTurn();
        break;
    case TransportEvent::Kind::Failed:
        PLOG_WARNING << "Chat turn failed: " << ev.error;
        failTurn(ev.error);
        break;
    }
}

void ChatSession::applyRecord(const StreamRecord& record)
{
    if (record.kind == RecordKind::Content)
    {
        appendContent(record.text);
    }
    else if (record.kind == RecordKind::Error)
    {
        PLOG_WARNING << "Stream reported error: " << record.text;
        postSystemMessage("Error: " + record.text);
        invoke(callbacks_.on_error);
    }
}

void ChatSession::appendContent(const std::string& fragment)
{
    // Follow the stream only if the reader was already at the bottom
    bool follow = view_.isNearBottom(config_.scroll_follow_threshold);

    assembly_.append(fragment);
    if (reply_id_)
        view_.setMessageText(*reply_id_, assembly_.text());
    else
        reply_id_ = view_.addMessage(Role::Assistant, assembly_.text());

    if (follow)
        view_.scrollToBottom();
}

void ChatSession::completeTurn()
{
    if (assembly_.hasContent())
    {
        history_.pushAssistant(assembly_.text());
    }
    else
    {
        if (reply_id_)
            view_.setMessageText(*reply_id_, kNoResponse);
        else
            reply_id_ = view_.addMessage(Role::Assistant, kNoResponse);
        history_.pushAssistant(kNoResponse);
    }
    finishTurn();
}

void ChatSession::failTurn(const std::string& message)
{
    history_.rollbackLastUser();

    // Partial text stays visible; an untouched placeholder goes away
    if (reply_id_ && !assembly_.hasContent())
    {
        view_.removeMessage(*reply_id_);
        reply_id_.reset();
    }

    postSystemMessage("Network Error: " + (message.empty() ? std::string("request failed") : message));
    invoke(callbacks_.on_error);
    finishTurn();
}

void ChatSession::finishTurn()
{
    busy_ = false;
    reply_id_.reset();
    invoke(callbacks_.on_turn_finished);
}

void ChatSession::postSystemMessage(const std::string& text)
{
    bool follow = view_.isNearBottom(config_.scroll_follow_threshold);
    view_.addMessage(Role::System, text);
    if (follow)
        view_.scrollToBottom();
}

} // namespace chat
