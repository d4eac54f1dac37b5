#include "test_doubles.hpp"

namespace test_utils {

bool ScriptedTransport::begin(const chat::ChatRequest& request)
{
    if (fail_begin) {
        error = "connection refused";
        return false;
    }
    requests.push_back(request);
    active_ = true;
    return true;
}

void ScriptedTransport::drain(std::vector<chat::TransportEvent>& out)
{
    while (!queue_.empty()) {
        const auto& ev = queue_.front();
        if (ev.kind != chat::TransportEvent::Kind::Data)
            active_ = false;
        out.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
}

void ScriptedTransport::cancel()
{
    ++cancels;
    active_ = false;
    queue_.clear();
}

void ScriptedTransport::pushData(const std::string& data)
{
    chat::TransportEvent ev;
    ev.kind = chat::TransportEvent::Kind::Data;
    ev.data = data;
    queue_.push_back(std::move(ev));
}

void ScriptedTransport::pushCompleted(int status)
{
    chat::TransportEvent ev;
    ev.kind = chat::TransportEvent::Kind::Completed;
    ev.status = status;
    queue_.push_back(std::move(ev));
}

void ScriptedTransport::pushFailed(const std::string& message)
{
    chat::TransportEvent ev;
    ev.kind = chat::TransportEvent::Kind::Failed;
    ev.error = message;
    queue_.push_back(std::move(ev));
}

chat::MessageId FakeChatView::addMessage(chat::Role role, const std::string& text)
{
    chat::MessageId id = next_id_++;
    messages_[id] = { role, text };
    return id;
}

void FakeChatView::setMessageText(chat::MessageId id, const std::string& text)
{
    auto it = messages_.find(id);
    if (it != messages_.end())
        it->second.text = text;
}

void FakeChatView::removeMessage(chat::MessageId id) { messages_.erase(id); }

void FakeChatView::clear()
{
    ++clears;
    messages_.clear();
}

bool FakeChatView::isNearBottom(float threshold) const
{
    last_threshold = threshold;
    return near_bottom;
}

std::vector<FakeChatView::Message> FakeChatView::ordered() const
{
    std::vector<Message> out;
    for (const auto& [id, msg] : messages_)
        out.push_back(msg);
    return out;
}

std::optional<FakeChatView::Message> FakeChatView::find(chat::MessageId id) const
{
    auto it = messages_.find(id);
    if (it == messages_.end())
        return std::nullopt;
    return it->second;
}

std::size_t FakeChatView::count(chat::Role role) const
{
    std::size_t n = 0;
    for (const auto& [id, msg] : messages_)
        if (msg.role == role)
            ++n;
    return n;
}

const FakeChatView::Message* FakeChatView::last() const
{
    if (messages_.empty())
        return nullptr;
    return &messages_.rbegin()->second;
}

} // namespace test_utils
