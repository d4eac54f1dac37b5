#include "ChatTypes.hpp"

#include <nlohmann/json.hpp>

namespace chat
{

const char* roleName(Role role)
{
    switch (role)
    {
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    case Role::System:
        return "system";
    }
    return "user";
}

void ChatHistory::pushUser(std::string content) { messages_.push_back({ Role::User, std::move(content) }); }

void ChatHistory::pushAssistant(std::string content)
{
    messages_.push_back({ Role::Assistant, std::move(content) });
}

bool ChatHistory::rollbackLastUser()
{
    if (messages_.empty() || messages_.back().role != Role::User)
        return false;
    messages_.pop_back();
    return true;
}

nlohmann::json buildRequestBody(const ChatRequest& request)
{
    nlohmann::json body;
    body["model"] = request.model;
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : request.messages)
    {
        if (message.role == Role::System)
            continue;
        messages.push_back({ { "role", roleName(message.role) }, { "content", message.content } });
    }
    body["messages"] = std::move(messages);
    body["stream"] = true;
    return body;
}

} // namespace chat
