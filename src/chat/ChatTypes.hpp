#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chat
{

enum class Role
{
    User,
    Assistant,
    System // view-only notices, never sent
};

const char* roleName(Role role);

struct ChatMessage
{
    Role role = Role::User;
    std::string content;
};

// Conversation sent with every request. Append-only, except that the
// latest user turn is removed again when its request fails.
class ChatHistory
{
public:
    void pushUser(std::string content);
    void pushAssistant(std::string content);

    // Removes the last message if it is a user turn. Returns false otherwise.
    bool rollbackLastUser();

    void clear() { messages_.clear(); }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    const std::vector<ChatMessage>& messages() const { return messages_; }

private:
    std::vector<ChatMessage> messages_;
};

struct ChatRequest
{
    std::string endpoint;
    std::string model;
    std::vector<ChatMessage> messages;
    int connect_timeout_ms = 5000;
    int timeout_ms = 600000;
};

// { "model": ..., "messages": [{ "role", "content" }...], "stream": true }
nlohmann::json buildRequestBody(const ChatRequest& request);

struct TransportEvent
{
    enum class Kind
    {
        Data,      // raw body bytes, arbitrary boundaries
        Completed, // body finished with a success status
        Failed     // network error or non-success status; error holds the message
    };

    Kind kind = Kind::Data;
    std::string data;
    int status = 0;
    std::string error;
};

} // namespace chat
