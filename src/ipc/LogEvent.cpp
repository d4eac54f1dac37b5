#include "LogEvent.hpp"

#include <nlohmann/json.hpp>

namespace ipc
{

const char* channelStatusLabel(ChannelStatus status)
{
    switch (status)
    {
    case ChannelStatus::Connecting:
        return "CONNECTING";
    case ChannelStatus::Online:
        return "SYSTEM ONLINE";
    case ChannelStatus::Disconnected:
        return "DISCONNECTED";
    }
    return "DISCONNECTED";
}

bool parseEventLine(const std::string& line, LogEvent& out)
{
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    auto type = j.find("type");
    if (type == j.end() || !type->is_string())
        return false;

    out.type = type->get<std::string>();
    out.content.clear();
    out.is_error = false;

    auto content = j.find("content");
    if (content != j.end() && content->is_string())
        out.content = content->get<std::string>();

    auto err = j.find("is_error");
    if (err != j.end() && err->is_boolean())
        out.is_error = err->get<bool>();
    return true;
}

LogEvent makeFileEvent(std::string line)
{
    LogEvent ev;
    ev.type = "log";
    ev.is_error = line.find("ERROR") != std::string::npos || line.find("Exception") != std::string::npos;
    ev.content = std::move(line);
    return ev;
}

} // namespace ipc
