#pragma once

#include <string>

namespace ipc
{
    // One inbound activity line, whichever source it came from
    struct LogEvent
    {
        std::string type;      // "log" for activity lines
        std::string content;
        bool is_error = false;
    };

    enum class ChannelStatus
    {
        Connecting,
        Online,
        Disconnected
    };

    const char* channelStatusLabel(ChannelStatus status);

    // Parses one newline-delimited JSON message:
    //   { "type": "log", "content": "...", "is_error": false }
    // Returns false for anything that is not an object with a string "type".
    bool parseEventLine(const std::string& line, LogEvent& out);

    // Builds an event from a plain log-file line; lines mentioning ERROR or
    // Exception are flagged as errors.
    LogEvent makeFileEvent(std::string line);
}
