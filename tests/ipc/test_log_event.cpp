#include <catch2/catch_test_macros.hpp>

#include "ipc/LogEvent.hpp"

#include <string>

using ipc::LogEvent;

TEST_CASE("Event lines parse type, content and error flag", "[log_event]")
{
    LogEvent ev;
    REQUIRE(ipc::parseEventLine(R"({"type":"log","content":"🧠 planning","is_error":true})", ev));
    REQUIRE(ev.type == "log");
    REQUIRE(ev.content == "🧠 planning");
    REQUIRE(ev.is_error);

    SECTION("optional fields default")
    {
        REQUIRE(ipc::parseEventLine(R"({"type":"heartbeat"})", ev));
        REQUIRE(ev.type == "heartbeat");
        REQUIRE(ev.content.empty());
        REQUIRE_FALSE(ev.is_error);
    }

    SECTION("wrongly typed optional fields are ignored")
    {
        REQUIRE(ipc::parseEventLine(R"({"type":"log","content":5,"is_error":"yes"})", ev));
        REQUIRE(ev.content.empty());
        REQUIRE_FALSE(ev.is_error);
    }
}

TEST_CASE("Event lines without a string type are rejected", "[log_event]")
{
    LogEvent ev;
    REQUIRE_FALSE(ipc::parseEventLine("", ev));
    REQUIRE_FALSE(ipc::parseEventLine("not json", ev));
    REQUIRE_FALSE(ipc::parseEventLine("[1,2]", ev));
    REQUIRE_FALSE(ipc::parseEventLine(R"({"content":"x"})", ev));
    REQUIRE_FALSE(ipc::parseEventLine(R"({"type":3})", ev));
}

TEST_CASE("File lines become log events flagged by keyword", "[log_event]")
{
    auto plain = ipc::makeFileEvent("🔍 searching docs");
    REQUIRE(plain.type == "log");
    REQUIRE(plain.content == "🔍 searching docs");
    REQUIRE_FALSE(plain.is_error);

    REQUIRE(ipc::makeFileEvent("2024-01-01 ERROR disk full").is_error);
    REQUIRE(ipc::makeFileEvent("Traceback: ValueError Exception raised").is_error);
    REQUIRE_FALSE(ipc::makeFileEvent("error in lowercase only").is_error);
}

TEST_CASE("Channel status labels", "[log_event]")
{
    REQUIRE(std::string(ipc::channelStatusLabel(ipc::ChannelStatus::Online)) == "SYSTEM ONLINE");
    REQUIRE(std::string(ipc::channelStatusLabel(ipc::ChannelStatus::Disconnected)) == "DISCONNECTED");
    REQUIRE(std::string(ipc::channelStatusLabel(ipc::ChannelStatus::Connecting)) == "CONNECTING");
}
