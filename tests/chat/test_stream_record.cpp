#include <catch2/catch_test_macros.hpp>

#include "chat/ChatTypes.hpp"
#include "chat/StreamRecord.hpp"

#include <nlohmann/json.hpp>

using chat::RecordKind;
using chat::parseStreamLine;

TEST_CASE("Stream lines carrying delta content", "[stream_record]")
{
    auto rec = parseStreamLine(R"(data: {"choices":[{"delta":{"content":"Hel"}}]})");
    REQUIRE(rec.kind == RecordKind::Content);
    REQUIRE(rec.text == "Hel");

    SECTION("surrounding whitespace is ignored")
    {
        auto padded = parseStreamLine("  data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}  \r");
        REQUIRE(padded.kind == RecordKind::Content);
        REQUIRE(padded.text == "lo");
    }
}

TEST_CASE("Stream lines fall back to message content, then error", "[stream_record]")
{
    auto msg = parseStreamLine(R"(data: {"message":{"content":"whole reply"}})");
    REQUIRE(msg.kind == RecordKind::Content);
    REQUIRE(msg.text == "whole reply");

    auto empty_delta = parseStreamLine(R"(data: {"choices":[{"delta":{"content":""}}],"message":{"content":"m"}})");
    REQUIRE(empty_delta.kind == RecordKind::Content);
    REQUIRE(empty_delta.text == "m");

    auto err = parseStreamLine(R"(data: {"error":"model overloaded"})");
    REQUIRE(err.kind == RecordKind::Error);
    REQUIRE(err.text == "model overloaded");

    auto err_obj = parseStreamLine(R"(data: {"error":{"message":"bad key","code":401}})");
    REQUIRE(err_obj.kind == RecordKind::Error);
    REQUIRE(err_obj.text == "bad key");
}

TEST_CASE("Stream lines that carry nothing usable", "[stream_record]")
{
    REQUIRE(parseStreamLine("").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine(": keep-alive").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine("event: message").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine(R"(data: {"choices":[{"delta":{"role":"assistant"}}]})").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine(R"(data: {"choices":[]})").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine("data: 42").kind == RecordKind::Skip);
    REQUIRE(parseStreamLine("data: [DONE]").kind == RecordKind::Done);

    auto bad = parseStreamLine("data: {not json");
    REQUIRE(bad.kind == RecordKind::Malformed);
    REQUIRE(bad.text == "{not json");
}

TEST_CASE("Request body contains model, history and stream flag", "[chat_types]")
{
    chat::ChatRequest request;
    request.model = "test-model";
    request.messages = { { chat::Role::User, "hi" },
                         { chat::Role::Assistant, "hello" },
                         { chat::Role::System, "local notice" },
                         { chat::Role::User, "again" } };

    auto body = chat::buildRequestBody(request);
    REQUIRE(body["model"] == "test-model");
    REQUIRE(body["stream"] == true);
    REQUIRE(body["messages"].size() == 3);
    REQUIRE(body["messages"][0]["role"] == "user");
    REQUIRE(body["messages"][1]["role"] == "assistant");
    REQUIRE(body["messages"][2]["content"] == "again");
}

TEST_CASE("History rolls back only a trailing user turn", "[chat_types]")
{
    chat::ChatHistory history;
    REQUIRE_FALSE(history.rollbackLastUser());

    history.pushUser("q1");
    history.pushAssistant("a1");
    REQUIRE_FALSE(history.rollbackLastUser());
    REQUIRE(history.size() == 2);

    history.pushUser("q2");
    REQUIRE(history.rollbackLastUser());
    REQUIRE(history.size() == 2);
    REQUIRE(history.messages().back().content == "a1");
}
