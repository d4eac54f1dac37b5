#include <catch2/catch_test_macros.hpp>

#include "chat/ChatSession.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/test_doubles.hpp"

using namespace std::chrono_literals;
using chat::Role;
using chat::SendResult;

namespace {

std::string delta(const std::string& text)
{
    return "data: {\"choices\":[{\"delta\":{\"content\":\"" + text + "\"}}]}\n";
}

struct SessionFixture {
    test_utils::FakeChatView view;
    test_utils::ScriptedTransport transport;
    test_utils::ManualClock clock;
    int started = 0;
    int finished = 0;
    int errors = 0;
    chat::ChatSession session{ view, transport, chat::ChatSessionConfig{ "http://localhost:8000/api/chat", "m" },
                               chat::TurnCallbacks{ [this] { ++started; }, [this] { ++finished; },
                                                    [this] { ++errors; } } };

    void tick(std::chrono::milliseconds step = 16ms)
    {
        clock.advance(step);
        session.update(clock.now());
    }
};

} // namespace

TEST_CASE("Blank input is ignored", "[chat_session]")
{
    SessionFixture fx;
    REQUIRE(fx.session.send("   \n\t", fx.clock.now()) == SendResult::Empty);
    REQUIRE(fx.view.ordered().empty());
    REQUIRE(fx.transport.requests.empty());
    REQUIRE(fx.started == 0);
}

TEST_CASE("A sent turn shows the user message and a thinking placeholder", "[chat_session]")
{
    SessionFixture fx;
    REQUIRE(fx.session.send("  hello  ", fx.clock.now()) == SendResult::Sent);

    auto msgs = fx.view.ordered();
    REQUIRE(msgs.size() == 2);
    REQUIRE(msgs[0].role == Role::User);
    REQUIRE(msgs[0].text == "hello");
    REQUIRE(msgs[1].role == Role::Assistant);
    REQUIRE(msgs[1].text == "Thinking.");

    REQUIRE(fx.session.busy());
    REQUIRE(fx.started == 1);
    REQUIRE(fx.transport.requests.size() == 1);
    REQUIRE(fx.transport.requests[0].messages.size() == 1);
    REQUIRE(fx.transport.requests[0].endpoint == "http://localhost:8000/api/chat");

    SECTION("a second send while busy is refused")
    {
        REQUIRE(fx.session.send("again", fx.clock.now()) == SendResult::Busy);
        REQUIRE(fx.transport.requests.size() == 1);
        REQUIRE(fx.view.ordered().size() == 2);
    }

    SECTION("the placeholder animates until content arrives")
    {
        fx.tick(450ms);
        REQUIRE(fx.view.last()->text == "Thinking..");
        fx.tick(450ms);
        REQUIRE(fx.view.last()->text == "Thinking...");
    }
}

TEST_CASE("Streamed fragments replace the placeholder and complete the turn", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());

    fx.transport.pushData(delta("Hel"));
    fx.tick();
    REQUIRE(fx.view.last()->text == "Hel");

    fx.transport.pushData(delta("lo") + "data: [DONE]\n");
    fx.transport.pushCompleted();
    fx.tick();

    REQUIRE(fx.view.last()->role == Role::Assistant);
    REQUIRE(fx.view.last()->text == "Hello");
    REQUIRE_FALSE(fx.session.busy());
    REQUIRE(fx.finished == 1);
    REQUIRE(fx.errors == 0);

    const auto& history = fx.session.history().messages();
    REQUIRE(history.size() == 2);
    REQUIRE(history[1].role == Role::Assistant);
    REQUIRE(history[1].content == "Hello");

    SECTION("the next request carries the whole conversation")
    {
        REQUIRE(fx.session.send("more", fx.clock.now()) == SendResult::Sent);
        REQUIRE(fx.transport.requests.back().messages.size() == 3);
    }
}

TEST_CASE("An empty successful stream records No response", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());
    fx.transport.pushData("data: [DONE]\n");
    fx.transport.pushCompleted();
    fx.tick();

    REQUIRE(fx.view.last()->text == "No response");
    REQUIRE(fx.session.history().messages().back().content == "No response");
    REQUIRE_FALSE(fx.session.busy());
}

TEST_CASE("A record without its newline at end of body is not rendered", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());

    SECTION("it was the only record")
    {
        fx.transport.pushData("data: {\"choices\":[{\"delta\":{\"content\":\"lost\"}}]}");
        fx.transport.pushCompleted();
        fx.tick();

        REQUIRE(fx.view.last()->text == "No response");
        REQUIRE(fx.session.history().messages().back().content == "No response");
    }

    SECTION("it followed complete records")
    {
        fx.transport.pushData(delta("Hel") + "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}");
        fx.transport.pushCompleted();
        fx.tick();

        REQUIRE(fx.view.last()->text == "Hel");
        REQUIRE(fx.session.history().messages().back().content == "Hel");
    }

    REQUIRE_FALSE(fx.session.busy());
    REQUIRE(fx.finished == 1);
}

TEST_CASE("A failed request rolls back the user turn", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());

    SECTION("before any content")
    {
        fx.transport.pushFailed("HTTP 500");
        fx.tick();

        REQUIRE(fx.session.history().empty());
        REQUIRE(fx.view.count(Role::Assistant) == 0);
        REQUIRE(fx.view.last()->role == Role::System);
        REQUIRE(fx.view.last()->text == "Network Error: HTTP 500");
        REQUIRE(fx.errors == 1);
        REQUIRE(fx.finished == 1);
        REQUIRE_FALSE(fx.session.busy());
    }

    SECTION("after partial content")
    {
        fx.transport.pushData(delta("Par"));
        fx.transport.pushFailed("connection reset");
        fx.tick();

        REQUIRE(fx.session.history().empty());
        REQUIRE(fx.view.count(Role::Assistant) == 1);
        REQUIRE(fx.view.count(Role::User) == 1);
        REQUIRE(fx.view.last()->text == "Network Error: connection reset");
    }
}

TEST_CASE("A transport that cannot start fails the turn", "[chat_session]")
{
    SessionFixture fx;
    fx.transport.fail_begin = true;
    utils::ErrorReporter::ClearErrors();

    REQUIRE(fx.session.send("hi", fx.clock.now()) == SendResult::TransportError);
    REQUIRE_FALSE(fx.session.busy());
    REQUIRE(fx.session.history().empty());
    REQUIRE(fx.started == 1);
    REQUIRE(fx.finished == 1);
    REQUIRE(fx.errors == 1);
    REQUIRE(fx.view.last()->text == "Network Error: connection refused");
    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("In-stream errors are shown without ending the turn", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());
    fx.transport.pushData("data: {\"error\":\"quota exceeded\"}\n");
    fx.tick();

    REQUIRE(fx.errors == 1);
    REQUIRE(fx.session.busy());
    REQUIRE(fx.view.count(Role::System) == 1);
}

TEST_CASE("Streaming follows the view only when it is near the bottom", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());
    int scrolls_after_send = fx.view.scrolls;

    fx.view.near_bottom = false;
    fx.transport.pushData(delta("a"));
    fx.tick();
    REQUIRE(fx.view.scrolls == scrolls_after_send);
    REQUIRE(fx.view.last_threshold == 50.0f);

    fx.view.near_bottom = true;
    fx.transport.pushData(delta("b"));
    fx.tick();
    REQUIRE(fx.view.scrolls == scrolls_after_send + 1);
}

TEST_CASE("/clear wipes the conversation and shows a short notice", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());
    fx.transport.pushData(delta("yo"));
    fx.transport.pushCompleted();
    fx.tick();
    REQUIRE(fx.session.history().size() == 2);

    REQUIRE(fx.session.send("/clear", fx.clock.now()) == SendResult::Cleared);
    REQUIRE(fx.session.history().empty());
    REQUIRE(fx.view.clears == 1);
    REQUIRE(fx.view.ordered().size() == 1);
    REQUIRE(fx.view.last()->text == "Context cleared");
    REQUIRE(fx.transport.requests.size() == 1);

    fx.tick(1999ms);
    REQUIRE(fx.view.ordered().size() == 1);
    fx.tick(1ms);
    REQUIRE(fx.view.ordered().empty());
}

TEST_CASE("Cancel abandons the in-flight turn", "[chat_session]")
{
    SessionFixture fx;
    fx.session.send("hi", fx.clock.now());
    fx.transport.pushData(delta("late"));

    fx.session.cancel();
    REQUIRE(fx.transport.cancels == 1);
    REQUIRE_FALSE(fx.session.busy());
    REQUIRE(fx.finished == 1);

    fx.tick();
    REQUIRE(fx.session.assembly().text().empty());
}
