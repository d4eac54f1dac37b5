#include <catch2/catch_test_macros.hpp>

#include "ipc/EventChannelClient.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#if !defined(_WIN32)
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

// Loopback listener on an ephemeral port that accepts one client
class LocalListener {
public:
    LocalListener()
    {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LocalListener()
    {
        if (client_ >= 0)
            ::close(client_);
        ::close(fd_);
    }

    int port() const { return port_; }

    void acceptAndSend(const std::string& payload)
    {
        client_ = ::accept(fd_, nullptr, nullptr);
        std::size_t sent = 0;
        while (client_ >= 0 && sent < payload.size()) {
            ssize_t n = ::send(client_, payload.data() + sent, payload.size() - sent, 0);
            if (n <= 0)
                break;
            sent += static_cast<std::size_t>(n);
        }
    }

private:
    int fd_ = -1;
    int client_ = -1;
    int port_ = 0;
};

std::vector<ipc::LogEvent> waitForEvents(ipc::EventChannelClient& client, std::size_t count)
{
    std::vector<ipc::LogEvent> events;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (events.size() < count && std::chrono::steady_clock::now() < deadline) {
        client.poll(events);
        std::this_thread::sleep_for(10ms);
    }
    return events;
}

} // namespace

TEST_CASE("Event channel delivers lines around an oversized one", "[event_channel]")
{
    LocalListener listener;
    std::string payload = "{\"type\":\"log\",\"content\":\"🧠 first\"}\n";
    payload += std::string(1200 * 1024, 'x');
    payload += "\"}\n{\"type\":\"log\",\"content\":\"✅ second\",\"is_error\":false}\n";

    std::thread server([&] { listener.acceptAndSend(payload); });

    ipc::EventChannelClient client("127.0.0.1", listener.port(), 50);
    REQUIRE(client.start());
    auto events = waitForEvents(client, 2);
    server.join();

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].content == "🧠 first");
    REQUIRE(events[1].content == "✅ second");
    REQUIRE(client.status() == ipc::ChannelStatus::Online);

    client.stop();
    REQUIRE(client.status() == ipc::ChannelStatus::Disconnected);
}

TEST_CASE("Stopping the event channel does not wait out a pending connect", "[event_channel]")
{
    // Unroutable address: the connect either hangs or fails at once
    ipc::EventChannelClient client("10.255.255.1", 9, 50, 60000);
    REQUIRE(client.start());
    std::this_thread::sleep_for(50ms);

    auto begin = std::chrono::steady_clock::now();
    client.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(elapsed < 1s);
    REQUIRE(client.status() == ipc::ChannelStatus::Disconnected);
}

#endif
