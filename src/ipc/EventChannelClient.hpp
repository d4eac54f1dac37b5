#pragma once

#include "IEventSource.hpp"
#include "utils/PendingQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

struct sockaddr;

namespace ipc
{
    // TCP client for the newline-delimited JSON event channel. Keeps
    // reconnecting until stop(); every drop flips the status to Disconnected.
    class EventChannelClient : public IEventSource
    {
    public:
        static constexpr int kConnectTimeoutMs = 2000;

        EventChannelClient(std::string host, int port, int reconnect_delay_ms = 3000,
                           int connect_timeout_ms = kConnectTimeoutMs);
        ~EventChannelClient() override;

        bool start() override;
        void stop() override;
        bool poll(std::vector<LogEvent>& out) override;
        ChannelStatus status() const override { return status_.load(); }
        const char* lastError() const override;
        const char* name() const override { return "tcp"; }

        const std::string& host() const { return host_; }
        int port() const { return port_; }

    private:
        void runLoop();
        bool connectOnce();
        bool tryConnect(int s, const struct sockaddr* addr, int addrlen);
        void recvLoop();
        void handleLine(const std::string& line);
        void closeSocket();
        void setError(std::string message);
        // Sleeps for the reconnect delay; returns false when stopping
        bool waitBeforeRetry();

        std::string host_;
        int port_ = 0;
        int reconnect_delay_ms_ = 3000;
        int connect_timeout_ms_ = kConnectTimeoutMs;

        std::thread worker_;
        std::atomic<bool> running_{ false };
        std::atomic<ChannelStatus> status_{ ChannelStatus::Disconnected };
        std::atomic<int> sock_{ -1 };

        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;

        mutable std::mutex error_mutex_;
        std::string last_error_;
        mutable std::string last_error_copy_;

        utils::PendingQueue<LogEvent> inbox_;
    };
}
