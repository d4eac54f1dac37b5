#pragma once

#include "IEventSource.hpp"
#include "chat/LineReader.hpp"
#include "utils/PendingQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

namespace ipc
{
    // Follows a log file by name, starting with its last lines, and keeps
    // following across truncation, deletion and re-creation.
    class LogTailSource : public IEventSource
    {
    public:
        static constexpr std::size_t kInitialLines = 10;
        static constexpr int kPollIntervalMs = 250;

        explicit LogTailSource(std::filesystem::path path, int poll_interval_ms = kPollIntervalMs);
        ~LogTailSource() override;

        bool start() override;
        void stop() override;
        bool poll(std::vector<LogEvent>& out) override;
        ChannelStatus status() const override { return status_.load(); }
        const char* lastError() const override;
        const char* name() const override { return "file"; }

        // One pass of the follow loop; public so tests can drive it without
        // the worker thread.
        void pollOnce();

        const std::filesystem::path& path() const { return path_; }

    private:
        void runLoop();
        void readFrom(std::uintmax_t offset, bool initial);
        void emitLine(std::string line);

        std::filesystem::path path_;
        int poll_interval_ms_ = kPollIntervalMs;

        std::thread worker_;
        std::atomic<bool> running_{ false };
        std::atomic<ChannelStatus> status_{ ChannelStatus::Disconnected };
        std::mutex wait_mutex_;
        std::condition_variable wait_cv_;

        // Follow state, touched only by whoever runs pollOnce()
        bool opened_ = false;
        std::uintmax_t offset_ = 0;
        chat::LineReader reader_;

        mutable std::mutex error_mutex_;
        std::string last_error_;
        mutable std::string last_error_copy_;

        utils::PendingQueue<LogEvent> inbox_;
    };
}
