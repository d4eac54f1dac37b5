#pragma once

#include "IChatTransport.hpp"
#include "utils/PendingQueue.hpp"

#include <atomic>
#include <string>
#include <string_view>
#include <thread>

namespace chat
{

// Streaming POST over cpr. The body is forwarded chunk by chunk as libcurl
// delivers it; nothing is parsed on the worker thread.
class CprChatTransport : public IChatTransport
{
public:
    CprChatTransport();
    ~CprChatTransport() override;

    bool begin(const ChatRequest& request) override;
    void drain(std::vector<TransportEvent>& out) override;
    void cancel() override;
    bool active() const override { return running_.load(std::memory_order_acquire); }
    const char* lastError() const override { return last_error_.c_str(); }

    // Message for a non-success response: the body's "error" field when the
    // body is JSON carrying one, otherwise "HTTP <status>".
    static std::string describeHttpFailure(int status, std::string_view body);

    // Status code from an "HTTP/x.y NNN reason" header line, 0 for other lines
    static int parseStatusLine(std::string_view header);

private:
    void run(ChatRequest request, std::string body);
    void joinWorker();

    std::thread worker_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> cancel_{ false };
    utils::PendingQueue<TransportEvent> events_;
    std::string last_error_;
};

} // namespace chat
