#include "EventChannelClient.hpp"
#include "chat/LineReader.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <string_view>

#if defined(_WIN32)
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#endif

using namespace ipc;

namespace
{
    constexpr std::size_t kMaxLineBytes = 1 << 20;
    constexpr int kPollSliceMs = 100;

    void closeRaw(int s)
    {
#if defined(_WIN32)
        closesocket(s);
#else
        close(s);
#endif
    }

    bool setBlocking(int s, bool blocking)
    {
#if defined(_WIN32)
        u_long mode = blocking ? 0 : 1;
        return ioctlsocket(s, FIONBIO, &mode) == 0;
#else
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0)
            return false;
        flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
        return fcntl(s, F_SETFL, flags) == 0;
#endif
    }

    bool connectInProgress()
    {
#if defined(_WIN32)
        return WSAGetLastError() == WSAEWOULDBLOCK;
#else
        return errno == EINPROGRESS;
#endif
    }

    // 1 writable, 0 not yet, -1 failed
    int waitWritable(int s, int timeout_ms)
    {
#if defined(_WIN32)
        WSAPOLLFD pfd{};
        pfd.fd = s;
        pfd.events = POLLWRNORM;
        return WSAPoll(&pfd, 1, timeout_ms);
#else
        struct pollfd pfd{};
        pfd.fd = s;
        pfd.events = POLLOUT;
        int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno == EINTR)
            return 0;
        return rc;
#endif
    }

    int pendingError(int s)
    {
        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len) != 0)
            return -1;
        return err;
    }
}

EventChannelClient::EventChannelClient(std::string host, int port, int reconnect_delay_ms, int connect_timeout_ms)
    : host_(std::move(host))
    , port_(port)
    , reconnect_delay_ms_(reconnect_delay_ms)
    , connect_timeout_ms_(connect_timeout_ms)
{
}

EventChannelClient::~EventChannelClient() { stop(); }

bool EventChannelClient::start()
{
    if (running_.load())
        return true;
    if (host_.empty() || port_ <= 0 || port_ > 65535)
    {
        setError("invalid event channel address");
        utils::ErrorReporter::ReportError(utils::ErrorCategory::EventChannel, "Event channel address is invalid",
                                          host_ + ":" + std::to_string(port_));
        return false;
    }

#if defined(_WIN32)
    WSADATA wsaData;
    WSAStartup(MAKEWORD(2, 2), &wsaData);
#endif

    running_.store(true);
    status_.store(ChannelStatus::Connecting);
    worker_ = std::thread(&EventChannelClient::runLoop, this);
    PLOG_INFO << "Event channel started for " << host_ << ":" << port_;
    return true;
}

void EventChannelClient::stop()
{
    if (!running_.exchange(false))
        return;

    int s = sock_.load();
    if (s >= 0)
    {
#if defined(_WIN32)
        shutdown(s, SD_BOTH);
#else
        shutdown(s, SHUT_RDWR);
#endif
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    if (worker_.joinable())
        worker_.join();
    closeSocket();
    status_.store(ChannelStatus::Disconnected);
#if defined(_WIN32)
    WSACleanup();
#endif
}

bool EventChannelClient::poll(std::vector<LogEvent>& out)
{
    std::size_t before = out.size();
    inbox_.drain(out);
    return out.size() > before;
}

const char* EventChannelClient::lastError() const
{
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_copy_ = last_error_;
    return last_error_copy_.c_str();
}

void EventChannelClient::setError(std::string message)
{
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = std::move(message);
}

void EventChannelClient::runLoop()
{
    PROFILE_THREAD_NAME("EventChannel");

    bool reported = false;
    while (running_.load())
    {
        status_.store(ChannelStatus::Connecting);
        if (connectOnce())
        {
            reported = false;
            status_.store(ChannelStatus::Online);
            PLOG_INFO << "Event channel online";
            recvLoop();
            closeSocket();
            if (!running_.load())
                break;
            PLOG_WARNING << "Event channel closed, retrying in " << reconnect_delay_ms_ << " ms";
        }
        else if (!reported)
        {
            // One report per outage; retries stay quiet until it comes back
            reported = true;
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::EventChannel,
                                                "Cannot reach the activity event channel", lastError());
        }

        status_.store(ChannelStatus::Disconnected);
        if (!waitBeforeRetry())
            break;
    }
    status_.store(ChannelStatus::Disconnected);
}

bool EventChannelClient::waitBeforeRetry()
{
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(reconnect_delay_ms_), [this] { return !running_.load(); });
    return running_.load();
}

bool EventChannelClient::connectOnce()
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    char service[32];
    std::snprintf(service, sizeof(service), "%d", port_);
    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host_.c_str(), service, &hints, &res);
    if (rc != 0)
    {
        setError(std::string("getaddrinfo failed: ") + gai_strerror(rc));
        return false;
    }

    int connected = -1;
    for (auto p = res; p != nullptr && running_.load() && connected < 0; p = p->ai_next)
    {
        int s = (int)socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0)
            continue;
        if (tryConnect(s, p->ai_addr, (int)p->ai_addrlen))
            connected = s;
        else
            closeRaw(s);
    }
    freeaddrinfo(res);

    if (connected < 0)
    {
        setError("connect to " + host_ + ":" + std::to_string(port_) + " failed or timed out");
        return false;
    }
    sock_.store(connected);
    return true;
}

bool EventChannelClient::tryConnect(int s, const struct sockaddr* addr, int addrlen)
{
    // Non-blocking so stop() is never stuck behind the OS connect timeout
    if (!setBlocking(s, false))
        return false;

    if (::connect(s, addr, (socklen_t)addrlen) != 0)
    {
        if (!connectInProgress())
            return false;

        int waited = 0;
        while (true)
        {
            if (!running_.load() || waited >= connect_timeout_ms_)
                return false;
            int rc = waitWritable(s, kPollSliceMs);
            if (rc < 0)
                return false;
            if (rc > 0)
                break;
            waited += kPollSliceMs;
        }
        if (pendingError(s) != 0)
            return false;
    }
    return setBlocking(s, true);
}

void EventChannelClient::recvLoop()
{
    chat::LineReader reader(kMaxLineBytes);
    char buf[4096];
    while (running_.load())
    {
        ptrdiff_t n = ::recv(sock_.load(), buf, sizeof(buf), 0);
        if (n <= 0)
            break;

        std::size_t dropped = reader.droppedLines();
        for (const auto& line : reader.feed(std::string_view(buf, static_cast<std::size_t>(n))))
            handleLine(line);
        if (reader.droppedLines() != dropped)
            PLOG_WARNING << "Dropped an event line longer than " << kMaxLineBytes << " bytes";
    }
    // A line cut off by the disconnect was never completed
    if (auto tail = reader.finish())
        PLOG_DEBUG << "Discarding " << tail->size() << " bytes of an unterminated event line";
}

void EventChannelClient::handleLine(const std::string& line)
{
    if (line.empty())
        return;

    PLOG_DEBUG_(utils::kEventLogInstance) << "recv " << line;

    LogEvent ev;
    if (!parseEventLine(line, ev))
    {
        PLOG_WARNING << "Ignoring malformed event line: " << line;
        return;
    }
    inbox_.push(std::move(ev));
}

void EventChannelClient::closeSocket()
{
    int s = sock_.exchange(-1);
    if (s >= 0)
        closeRaw(s);
}
