#include "LogTailSource.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstddef>
#include <fstream>

using namespace ipc;

LogTailSource::LogTailSource(std::filesystem::path path, int poll_interval_ms)
    : path_(std::move(path))
    , poll_interval_ms_(poll_interval_ms)
{
}

LogTailSource::~LogTailSource() { stop(); }

bool LogTailSource::start()
{
    if (running_.load())
        return true;
    if (path_.empty())
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = "no log path configured";
        return false;
    }

    running_.store(true);
    status_.store(ChannelStatus::Connecting);
    worker_ = std::thread(&LogTailSource::runLoop, this);
    PLOG_INFO << "Following log file " << path_.string();
    return true;
}

void LogTailSource::stop()
{
    if (!running_.exchange(false))
        return;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    status_.store(ChannelStatus::Disconnected);
}

bool LogTailSource::poll(std::vector<LogEvent>& out)
{
    std::size_t before = out.size();
    inbox_.drain(out);
    return out.size() > before;
}

const char* LogTailSource::lastError() const
{
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_copy_ = last_error_;
    return last_error_copy_.c_str();
}

void LogTailSource::runLoop()
{
    PROFILE_THREAD_NAME("LogTail");
    while (running_.load())
    {
        pollOnce();
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_), [this] { return !running_.load(); });
    }
}

void LogTailSource::pollOnce()
{
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path_, ec);
    if (ec)
    {
        if (opened_)
            PLOG_WARNING << "Log file " << path_.string() << " became inaccessible: " << ec.message();
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = ec.message();
        }
        opened_ = false;
        offset_ = 0;
        reader_.reset();
        status_.store(ChannelStatus::Disconnected);
        return;
    }

    if (!opened_)
    {
        // First sight of the file (or it came back): show its tail once
        opened_ = true;
        status_.store(ChannelStatus::Online);
        readFrom(0, true);
        return;
    }

    if (size < offset_)
    {
        PLOG_INFO << "Log file " << path_.string() << " truncated, following from the start";
        offset_ = 0;
        reader_.reset();
    }
    if (size > offset_)
        readFrom(offset_, false);
}

void LogTailSource::readFrom(std::uintmax_t offset, bool initial)
{
    std::ifstream in(path_, std::ios::binary);
    if (!in)
    {
        opened_ = false;
        status_.store(ChannelStatus::Disconnected);
        return;
    }
    in.seekg(static_cast<std::streamoff>(offset));

    std::string chunk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    offset_ = offset + chunk.size();

    auto lines = reader_.feed(chunk);
    if (initial)
    {
        // Like tail -n: only the last complete lines of what is already there
        std::size_t skip = lines.size() > kInitialLines ? lines.size() - kInitialLines : 0;
        lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    for (auto& line : lines)
        emitLine(std::move(line));
}

void LogTailSource::emitLine(std::string line)
{
    if (line.empty())
        return;

    PLOG_DEBUG_(utils::kEventLogInstance) << "tail " << line;
    inbox_.push(makeFileEvent(std::move(line)));
}
