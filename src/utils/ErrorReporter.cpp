#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

bool ErrorReport::sameAs(const ErrorReport& other) const
{
    return category == other.category && severity == other.severity && user_message == other.user_message &&
           technical_details == other.technical_details;
}

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    ErrorReport report(category, severity, user_message, technical_details);

    PLOG(toPlogSeverity(severity)) << "[" << CategoryToString(category) << "] " << user_message
                                   << (technical_details.empty() ? "" : " | Details: ") << technical_details;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_error_queue.empty() && s_error_queue.back().sameAs(report))
    {
        auto& last = s_error_queue.back();
        ++last.repeat_count;
        last.timestamp = std::move(report.timestamp);
        return;
    }

    s_error_queue.push_back(std::move(report));
    while (s_error_queue.size() > MAX_QUEUE_SIZE)
        s_error_queue.pop_front();
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors(std::make_move_iterator(s_error_queue.begin()),
                                    std::make_move_iterator(s_error_queue.end()));
    s_error_queue.clear();
    return errors;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_error_queue.empty() ? ErrorReport() : s_error_queue.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::EventChannel:
        return "Event Channel";
    case ErrorCategory::Chat:
        return "Chat";
    case ErrorCategory::Rendering:
        return "Rendering";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
