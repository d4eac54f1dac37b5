#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // SDL, ImGui, window creation
    Configuration,  // config.toml load/save
    EventChannel,   // Event socket / log tail
    Chat,           // Streaming chat transport
    Rendering,      // Engine init, canvas
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning,
    Error,
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details;
    std::string timestamp; // time of the latest occurrence
    int repeat_count = 1;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);

    bool sameAs(const ErrorReport& other) const;
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects reports from the event channel worker, the chat transport and the
 * main thread, logs them through plog and queues them for the error dialog.
 * A report identical to the newest queued one bumps its repeat_count instead
 * of queueing again, so a backend that keeps refusing requests produces one
 * dialog entry.
 *
 *   ErrorReporter::ReportError(ErrorCategory::Chat, "Chat request failed", "HTTP 502");
 *
 *   // main loop
 *   if (ErrorReporter::HasPendingErrors())
 *       dialog.Show(ErrorReporter::GetPendingErrors());
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Returns the queued reports oldest first and empties the queue.
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
