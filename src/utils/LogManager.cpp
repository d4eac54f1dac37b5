#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

namespace
{

constexpr const char* kLogDirectory = "logs";
constexpr size_t kMaxFileSize = 10 * 1024 * 1024;
constexpr int kBackupCount = 3;

} // namespace

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);
    if (!PrepareLogDirectory())
        return false;

    try
    {
        OpenLogger<0>("logs/run.log", s_level, true);
        OpenLogger<kEventLogInstance>("logs/events.log", s_level, false);
#if GHOST_PROFILING_LEVEL >= 1
        OpenLogger<profiling::kProfilingLogInstance>("logs/profiling.log", plog::debug, false);
#endif
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log files", ex.what());
        s_appenders.clear();
        return false;
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
void LogManager::OpenLogger(const char* path, plog::Severity level, bool with_console)
{
    if (!s_append_logs)
        std::ofstream(path, std::ios::trunc).close();

    auto file_appender =
        std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(path, kMaxFileSize, kBackupCount);
    auto& logger = plog::init<InstanceId>(level, file_appender.get());
    s_appenders.push_back(std::move(file_appender));

    if (with_console)
    {
        auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
        logger.addAppender(console_appender.get());
        s_appenders.push_back(std::move(console_appender));
    }
}

void LogManager::Shutdown()
{
    // Loggers keep raw appender pointers; silence them before the appenders go away
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto* events = plog::get<kEventLogInstance>())
        events->setMaxSeverity(plog::none);
#if GHOST_PROFILING_LEVEL >= 1
    if (auto* prof = plog::get<profiling::kProfilingLogInstance>())
        prof->setMaxSeverity(plog::none);
#endif
    s_appenders.clear();
    s_initialized = false;
}

void LogManager::SetLevel(int level)
{
    if (level < plog::none || level > plog::verbose)
        return;

    s_level = static_cast<plog::Severity>(level);
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(s_level);
    if (auto* events = plog::get<kEventLogInstance>())
        events->setMaxSeverity(s_level);
}

plog::Severity LogManager::GetLevel() { return s_level; }

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(kLogDirectory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to create the logs folder", ec.message());
        return false;
    }
    return true;
}

void LogManager::ReadConfig(const std::string& config_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto append = cfg["app"]["append_logs"].value<bool>())
            s_append_logs = *append;
        if (auto level = cfg["app"]["logging_level"].value<int64_t>(); level && *level >= 0 && *level <= 6)
            s_level = static_cast<plog::Severity>(*level);
    }
    catch (const toml::parse_error& ex)
    {
        // No logger exists yet; ConfigManager logs the same parse error once it loads the file
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(ex.description()));
    }
}

} // namespace utils
