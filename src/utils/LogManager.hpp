#pragma once

#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Secondary plog instance receiving raw inbound event lines
constexpr int kEventLogInstance = 1;

/**
 * @brief Owns the plog instances of the application
 *
 *   instance 0  main     logs/run.log + console
 *   instance 1  events   logs/events.log
 *   instance 2  profiling logs/profiling.log (GHOST_PROFILING_LEVEL >= 1)
 *
 * Runs before ConfigManager, so it reads [app] logging_level and
 * [app] append_logs straight from the config file.
 */
class LogManager
{
public:
    static bool Initialize(const std::string& config_path = "config.toml");
    static void Shutdown();

    /// Applies a 0-6 plog severity to the main and events loggers. Out-of-range values are ignored.
    static void SetLevel(int level);

    static plog::Severity GetLevel();

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static bool PrepareLogDirectory();

    template <int InstanceId>
    static void OpenLogger(const char* path, plog::Severity level, bool with_console);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
