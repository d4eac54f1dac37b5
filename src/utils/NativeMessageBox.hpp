#pragma once

#include <string>

struct SDL_Window;

namespace utils {

/**
 * @brief Message box for failures that happen before ImGui is up
 *
 * Goes through SDL_ShowSimpleMessageBox, which works before (and without) a
 * window. When SDL cannot show one either, the text goes to stderr.
 */
class NativeMessageBox
{
public:
    enum class Type
    {
        Error,
        Warning,
        Info
    };

    static void Show(const std::string& title, const std::string& message, Type type = Type::Error,
                     SDL_Window* parent = nullptr);

    /// Formats the message with its details and a pointer to logs/run.log.
    static void ShowFatalError(const std::string& message, const std::string& details = "",
                               SDL_Window* parent = nullptr);

    static std::string FormatFatalMessage(const std::string& message, const std::string& details);
};

} // namespace utils
