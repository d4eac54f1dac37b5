#include "NativeMessageBox.hpp"

#include <SDL3/SDL.h>
#include <plog/Log.h>

#include <iostream>
#include <sstream>

namespace utils
{

namespace
{

SDL_MessageBoxFlags toSdlFlags(NativeMessageBox::Type type)
{
    switch (type)
    {
    case NativeMessageBox::Type::Warning:
        return SDL_MESSAGEBOX_WARNING;
    case NativeMessageBox::Type::Info:
        return SDL_MESSAGEBOX_INFORMATION;
    case NativeMessageBox::Type::Error:
        break;
    }
    return SDL_MESSAGEBOX_ERROR;
}

} // namespace

void NativeMessageBox::Show(const std::string& title, const std::string& message, Type type, SDL_Window* parent)
{
    if (SDL_ShowSimpleMessageBox(toSdlFlags(type), title.c_str(), message.c_str(), parent))
        return;

    PLOG_DEBUG << "SDL message box unavailable: " << SDL_GetError();
    std::cerr << "\n== " << title << " ==\n" << message << "\n" << std::endl;
}

void NativeMessageBox::ShowFatalError(const std::string& message, const std::string& details, SDL_Window* parent)
{
    Show("Ghost Interface", FormatFatalMessage(message, details), Type::Error, parent);
}

std::string NativeMessageBox::FormatFatalMessage(const std::string& message, const std::string& details)
{
    std::ostringstream ss;
    ss << message << "\n\n";
    if (!details.empty())
        ss << "Technical details:\n" << details << "\n\n";
    ss << "Ghost Interface will now exit.\nSee logs/run.log for more information.";
    return ss.str();
}

} // namespace utils
