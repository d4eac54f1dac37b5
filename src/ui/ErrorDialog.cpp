#include "ErrorDialog.hpp"

#include <SDL3/SDL.h>
#include <plog/Log.h>

#include <cstdlib>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

namespace
{
constexpr const char* kPopupId = "Something went wrong###error_report_modal";
}

void ErrorDialog::Show(const std::vector<utils::ErrorReport>& errors)
{
    if (errors.empty())
        return;

    if (!is_open_)
    {
        current_errors_.clear();
        selected_error_ = 0;
    }
    current_errors_.insert(current_errors_.end(), errors.begin(), errors.end());
    is_open_ = true;
    open_requested_ = true;
}

bool ErrorDialog::Render()
{
    if (!is_open_)
        return false;

    if (open_requested_)
    {
        ImGui::OpenPopup(kPopupId);
        open_requested_ = false;
    }

    bool should_exit = false;

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(560, 360), ImGuiCond_FirstUseEver);

    if (ImGui::BeginPopupModal(kPopupId, &is_open_, ImGuiWindowFlags_NoCollapse))
    {
        if (current_errors_.empty())
        {
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            Close();
            return false;
        }

        const auto& error = current_errors_[selected_error_];

        ImGui::PushStyleColor(ImGuiCol_Text, GetSeverityColor(error.severity));
        ImGui::TextUnformatted(GetSeverityIcon(error.severity));
        ImGui::SameLine();
        ImGui::Text("%s - %s", utils::ErrorReporter::SeverityToString(error.severity),
                    utils::ErrorReporter::CategoryToString(error.category));
        ImGui::PopStyleColor();

        ImGui::Separator();
        if (error.repeat_count > 1)
            ImGui::TextDisabled("Last seen: %s (x%d)", error.timestamp.c_str(), error.repeat_count);
        else
            ImGui::TextDisabled("Time: %s", error.timestamp.c_str());
        ImGui::Spacing();
        ImGui::TextWrapped("%s", error.user_message.c_str());
        ImGui::Spacing();

        if (!error.technical_details.empty() && ImGui::CollapsingHeader("Technical details"))
        {
            ImGui::BeginChild("TechnicalDetails", ImVec2(0, 120), true);
            ImGui::TextWrapped("%s", error.technical_details.c_str());
            ImGui::EndChild();
        }

        if (current_errors_.size() > 1)
        {
            ImGui::Separator();
            ImGui::Text("%d / %d", selected_error_ + 1, static_cast<int>(current_errors_.size()));
            ImGui::SameLine();
            if (ImGui::Button("Previous") && selected_error_ > 0)
                --selected_error_;
            ImGui::SameLine();
            if (ImGui::Button("Next") && selected_error_ < static_cast<int>(current_errors_.size()) - 1)
                ++selected_error_;
        }

        ImGui::Separator();
        if (ImGui::Button("Copy to clipboard"))
            CopyToClipboard(error);
        ImGui::SameLine();
        if (ImGui::Button("Open logs folder"))
            OpenLogsFolder();
        ImGui::SameLine();

        if (error.is_fatal)
        {
            if (ImGui::Button("Exit"))
            {
                should_exit = true;
                ImGui::CloseCurrentPopup();
                Close();
            }
        }
        else if (ImGui::Button("Continue"))
        {
            ImGui::CloseCurrentPopup();
            Close();
        }

        ImGui::EndPopup();
    }
    else if (!is_open_)
    {
        // Closed through the title bar button
        Close();
    }

    return should_exit;
}

void ErrorDialog::Close()
{
    is_open_ = false;
    open_requested_ = false;
    current_errors_.clear();
    selected_error_ = 0;
}

void ErrorDialog::CopyToClipboard(const utils::ErrorReport& error)
{
    std::string formatted = FormatErrorReport(error);
    if (!SDL_SetClipboardText(formatted.c_str()))
        PLOG_WARNING << "Clipboard copy failed: " << SDL_GetError();
}

void ErrorDialog::OpenLogsFolder()
{
#ifdef _WIN32
    ShellExecuteW(NULL, L"open", L"logs", NULL, NULL, SW_SHOWNORMAL);
#else
    int rc = std::system("xdg-open logs 2>/dev/null &");
    if (rc != 0)
        PLOG_WARNING << "xdg-open failed with " << rc;
#endif
}

const char* ErrorDialog::GetSeverityIcon(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Info:
        return "[i]";
    case utils::ErrorSeverity::Warning:
        return "[!]";
    case utils::ErrorSeverity::Error:
        return "[X]";
    case utils::ErrorSeverity::Fatal:
        return "[!!]";
    }
    return "[?]";
}

ImVec4 ErrorDialog::GetSeverityColor(utils::ErrorSeverity severity)
{
    switch (severity)
    {
    case utils::ErrorSeverity::Info:
        return ImVec4(0.0f, 0.95f, 1.0f, 1.0f);
    case utils::ErrorSeverity::Warning:
        return ImVec4(1.0f, 0.67f, 0.0f, 1.0f);
    case utils::ErrorSeverity::Error:
        return ImVec4(1.0f, 0.4f, 0.2f, 1.0f);
    case utils::ErrorSeverity::Fatal:
        return ImVec4(1.0f, 0.16f, 0.16f, 1.0f);
    }
    return ImVec4(0.7f, 0.7f, 0.7f, 1.0f);
}

std::string ErrorDialog::FormatErrorReport(const utils::ErrorReport& error)
{
    std::stringstream ss;
    ss << "=====================================\n";
    ss << "Ghost Interface Error Report\n";
    ss << "=====================================\n";
    ss << "Time: " << error.timestamp << "\n";
    if (error.repeat_count > 1)
        ss << "Occurrences: " << error.repeat_count << "\n";
    ss << "Severity: " << utils::ErrorReporter::SeverityToString(error.severity) << "\n";
    ss << "Category: " << utils::ErrorReporter::CategoryToString(error.category) << "\n\n";
    ss << "Message:\n" << error.user_message << "\n";
    if (!error.technical_details.empty())
        ss << "\nTechnical Details:\n" << error.technical_details << "\n";
    ss << "\nSee logs/run.log for more information.\n";
    ss << "=====================================\n";
    return ss.str();
}
