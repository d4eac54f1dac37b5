#pragma once

#include "utils/ErrorReporter.hpp"

#include <imgui.h>
#include <string>
#include <vector>

/**
 * @brief ImGui modal listing queued error reports
 *
 * Reports stack up while the dialog is open; the user pages through them,
 * copies one to the clipboard or opens the logs folder.
 */
class ErrorDialog
{
public:
    ErrorDialog() = default;

    // Queues reports; the modal opens on the next Render()
    void Show(const std::vector<utils::ErrorReport>& errors);

    // Returns true when the user chose to exit after a fatal report
    bool Render();

    bool IsOpen() const { return is_open_; }
    void Close();

    static std::string FormatErrorReport(const utils::ErrorReport& error);

private:
    void CopyToClipboard(const utils::ErrorReport& error);
    void OpenLogsFolder();
    static const char* GetSeverityIcon(utils::ErrorSeverity severity);
    static ImVec4 GetSeverityColor(utils::ErrorSeverity severity);

    bool is_open_ = false;
    bool open_requested_ = false;
    std::vector<utils::ErrorReport> current_errors_;
    int selected_error_ = 0;
};
