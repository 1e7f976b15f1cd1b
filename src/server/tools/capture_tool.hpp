#pragma once

#include "platform/screen_capture.hpp"
#include "platform/window_manager.hpp"
#include "terminal/window_info.hpp"
#include "tools/tool_result.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

class Logger;

struct CaptureSettings {
    std::vector<std::string> window_titles;
    int titlebar_height = 35;
    std::filesystem::path directory;   // for captures without an explicit path
};

// Region to grab for `window`. A titlebar exclusion that leaves no height is
// an error, never clamped.
std::expected<Rect, std::string> capture_region(const Rect& window, bool exclude_titlebar,
                                                int titlebar_height);

// Caller path with a .png extension, made absolute; otherwise a timestamped
// file under `directory`.
std::filesystem::path resolve_capture_path(const std::optional<std::string>& save_path,
                                           const std::filesystem::path& directory,
                                           int64_t unix_seconds);

class CaptureTool {
public:
    CaptureTool(CaptureSettings settings, WindowManager& windows, ScreenCapture& screen,
                const Logger& log);

    ToolOutcome capture(const std::optional<std::string>& save_path, bool exclude_titlebar);

private:
    CaptureSettings settings_;
    WindowManager& windows_;
    ScreenCapture& screen_;
    const Logger& log_;
};
