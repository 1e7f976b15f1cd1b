#include "tools/capture_tool.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

bool ends_with_png(const std::string& path) {
    if (path.size() < 4) return false;
    std::string ext = path.substr(path.size() - 4);
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".png";
}

std::expected<uintmax_t, std::string> write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) return std::unexpected("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return std::unexpected("cannot open " + path.string() + " for writing");
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) return std::unexpected("write to " + path.string() + " failed");

    auto size = fs::file_size(path, ec);
    if (ec) return std::unexpected("cannot stat " + path.string() + ": " + ec.message());
    return size;
}

} // namespace

std::expected<Rect, std::string> capture_region(const Rect& window, bool exclude_titlebar,
                                                int titlebar_height) {
    Rect region = window;
    if (exclude_titlebar) {
        region.top += titlebar_height;
        region.height -= titlebar_height;
    }

    if (!region.valid()) {
        return std::unexpected(std::format("Invalid capture geometry: {}x{}", region.width, region.height));
    }
    return region;
}

fs::path resolve_capture_path(const std::optional<std::string>& save_path,
                              const fs::path& directory, int64_t unix_seconds) {
    if (save_path && !save_path->empty()) {
        std::string path = *save_path;
        if (!ends_with_png(path)) path += ".png";
        return fs::absolute(path);
    }
    return directory / std::format("terminal_capture_{}.png", unix_seconds);
}

CaptureTool::CaptureTool(CaptureSettings settings, WindowManager& windows, ScreenCapture& screen,
                         const Logger& log)
    : settings_(std::move(settings)), windows_(windows), screen_(screen), log_(log) {}

ToolOutcome CaptureTool::capture(const std::optional<std::string>& save_path, bool exclude_titlebar) {
    log_.info(std::format("Capturing terminal output (exclude_titlebar: {})", exclude_titlebar));

    auto window = windows_.find(settings_.window_titles);
    if (!window) {
        log_.error("Could not find terminal window for capture");
        return tool_error(ToolErrorKind::Capture,
                          "Failed to capture terminal window - window may not be visible or accessible");
    }
    if (window->minimized) {
        windows_.restore_if_minimized(*window);
        window = windows_.find(settings_.window_titles);
        if (!window) {
            return tool_error(ToolErrorKind::Capture,
                              "Failed to capture terminal window - window may not be visible or accessible");
        }
    }

    auto region = capture_region(window->rect, exclude_titlebar, settings_.titlebar_height);
    if (!region) {
        log_.error(region.error());
        return tool_error(ToolErrorKind::Capture, region.error());
    }

    auto image = screen_.grab(*region);
    if (!image) {
        log_.error("Error capturing terminal output: " + image.error());
        return tool_error(ToolErrorKind::Capture, "Screenshot capture failed: " + image.error());
    }
    log_.info(std::format("Captured terminal screenshot: {}x{}", image->width, image->height));

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto path = resolve_capture_path(save_path, settings_.directory, now);

    auto written = write_file(path, image->png);
    if (!written) {
        log_.error("Error saving screenshot: " + written.error());
        return tool_error(ToolErrorKind::Capture, "Screenshot capture failed: " + written.error());
    }
    log_.info(std::format("Screenshot saved: {} ({} bytes)", path.string(), *written));

    bool custom = save_path && !save_path->empty();
    return nlohmann::json{
        {"saved_to", path.string()},
        {"size", {{"width", image->width}, {"height", image->height}}},
        {"file_size_bytes", *written},
        {"exclude_titlebar", exclude_titlebar},
        {"custom_path", custom},
        {"message", std::format("Screenshot saved to {}", custom ? "specified path" : "temp directory")},
    };
}
