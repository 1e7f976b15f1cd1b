#include "platform/linux/wayland_clipboard.hpp"

#include "platform/linux/subprocess.hpp"

std::expected<std::string, std::string> WaylandClipboard::read() {
    auto res = subprocess::run({"wl-paste", "--no-newline"});
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == 0) return std::move(res->out);
    if (res->exit_code == 127) return std::unexpected("wl-paste: command not found");

    // wl-paste exits 1 with "Nothing is copied" / "No selection" on an empty clipboard
    if (res->out.empty() && (res->err.find("Nothing is copied") != std::string::npos ||
                             res->err.find("No selection") != std::string::npos)) {
        return std::string();
    }
    return std::unexpected("wl-paste exited with code " + std::to_string(res->exit_code));
}

std::expected<void, std::string> WaylandClipboard::write(const std::string& text) {
    auto res = subprocess::check_output({"wl-copy"}, text, {.capture_output = false});
    if (!res) return std::unexpected(res.error());
    return {};
}
