#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/pwsh-mcp";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/pwsh-mcp";
}

std::string capture_dir() {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "pwsh-mcp" / "temp").string();
}

} // namespace platform
