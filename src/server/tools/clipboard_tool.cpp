#include "tools/clipboard_tool.hpp"

#include "logger.hpp"

#include <format>

ClipboardTool::ClipboardTool(Clipboard& clipboard, const Logger& log)
    : clipboard_(clipboard), log_(log) {}

ToolOutcome ClipboardTool::get() {
    auto content = clipboard_.read();
    if (!content) {
        log_.error("Error getting clipboard content: " + content.error());
        return tool_error(ToolErrorKind::Clipboard,
                          "Failed to get clipboard content: " + content.error());
    }

    auto length = utf8_length(*content);
    log_.debug(std::format("Retrieved clipboard content: {} characters", length));

    return nlohmann::json{
        {"content", *content},
        {"length", length},
        {"is_empty", length == 0},
        {"message", std::format("Clipboard content retrieved successfully ({} characters)", length)},
    };
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}
