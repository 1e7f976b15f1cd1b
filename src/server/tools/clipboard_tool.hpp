#pragma once

#include "platform/clipboard.hpp"
#include "tools/tool_result.hpp"

#include <cstddef>
#include <string>

class Logger;

class ClipboardTool {
public:
    ClipboardTool(Clipboard& clipboard, const Logger& log);

    ToolOutcome get();

private:
    Clipboard& clipboard_;
    const Logger& log_;
};

// Number of Unicode code points in a UTF-8 string.
size_t utf8_length(const std::string& s);
