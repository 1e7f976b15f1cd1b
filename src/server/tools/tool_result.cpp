#include "tools/tool_result.hpp"

const char* to_string(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::InvalidInput: return "invalid_input";
        case ToolErrorKind::TerminalUnavailable: return "terminal_unavailable";
        case ToolErrorKind::ScriptExecution: return "script_execution";
        case ToolErrorKind::Capture: return "capture";
        case ToolErrorKind::Clipboard: return "clipboard";
    }
    return "unknown";
}
