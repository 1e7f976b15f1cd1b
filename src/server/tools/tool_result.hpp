#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

enum class ToolErrorKind {
    InvalidInput,
    TerminalUnavailable,
    ScriptExecution,
    Capture,
    Clipboard,
};

struct ToolError {
    ToolErrorKind kind;
    std::string message;
};

// Success carries the tool's data fields, flattened into the wire result.
using ToolOutcome = std::expected<nlohmann::json, ToolError>;

inline std::unexpected<ToolError> tool_error(ToolErrorKind kind, std::string message) {
    return std::unexpected(ToolError{kind, std::move(message)});
}

const char* to_string(ToolErrorKind kind);
