#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

inline constexpr char kExecuteScriptTool[] = "execute_pwsh_script";
inline constexpr char kGetClipboardTool[] = "get_clipboard";
inline constexpr char kCaptureTool[] = "capture_pwsh_response";

enum class ParamType { String, Integer, Boolean };

struct ParamSpec {
    std::string name;
    ParamType type;
    std::string description;
    bool required = false;
    bool non_blank = false;          // strings: must contain a non-space character
    bool nullable = false;           // null accepted in place of a value
    std::optional<int> minimum;      // integers, inclusive
    std::optional<int> maximum;
    std::optional<nlohmann::json> default_value;
    std::string type_message;        // reported on a type mismatch
    std::string constraint_message;  // reported on a range/blank violation
};

struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    // {"type":"object","properties":{...},"required":[...]}
    nlohmann::json input_schema() const;
    nlohmann::json to_json() const;
};

// Read-only after construction.
class ToolRegistry {
public:
    explicit ToolRegistry(int default_timeout = 30);

    const std::vector<ToolDefinition>& tools() const { return tools_; }
    const ToolDefinition* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Cached {"tools": [...]} payload for tools/list.
    const nlohmann::json& list_payload() const { return list_payload_; }

    static constexpr int kMinTimeout = 1;
    static constexpr int kMaxTimeout = 300;

private:
    std::vector<ToolDefinition> tools_;
    nlohmann::json list_payload_;
};
