#include "tools/tool_registry.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace {

const char* type_name(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Boolean: return "boolean";
    }
    return "string";
}

ToolDefinition execute_script_tool(int default_timeout) {
    ParamSpec script{
        .name = "script",
        .type = ParamType::String,
        .description = "PowerShell script to execute (single-line or multi-line)",
        .required = true,
        .non_blank = true,
        .type_message = "Script must be a string",
        .constraint_message = "Script cannot be empty",
    };

    ParamSpec timeout{
        .name = "timeout",
        .type = ParamType::Integer,
        .description = std::format("Timeout in seconds (default: {})", default_timeout),
        .minimum = ToolRegistry::kMinTimeout,
        .maximum = ToolRegistry::kMaxTimeout,
        .default_value = default_timeout,
        .type_message = "Timeout must be an integer between 1 and 300 seconds",
        .constraint_message = "Timeout must be an integer between 1 and 300 seconds",
    };

    return {
        kExecuteScriptTool,
        "Execute PowerShell script by pasting into terminal (supports both single-line and multi-line scripts)",
        {std::move(script), std::move(timeout)},
    };
}

ToolDefinition get_clipboard_tool() {
    return {kGetClipboardTool, "Get current clipboard content", {}};
}

ToolDefinition capture_tool() {
    ParamSpec save_path{
        .name = "save_path",
        .type = ParamType::String,
        .description = "Optional path to save screenshot",
        .nullable = true,
        .default_value = json(nullptr),
        .type_message = "save_path must be a string",
    };

    ParamSpec exclude_titlebar{
        .name = "exclude_titlebar",
        .type = ParamType::Boolean,
        .description = "Exclude window title bar from capture (default: true)",
        .default_value = true,
        .type_message = "exclude_titlebar must be a boolean",
    };

    return {
        kCaptureTool,
        "Capture PowerShell terminal output as screenshot",
        {std::move(save_path), std::move(exclude_titlebar)},
    };
}

} // namespace

json ToolDefinition::input_schema() const {
    json properties = json::object();
    json required = json::array();

    for (const auto& p : params) {
        json prop = {{"type", type_name(p.type)}, {"description", p.description}};
        if (p.non_blank) prop["minLength"] = 1;
        if (p.minimum) prop["minimum"] = *p.minimum;
        if (p.maximum) prop["maximum"] = *p.maximum;
        if (p.default_value) prop["default"] = *p.default_value;
        properties[p.name] = std::move(prop);

        if (p.required) required.push_back(p.name);
    }

    json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) schema["required"] = std::move(required);
    return schema;
}

json ToolDefinition::to_json() const {
    return {{"name", name}, {"description", description}, {"inputSchema", input_schema()}};
}

ToolRegistry::ToolRegistry(int default_timeout) {
    tools_.push_back(execute_script_tool(default_timeout));
    tools_.push_back(get_clipboard_tool());
    tools_.push_back(capture_tool());

    list_payload_ = {{"tools", json::array()}};
    for (const auto& tool : tools_) {
        list_payload_["tools"].push_back(tool.to_json());
    }
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    auto it = std::ranges::find_if(tools_, [&](const ToolDefinition& t) { return t.name == name; });
    return it != tools_.end() ? &*it : nullptr;
}
