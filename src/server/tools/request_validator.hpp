#pragma once

#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Checks tool-call arguments against the registry before any handler runs.
class RequestValidator {
public:
    explicit RequestValidator(const ToolRegistry& registry);

    // Returns the first violated constraint, or nullopt if `arguments` are
    // acceptable. Required fields are checked before types and ranges.
    std::optional<std::string> validate(const std::string& tool,
                                        const nlohmann::json& arguments) const;

private:
    static std::optional<std::string> check_param(const ParamSpec& spec,
                                                  const nlohmann::json& value);

    const ToolRegistry& registry_;
};

bool is_blank(const std::string& s);
