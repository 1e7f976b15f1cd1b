#include "tools/request_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

RequestValidator::RequestValidator(const ToolRegistry& registry)
    : registry_(registry) {}

std::optional<std::string> RequestValidator::validate(const std::string& tool,
                                                      const nlohmann::json& arguments) const {
    const auto* def = registry_.find(tool);
    if (!def) return "Unknown tool: " + tool;

    if (!arguments.is_object()) return "Tool arguments must be an object";

    for (const auto& spec : def->params) {
        if (spec.required && !arguments.contains(spec.name)) {
            return "Missing required argument: " + spec.name;
        }
    }

    for (const auto& spec : def->params) {
        auto it = arguments.find(spec.name);
        if (it == arguments.end()) continue;
        if (auto err = check_param(spec, *it)) return err;
    }

    return std::nullopt;
}

std::optional<std::string> RequestValidator::check_param(const ParamSpec& spec,
                                                         const nlohmann::json& value) {
    if (value.is_null() && spec.nullable) return std::nullopt;

    switch (spec.type) {
        case ParamType::String: {
            if (!value.is_string()) return spec.type_message;
            if (spec.non_blank && is_blank(value.get_ref<const std::string&>())) {
                return spec.constraint_message;
            }
            break;
        }
        case ParamType::Integer: {
            // is_number_integer() is false for booleans and floats
            if (!value.is_number_integer()) return spec.type_message;
            auto n = value.get<int64_t>();
            if ((spec.minimum && n < *spec.minimum) || (spec.maximum && n > *spec.maximum)) {
                return spec.constraint_message;
            }
            break;
        }
        case ParamType::Boolean:
            if (!value.is_boolean()) return spec.type_message;
            break;
    }
    return std::nullopt;
}

bool is_blank(const std::string& s) {
    return std::ranges::all_of(s, [](unsigned char c) { return std::isspace(c); });
}
