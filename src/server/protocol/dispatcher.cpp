#include "protocol/dispatcher.hpp"

#include "logger.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/result_codec.hpp"

#include <format>

using json = nlohmann::json;

namespace {

std::string dump_line(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

ProtocolDispatcher::ProtocolDispatcher(const ToolRegistry& registry, const Logger& log)
    : registry_(registry), validator_(registry), log_(log) {}

void ProtocolDispatcher::register_handler(const std::string& tool, ToolHandler handler) {
    handlers_[tool] = std::move(handler);
}

std::optional<std::string> ProtocolDispatcher::handle_line(const std::string& line) {
    auto text = trim(line);
    if (text.empty()) return std::nullopt;

    json request;
    try {
        request = json::parse(text);
    } catch (const json::parse_error& e) {
        log_.error(std::format("Invalid JSON received in request #{}: {}", requests_handled_ + 1, e.what()));
        ++requests_handled_;
        return dump_line(result_codec::error(json_rpc::kFallbackId, json_rpc::kParseError, "Parse error"));
    }

    if (is_notification(request)) {
        log_.debug("Notification: " + request["method"].get<std::string>());
        return std::nullopt;
    }

    return dump_line(handle(request));
}

json ProtocolDispatcher::handle(const json& request) {
    ++requests_handled_;

    if (!request.is_object()) {
        log_.warn("Request is not a JSON object");
        return result_codec::error(json_rpc::kFallbackId, json_rpc::kParseError, "Parse error");
    }

    auto id = request_id(request);
    try {
        std::string method;
        auto it = request.find("method");
        if (it != request.end() && it->is_string()) method = it->get<std::string>();

        json params = json::object();
        if (auto p = request.find("params"); p != request.end() && !p->is_null()) {
            params = *p;
        }

        log_.debug(std::format("Handling request #{}: {}", requests_handled_, method));
        return route(id, method, params);
    } catch (const std::exception& e) {
        log_.error(std::string("Error handling request: ") + e.what());
        return result_codec::error(id, json_rpc::kInternalError, e.what());
    }
}

json ProtocolDispatcher::route(const json& id, const std::string& method, const json& params) {
    if (method == "initialize") return handle_initialize(id);
    if (method == "tools/list") return handle_tools_list(id);
    if (method == "tools/call") return handle_tools_call(id, params);

    auto shown = method.empty() ? std::string("<missing>") : method;
    log_.warn(std::format("Unknown method: {}", shown));
    return result_codec::error(id, json_rpc::kMethodNotFound, "Unknown method: " + shown);
}

json ProtocolDispatcher::handle_initialize(const json& id) {
    log_.info("Handling initialize request");
    return result_codec::success(id, {
        {"protocolVersion", mcp::kProtocolVersion},
        {"capabilities", {{"tools", json::object()}}},
        {"serverInfo", {{"name", mcp::kServerName}, {"version", mcp::kServerVersion}}},
    });
}

json ProtocolDispatcher::handle_tools_list(const json& id) {
    log_.debug(std::format("Listing {} available tools", registry_.tools().size()));
    return result_codec::success(id, registry_.list_payload());
}

json ProtocolDispatcher::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object()) {
        return result_codec::error(id, json_rpc::kInvalidParams, "Invalid params: expected an object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string() || name_it->get_ref<const std::string&>().empty()) {
        return result_codec::error(id, json_rpc::kInvalidParams, "Tool name is required");
    }
    const auto& name = name_it->get_ref<const std::string&>();

    if (!registry_.contains(name)) {
        log_.warn("Unknown tool: " + name);
        return result_codec::error(id, json_rpc::kMethodNotFound, "Unknown tool: " + name);
    }

    json arguments = json::object();
    if (auto a = params.find("arguments"); a != params.end() && !a->is_null()) {
        arguments = *a;
    }

    if (auto err = validator_.validate(name, arguments)) {
        log_.warn(std::format("Invalid arguments for {}: {}", name, *err));
        return result_codec::error(id, json_rpc::kInvalidParams, *err);
    }

    auto handler = handlers_.find(name);
    if (handler == handlers_.end()) {
        return result_codec::error(id, json_rpc::kMethodNotFound, "Tool not implemented: " + name);
    }

    std::string keys;
    for (auto& [key, _] : arguments.items()) {
        keys += keys.empty() ? key : ", " + key;
    }
    log_.info(std::format("Executing tool: {} with arguments: [{}]", name, keys));

    try {
        auto outcome = handler->second(arguments);
        if (outcome) {
            log_.info(std::format("Tool {} executed successfully", name));
        } else {
            log_.warn(std::format("Tool {} failed ({}): {}", name, to_string(outcome.error().kind),
                                  outcome.error().message));
        }
        return result_codec::success(id, result_codec::tool_call_result(outcome));
    } catch (const std::exception& e) {
        log_.error(std::format("Unexpected error executing tool {}: {}", name, e.what()));
        return result_codec::error(id, json_rpc::kInternalError,
                                   std::string("Tool execution failed: ") + e.what());
    }
}

json ProtocolDispatcher::request_id(const json& request) {
    auto it = request.find("id");
    if (it == request.end()) return json_rpc::kFallbackId;
    if (it->is_number_integer() || it->is_string() || it->is_null()) return *it;
    return json_rpc::kFallbackId;
}

bool ProtocolDispatcher::is_notification(const json& request) {
    if (!request.is_object() || request.contains("id")) return false;
    auto it = request.find("method");
    return it != request.end() && it->is_string() &&
           it->get_ref<const std::string&>().starts_with("notifications/");
}
