#pragma once

#include "tools/request_validator.hpp"
#include "tools/tool_registry.hpp"
#include "tools/tool_result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class Logger;

// Routes JSON-RPC requests. handle() never throws: every failure becomes an
// error response carrying the request id (or the fallback id).
class ProtocolDispatcher {
public:
    using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

    ProtocolDispatcher(const ToolRegistry& registry, const Logger& log);

    ProtocolDispatcher(const ProtocolDispatcher&) = delete;
    ProtocolDispatcher& operator=(const ProtocolDispatcher&) = delete;

    void register_handler(const std::string& tool, ToolHandler handler);

    nlohmann::json handle(const nlohmann::json& request);

    // Parses one input line and returns the serialized response. Returns
    // nullopt for blank lines and notifications, which get no reply.
    std::optional<std::string> handle_line(const std::string& line);

    uint64_t requests_handled() const { return requests_handled_; }

private:
    nlohmann::json route(const nlohmann::json& id, const std::string& method,
                         const nlohmann::json& params);
    nlohmann::json handle_initialize(const nlohmann::json& id);
    nlohmann::json handle_tools_list(const nlohmann::json& id);
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json request_id(const nlohmann::json& request);
    static bool is_notification(const nlohmann::json& request);

    const ToolRegistry& registry_;
    RequestValidator validator_;
    const Logger& log_;
    std::map<std::string, ToolHandler> handlers_;
    uint64_t requests_handled_ = 0;
};
