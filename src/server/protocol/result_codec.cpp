#include "protocol/result_codec.hpp"

#include "protocol/json_rpc.hpp"

using json = nlohmann::json;

namespace result_codec {

json encode(const ToolOutcome& outcome) {
    json result = {{"success", outcome.has_value()}};
    if (outcome) {
        if (outcome->is_object()) {
            for (auto& [key, value] : outcome->items()) {
                if (key != "success") result[key] = value;
            }
        }
    } else {
        result["error"] = outcome.error().message;
    }
    return result;
}

json tool_call_result(const ToolOutcome& outcome) {
    return {
        {"content", json::array({{{"type", "text"}, {"text", encode(outcome).dump(2, ' ', false, json::error_handler_t::replace)}}})},
        {"isError", !outcome.has_value()},
    };
}

json success(const json& id, json result) {
    return {{"jsonrpc", json_rpc::kVersion}, {"id", id}, {"result", std::move(result)}};
}

json error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", json_rpc::kVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

} // namespace result_codec
