#pragma once

#include "tools/tool_result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace result_codec {

// {"success": true, ...data} or {"success": false, "error": message}
nlohmann::json encode(const ToolOutcome& outcome);

// tools/call result: the encoded outcome as one pretty-printed text block.
nlohmann::json tool_call_result(const ToolOutcome& outcome);

nlohmann::json success(const nlohmann::json& id, nlohmann::json result);
nlohmann::json error(const nlohmann::json& id, int code, const std::string& message);

} // namespace result_codec
