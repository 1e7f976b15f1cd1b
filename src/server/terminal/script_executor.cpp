#include "terminal/script_executor.hpp"

#include "logger.hpp"
#include "tools/request_validator.hpp"

#include <cctype>
#include <format>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

} // namespace

ScriptShape analyze_script(const std::string& script) {
    ScriptShape shape;
    std::istringstream in(script);
    std::string line;
    while (std::getline(in, line)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) shape.lines.push_back(std::move(trimmed));
    }
    shape.is_multiline = shape.lines.size() > 1;
    return shape;
}

ScriptExecutionOrchestrator::ScriptExecutionOrchestrator(SessionStateMachine& session,
                                                         InputInjector& input, Clock& clock,
                                                         SettleDelays delays, const Logger& log)
    : session_(session), input_(input), clock_(clock), delays_(delays), log_(log) {}

ToolOutcome ScriptExecutionOrchestrator::execute(const std::string& script, int timeout) {
    if (is_blank(script)) {
        return tool_error(ToolErrorKind::InvalidInput, "Empty script provided");
    }

    auto shape = analyze_script(script);
    std::string type = shape.type_name();
    auto count = shape.lines.size();
    log_.info(std::format("Preparing to execute {} with {} line(s)", type, count));

    auto ready = session_.ensure_ready();
    if (!ready) return std::unexpected(ready.error());

    log_.info(std::format("Executing {}...", type));
    auto pasted = input_.paste(script, true);
    if (!pasted) {
        return tool_error(ToolErrorKind::ScriptExecution,
                          std::format("Failed to paste {}: {}", type, pasted.error()));
    }

    clock_.sleep_for(shape.is_multiline ? delays_.multiline : delays_.single);

    log_.info("Script execution completed successfully");
    return nlohmann::json{
        {"lines_count", count},
        {"is_multiline", shape.is_multiline},
        {"script_type", type},
        {"timeout_used", timeout},
        {"focus", to_string(ready->focus)},
        {"message", std::format("{} with {} line{} executed successfully",
                                capitalize(type), count, count != 1 ? "s" : "")},
    };
}
