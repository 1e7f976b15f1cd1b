#pragma once

#include "platform/clock.hpp"
#include "platform/input_injector.hpp"
#include "terminal/session.hpp"
#include "tools/tool_result.hpp"

#include <chrono>
#include <string>
#include <vector>

class Logger;

struct ScriptShape {
    std::vector<std::string> lines;  // non-blank lines, trimmed
    bool is_multiline = false;

    const char* type_name() const { return is_multiline ? "multi-line script" : "single command"; }
};

ScriptShape analyze_script(const std::string& script);

struct SettleDelays {
    std::chrono::milliseconds single{1000};
    std::chrono::milliseconds multiline{2000};
};

// ensure ready -> paste and submit -> settle delay -> result. The settle delay
// only gives the shell time to start; completion is never confirmed, and
// `timeout` is reported back but not enforced.
class ScriptExecutionOrchestrator {
public:
    ScriptExecutionOrchestrator(SessionStateMachine& session, InputInjector& input,
                                Clock& clock, SettleDelays delays, const Logger& log);

    ToolOutcome execute(const std::string& script, int timeout);

private:
    SessionStateMachine& session_;
    InputInjector& input_;
    Clock& clock_;
    SettleDelays delays_;
    const Logger& log_;
};
