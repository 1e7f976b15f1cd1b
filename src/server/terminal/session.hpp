#pragma once

#include "platform/clock.hpp"
#include "platform/process_inspector.hpp"
#include "platform/window_manager.hpp"
#include "terminal/launch_strategy.hpp"
#include "terminal/retry_policy.hpp"
#include "terminal/window_info.hpp"
#include "tools/tool_result.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

class Logger;

enum class SessionState { Unknown, Launching, Searching, Focusing, Ready, Failed };

// Unconfirmed means the activation request was accepted but the compositor
// did not report the window as focused afterwards. It still counts as ready.
enum class FocusResult { Confirmed, Unconfirmed, Failed };

const char* to_string(SessionState state);
const char* to_string(FocusResult result);

struct ReadyTerminal {
    WindowDescriptor window;
    FocusResult focus = FocusResult::Failed;
    int attempts = 0;        // discovery/focus attempts after a launch
    bool launched = false;
    std::string strategy;    // launch strategy that produced the window
};

struct SessionSettings {
    std::vector<std::string> window_titles;
    std::vector<LaunchStrategy> launch;
    std::chrono::milliseconds launch_poll{500};
    RetryPolicy retry;
};

// Brings the PowerShell terminal from "unknown" to "focused". Holds no state
// between ensure_ready() calls; every run starts at Unknown.
class SessionStateMachine {
public:
    SessionStateMachine(SessionSettings settings, ProcessInspector& processes,
                        WindowManager& windows, Clock& clock, const Logger& log);

    std::expected<ReadyTerminal, ToolError> ensure_ready();

    // State reached by the most recent ensure_ready() call.
    SessionState state() const { return state_; }
    // Every state entered by the most recent ensure_ready() call, in order.
    const std::vector<SessionState>& trace() const { return trace_; }

    FocusResult focus(const WindowDescriptor& window);

private:
    void enter(SessionState next);
    std::expected<std::string, ToolError> launch();
    bool wait_for_window(LaunchedProcess& process, const LaunchStrategy& strategy);
    std::expected<ReadyTerminal, ToolError> fail(std::string message);

    SessionSettings settings_;
    ProcessInspector& processes_;
    WindowManager& windows_;
    Clock& clock_;
    const Logger& log_;

    SessionState state_ = SessionState::Unknown;
    std::vector<SessionState> trace_;
};
