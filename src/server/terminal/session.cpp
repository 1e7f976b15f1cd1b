#include "terminal/session.hpp"

#include "logger.hpp"

#include <format>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Unknown: return "unknown";
        case SessionState::Launching: return "launching";
        case SessionState::Searching: return "searching";
        case SessionState::Focusing: return "focusing";
        case SessionState::Ready: return "ready";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(FocusResult result) {
    switch (result) {
        case FocusResult::Confirmed: return "confirmed";
        case FocusResult::Unconfirmed: return "unconfirmed";
        case FocusResult::Failed: return "failed";
    }
    return "failed";
}

SessionStateMachine::SessionStateMachine(SessionSettings settings, ProcessInspector& processes,
                                         WindowManager& windows, Clock& clock, const Logger& log)
    : settings_(std::move(settings)), processes_(processes),
      windows_(windows), clock_(clock), log_(log) {}

std::expected<ReadyTerminal, ToolError> SessionStateMachine::ensure_ready() {
    trace_.clear();
    enter(SessionState::Unknown);

    if (processes_.is_target_process_running()) {
        if (auto window = windows_.find(settings_.window_titles)) {
            enter(SessionState::Focusing);
            auto focus_result = focus(*window);
            if (focus_result != FocusResult::Failed) {
                enter(SessionState::Ready);
                return ReadyTerminal{.window = std::move(*window), .focus = focus_result};
            }
        }
    }

    log_.info("Terminal not available, attempting to launch...");
    enter(SessionState::Launching);
    auto strategy = launch();
    if (!strategy) {
        enter(SessionState::Failed);
        return std::unexpected(strategy.error());
    }

    const auto& retry = settings_.retry;
    log_.debug(std::format("Searching for terminal window: up to {} attempts over {}ms",
                           retry.max_attempts, retry.worst_case_total().count()));
    for (int attempt = 1; attempt <= retry.max_attempts; ++attempt) {
        enter(SessionState::Searching);
        if (auto window = windows_.find(settings_.window_titles)) {
            enter(SessionState::Focusing);
            auto focus_result = focus(*window);
            if (focus_result != FocusResult::Failed) {
                log_.info(std::format("Terminal ready after {} attempt(s)", attempt));
                enter(SessionState::Ready);
                return ReadyTerminal{
                    .window = std::move(*window),
                    .focus = focus_result,
                    .attempts = attempt,
                    .launched = true,
                    .strategy = *strategy,
                };
            }
        }

        log_.debug(std::format("Terminal not ready, attempt {}/{}", attempt, retry.max_attempts));
        if (attempt < retry.max_attempts) clock_.sleep_for(retry.delay(attempt));
    }

    return fail("Terminal window not available after multiple attempts");
}

FocusResult SessionStateMachine::focus(const WindowDescriptor& window) {
    log_.info("Focusing window: " + window.title);

    windows_.restore_if_minimized(window);
    bool accepted = windows_.activate(window);
    if (!accepted) {
        log_.warn("Activation request rejected for window: " + window.title);
    }

    auto active = windows_.active_window();
    bool is_target = active && (window.id != 0 ? active->id == window.id
                                               : active->title.find(window.title) != std::string::npos);
    if (is_target) {
        log_.info("Successfully focused terminal window");
        return FocusResult::Confirmed;
    }

    if (accepted) {
        log_.warn("Focus verification failed. Active: " + (active ? active->title : std::string("None")));
        return FocusResult::Unconfirmed;
    }
    return FocusResult::Failed;
}

void SessionStateMachine::enter(SessionState next) {
    state_ = next;
    trace_.push_back(next);
}

std::expected<std::string, ToolError> SessionStateMachine::launch() {
    for (const auto& strategy : settings_.launch) {
        log_.info(std::format("Attempting to launch with strategy '{}'", strategy.name));

        auto process = processes_.spawn(strategy.command);
        if (!process) {
            log_.warn(std::format("Failed to launch with '{}': {}", strategy.name, process.error()));
            continue;
        }

        if (wait_for_window(**process, strategy)) {
            log_.info(std::format("Terminal launched and window found with strategy '{}'", strategy.name));
            return strategy.name;
        }
    }

    log_.error("All terminal launch attempts failed");
    return tool_error(ToolErrorKind::TerminalUnavailable, "Failed to launch PowerShell terminal");
}

bool SessionStateMachine::wait_for_window(LaunchedProcess& process, const LaunchStrategy& strategy) {
    log_.info(std::format("Waiting for terminal window to appear (PID: {})", process.pid()));

    auto poll = settings_.launch_poll.count() > 0 ? settings_.launch_poll : std::chrono::milliseconds(500);
    std::chrono::milliseconds waited{0};
    while (waited < strategy.window_timeout) {
        if (!process.alive()) {
            log_.warn(std::format("Terminal process for '{}' exited prematurely", strategy.name));
            return false;
        }

        if (processes_.is_target_process_running() && windows_.find(settings_.window_titles)) {
            return true;
        }

        clock_.sleep_for(poll);
        waited += poll;
    }

    log_.warn(std::format("Terminal process started but window not found after {}ms for '{}'",
                          strategy.window_timeout.count(), strategy.name));
    if (process.alive()) {
        log_.info("Terminating failed terminal process");
        process.terminate();
    }
    return false;
}

std::expected<ReadyTerminal, ToolError> SessionStateMachine::fail(std::string message) {
    enter(SessionState::Failed);
    log_.error(message);
    return tool_error(ToolErrorKind::TerminalUnavailable, std::move(message));
}
