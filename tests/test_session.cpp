#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "terminal/session.hpp"

using namespace std::chrono_literals;

namespace {

SessionSettings test_settings() {
    return SessionSettings{
        .window_titles = {"PowerShell", "pwsh"},
        .launch = {
            {"first", {"foot", "pwsh"}, 2000ms},
            {"second", {"pwsh"}, 2000ms},
        },
        .launch_poll = 500ms,
        .retry = RetryPolicy{},
    };
}

} // namespace

TEST_CASE("Session state machine", "[session]") {
    FakeProcessInspector processes;
    FakeWindowManager windows;
    FakeClock clock;
    SessionStateMachine session(test_settings(), processes, windows, clock, quiet_logger());

    SECTION("InitialStateUnknown") {
        REQUIRE(session.state() == SessionState::Unknown);
        REQUIRE(session.trace().empty());
    }

    SECTION("RunningTerminalIsFocusedWithoutLaunch") {
        processes.running = true;
        windows.window = make_window(7, "Windows PowerShell");

        auto ready = session.ensure_ready();
        REQUIRE(ready);
        REQUIRE(ready->window.id == 7);
        REQUIRE(ready->focus == FocusResult::Confirmed);
        REQUIRE_FALSE(ready->launched);
        REQUIRE(processes.spawned.empty());
        REQUIRE(session.state() == SessionState::Ready);
        REQUIRE(session.trace() == std::vector<SessionState>{
            SessionState::Unknown, SessionState::Focusing, SessionState::Ready});
        REQUIRE(windows.last_titles == std::vector<std::string>{"PowerShell", "pwsh"});
    }

    SECTION("LaunchesWhenNoProcess") {
        windows.window = make_window(3, "PowerShell");

        auto ready = session.ensure_ready();
        REQUIRE(ready);
        REQUIRE(ready->launched);
        REQUIRE(ready->strategy == "first");
        REQUIRE(ready->attempts == 1);
        REQUIRE(processes.spawned.size() == 1);
        REQUIRE(processes.spawned[0] == std::vector<std::string>{"foot", "pwsh"});
        REQUIRE(session.trace() == std::vector<SessionState>{
            SessionState::Unknown, SessionState::Launching, SessionState::Searching,
            SessionState::Focusing, SessionState::Ready});
    }

    SECTION("LaunchFallsThroughToNextStrategy") {
        processes.fail_commands_named = "foot";
        windows.window = make_window(3, "pwsh");

        auto ready = session.ensure_ready();
        REQUIRE(ready);
        REQUIRE(ready->strategy == "second");
        REQUIRE(processes.spawned.size() == 2);
    }

    SECTION("AllStrategiesFail") {
        processes.fail_commands_named = "foot";
        SessionSettings settings = test_settings();
        settings.launch = {{"only", {"foot"}, 2000ms}};
        SessionStateMachine only_foot(settings, processes, windows, clock, quiet_logger());

        auto ready = only_foot.ensure_ready();
        REQUIRE_FALSE(ready);
        REQUIRE(ready.error().kind == ToolErrorKind::TerminalUnavailable);
        REQUIRE(ready.error().message == "Failed to launch PowerShell terminal");
        REQUIRE(only_foot.state() == SessionState::Failed);
    }

    SECTION("ProcessExitingEarlyMovesOn") {
        processes.spawned_process_dies = true;

        auto ready = session.ensure_ready();
        REQUIRE_FALSE(ready);
        REQUIRE(ready.error().message == "Failed to launch PowerShell terminal");
        REQUIRE(processes.spawned.size() == 2);
        // Dead processes are not polled
        REQUIRE(clock.sleeps.empty());
    }

    SECTION("WindowTimeoutTerminatesProcess") {
        // Process runs, but no window ever shows up
        auto ready = session.ensure_ready();
        REQUIRE_FALSE(ready);
        REQUIRE(processes.spawned.size() == 2);
        REQUIRE(processes.last_process->terminated);
        // 2000ms window timeout at 500ms polls, for each of two strategies
        REQUIRE(clock.sleeps.size() == 8);
        REQUIRE(clock.total() == 4000ms);
    }

    SECTION("DiscoveryIsBoundedToMaxAttempts") {
        windows.window = make_window(3, "PowerShell");
        windows.accept_activation = false;

        auto ready = session.ensure_ready();
        REQUIRE_FALSE(ready);
        REQUIRE(ready.error().kind == ToolErrorKind::TerminalUnavailable);
        REQUIRE(ready.error().message == "Terminal window not available after multiple attempts");
        REQUIRE(session.state() == SessionState::Failed);
        // One focus request per attempt, no delay after the last
        REQUIRE(windows.activated.size() == 10);
        REQUIRE(clock.sleeps.size() == 9);
        REQUIRE(clock.total() == RetryPolicy{}.worst_case_total());
    }

    SECTION("WindowAppearsOnLaterAttempt") {
        processes.running = false;
        // launch wait sees the window, first two retry searches do not
        windows.find_results = {make_window(3, "PowerShell"), std::nullopt, std::nullopt};
        windows.window = make_window(3, "PowerShell");

        auto ready = session.ensure_ready();
        REQUIRE(ready);
        REQUIRE(ready->attempts == 3);
        REQUIRE(clock.sleeps == std::vector<std::chrono::milliseconds>{500ms, 500ms});
    }

    SECTION("EachCallStartsFromUnknown") {
        processes.running = true;
        windows.window = make_window(7, "PowerShell");
        REQUIRE(session.ensure_ready());
        REQUIRE(session.ensure_ready());
        REQUIRE(session.trace().front() == SessionState::Unknown);
        REQUIRE(windows.activated.size() == 2);
    }
}

TEST_CASE("Session focus", "[session]") {
    FakeProcessInspector processes;
    FakeWindowManager windows;
    FakeClock clock;
    SessionStateMachine session(SessionSettings{}, processes, windows, clock, quiet_logger());
    auto target = make_window(5, "PowerShell");

    SECTION("ConfirmedWhenActive") {
        REQUIRE(session.focus(target) == FocusResult::Confirmed);
    }

    SECTION("UnconfirmedWhenAcceptedButOtherWindowActive") {
        windows.focus_follows_activation = false;
        windows.active = make_window(9, "Firefox");
        REQUIRE(session.focus(target) == FocusResult::Unconfirmed);
    }

    SECTION("FailedWhenRejectedAndNotActive") {
        windows.accept_activation = false;
        REQUIRE(session.focus(target) == FocusResult::Failed);
    }

    SECTION("ConfirmedWhenRejectedButAlreadyActive") {
        windows.accept_activation = false;
        windows.active = target;
        REQUIRE(session.focus(target) == FocusResult::Confirmed);
    }

    SECTION("RestoresMinimizedWindowFirst") {
        target.minimized = true;
        windows.window = target;
        REQUIRE(session.focus(target) == FocusResult::Confirmed);
        REQUIRE(windows.restores == 1);
    }

    SECTION("TitleMatchWhenIdUnknown") {
        WindowDescriptor untracked{.id = 0, .title = "PowerShell"};
        windows.focus_follows_activation = false;
        windows.accept_activation = false;
        windows.active = make_window(0, "Windows PowerShell 7");
        REQUIRE(session.focus(untracked) == FocusResult::Confirmed);
    }
}

TEST_CASE("Session state names", "[session]") {
    REQUIRE(std::string(to_string(SessionState::Ready)) == "ready");
    REQUIRE(std::string(to_string(SessionState::Launching)) == "launching");
    REQUIRE(std::string(to_string(FocusResult::Unconfirmed)) == "unconfirmed");
}
