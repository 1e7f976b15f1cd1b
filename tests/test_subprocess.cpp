#include <catch2/catch_test_macros.hpp>

#include "platform/linux/subprocess.hpp"

#include <chrono>
#include <fstream>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

// Blocks SIGINT and SIGTERM the way the stdio server does, restores on exit.
struct BlockedSignals {
    sigset_t old;
    BlockedSignals() {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        ::sigprocmask(SIG_BLOCK, &mask, &old);
    }
    ~BlockedSignals() { ::sigprocmask(SIG_SETMASK, &old, nullptr); }
};

std::string blocked_mask_of(pid_t pid) {
    std::ifstream status("/proc/" + std::to_string(pid) + "/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.starts_with("SigBlk:")) {
            auto pos = line.find_first_not_of(" \t", 7);
            return pos == std::string::npos ? std::string() : line.substr(pos);
        }
    }
    return {};
}

} // namespace

TEST_CASE("subprocess::run", "[subprocess]") {

    SECTION("CapturesStdout") {
        auto res = subprocess::run({"echo", "hello"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "hello\n");
    }

    SECTION("FeedsStdin") {
        auto res = subprocess::run({"cat"}, "line one\nline two");
        REQUIRE(res);
        REQUIRE(res->out == "line one\nline two");
    }

    SECTION("LargeInputDoesNotDeadlock") {
        std::string big(256 * 1024, 'x');
        auto res = subprocess::run({"cat"}, big);
        REQUIRE(res);
        REQUIRE(res->out.size() == big.size());
    }

    SECTION("CapturesStderrAndExitCode") {
        auto res = subprocess::run({"sh", "-c", "echo oops >&2; exit 3"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 3);
        REQUIRE(res->err == "oops\n");
    }

    SECTION("MissingProgramExits127") {
        auto res = subprocess::run({"pwsh_mcp_no_such_program_xyz"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 127);
    }

    SECTION("OutputDiscardedWhenNotCaptured") {
        auto res = subprocess::run({"echo", "hello"}, {}, {.capture_output = false});
        REQUIRE(res);
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out.empty());
    }

    SECTION("EmptyCommand") {
        REQUIRE_FALSE(subprocess::run({}));
    }

    SECTION("ChildStartsWithNoBlockedSignals") {
        BlockedSignals blocked;
        auto res = subprocess::run({"sh", "-c", "grep SigBlk /proc/self/status"});
        REQUIRE(res);
        REQUIRE(res->exit_code == 0);
        auto pos = res->out.find_first_not_of(" \t", 7);
        REQUIRE(pos != std::string::npos);
        auto hex = res->out.substr(pos);
        while (!hex.empty() && hex.back() == '\n') hex.pop_back();
        REQUIRE(std::stoull(hex, nullptr, 16) == 0);
    }
}

TEST_CASE("subprocess::check_output", "[subprocess]") {

    SECTION("ReturnsStdout") {
        auto out = subprocess::check_output({"printf", "%s", "abc"});
        REQUIRE(out);
        REQUIRE(*out == "abc");
    }

    SECTION("NonZeroExitCarriesStderr") {
        auto out = subprocess::check_output({"sh", "-c", "echo 'bad thing' >&2; exit 2"});
        REQUIRE_FALSE(out);
        REQUIRE(out.error() == "sh exited with code 2: bad thing");
    }

    SECTION("CommandNotFound") {
        auto out = subprocess::check_output({"pwsh_mcp_no_such_program_xyz"});
        REQUIRE_FALSE(out);
        REQUIRE(out.error() == "pwsh_mcp_no_such_program_xyz: command not found");
    }
}

TEST_CASE("subprocess::spawn_detached", "[subprocess]") {

    SECTION("ChildStartsWithNoBlockedSignals") {
        BlockedSignals blocked;
        auto pid = subprocess::spawn_detached({"sleep", "30"});
        REQUIRE(pid);

        auto mask = blocked_mask_of(*pid);
        REQUIRE_FALSE(mask.empty());
        REQUIRE(std::stoull(mask, nullptr, 16) == 0);

        REQUIRE(::kill(*pid, SIGTERM) == 0);
        int status = 0;
        pid_t reaped = 0;
        for (int i = 0; i < 200 && reaped == 0; ++i) {
            reaped = ::waitpid(*pid, &status, WNOHANG);
            if (reaped == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (reaped == 0) {
            ::kill(*pid, SIGKILL);
            ::waitpid(*pid, nullptr, 0);
        }
        REQUIRE(reaped == *pid);
        REQUIRE(WIFSIGNALED(status));
        REQUIRE(WTERMSIG(status) == SIGTERM);
    }

    SECTION("MissingProgramReportsError") {
        auto pid = subprocess::spawn_detached({"pwsh_mcp_no_such_program_xyz"});
        REQUIRE_FALSE(pid);
    }
}
