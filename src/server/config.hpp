#pragma once

#include "terminal/launch_strategy.hpp"
#include "terminal/retry_policy.hpp"

#include <chrono>
#include <string>
#include <vector>

class Logger;

struct Config {
    struct Server {
        int default_timeout = 30;
    } server;

    struct Terminal {
        std::vector<std::string> process_names = {"pwsh", "powershell"};
        std::vector<std::string> window_titles = {"PowerShell", "pwsh", "Windows PowerShell"};
        std::vector<LaunchStrategy> launch = default_launch_strategies();
        std::chrono::milliseconds launch_poll{500};
    } terminal;

    RetryPolicy retry;

    struct Execution {
        std::chrono::milliseconds single_settle{1000};
        std::chrono::milliseconds multiline_settle{2000};
    } execution;

    struct Capture {
        int titlebar_height = 35;
        std::string directory;  // empty: platform::capture_dir()
    } capture;

    static Config load(const std::string& path, const Logger& log);
    static Config load_default(const Logger& log);
};
