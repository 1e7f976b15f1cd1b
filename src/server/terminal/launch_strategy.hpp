#pragma once

#include <chrono>
#include <string>
#include <vector>

// One way of bringing up a PowerShell terminal. Strategies are tried in
// list order until one yields a discoverable window.
struct LaunchStrategy {
    std::string name;
    std::vector<std::string> command;            // argv, command[0] looked up in $PATH
    std::chrono::milliseconds window_timeout{15000};
};

std::vector<LaunchStrategy> default_launch_strategies();
