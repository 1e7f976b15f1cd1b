#include "terminal/launch_strategy.hpp"

std::vector<LaunchStrategy> default_launch_strategies() {
    return {
        {"pwsh-in-foot", {"foot", "-T", "PowerShell", "pwsh"}},
        {"pwsh-in-terminal", {"x-terminal-emulator", "-e", "pwsh"}},
        {"pwsh", {"pwsh"}},
        {"powershell", {"powershell"}},
    };
}
