#pragma once

#include "platform/process_inspector.hpp"

#include <string>
#include <vector>

class Logger;

// Finds the PowerShell process by scanning /proc/<pid>/comm and starts new
// terminals as children of this process.
class ProcfsInspector : public ProcessInspector {
public:
    ProcfsInspector(std::vector<std::string> process_names, const Logger& log,
                    std::string proc_root = "/proc");

    bool is_target_process_running() override;
    std::expected<std::unique_ptr<LaunchedProcess>, std::string>
        spawn(const std::vector<std::string>& command) override;

    // Pids whose comm contains one of the configured names, zombies excluded.
    std::vector<int> find_matching() const;

private:
    std::string read_comm(int pid) const;
    char read_state(int pid) const;
    static void reap_exited_children();

    std::vector<std::string> process_names_;
    const Logger& log_;
    std::string proc_root_;
};

class ChildProcess : public LaunchedProcess {
public:
    explicit ChildProcess(int pid) : pid_(pid) {}

    int pid() const override { return pid_; }
    bool alive() override;
    void terminate() override;

private:
    bool wait_exit(int timeout_ms);

    int pid_;
    bool exited_ = false;
};
