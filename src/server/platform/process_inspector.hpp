#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

// A process started by ProcessInspector::spawn. Destroying the handle does
// not stop the process.
class LaunchedProcess {
public:
    virtual ~LaunchedProcess() = default;
    virtual int pid() const = 0;
    virtual bool alive() = 0;
    virtual void terminate() = 0;
};

class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;
    virtual bool is_target_process_running() = 0;
    virtual std::expected<std::unique_ptr<LaunchedProcess>, std::string>
        spawn(const std::vector<std::string>& command) = 0;
};
