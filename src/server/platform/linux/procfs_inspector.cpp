#include "platform/linux/procfs_inspector.hpp"

#include "logger.hpp"
#include "platform/linux/subprocess.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <signal.h>
#include <sys/wait.h>
#include <thread>

namespace fs = std::filesystem;

ProcfsInspector::ProcfsInspector(std::vector<std::string> process_names, const Logger& log,
                                 std::string proc_root)
    : process_names_(std::move(process_names)), log_(log), proc_root_(std::move(proc_root)) {}

bool ProcfsInspector::is_target_process_running() {
    reap_exited_children();
    return !find_matching().empty();
}

std::vector<int> ProcfsInspector::find_matching() const {
    std::vector<int> pids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::isdigit(static_cast<unsigned char>(name[0]))) continue;

        int pid = 0;
        try {
            pid = std::stoi(name);
        } catch (const std::exception&) {
            continue;
        }

        auto comm = read_comm(pid);
        if (comm.empty()) continue;

        for (const auto& target : process_names_) {
            if (comm.find(target) != std::string::npos) {
                if (read_state(pid) != 'Z') pids.push_back(pid);
                break;
            }
        }
    }
    return pids;
}

std::expected<std::unique_ptr<LaunchedProcess>, std::string>
ProcfsInspector::spawn(const std::vector<std::string>& command) {
    auto pid = subprocess::spawn_detached(command);
    if (!pid) return std::unexpected(pid.error());

    log_.debug(std::format("Spawned {} (PID: {})", command.front(), *pid));
    return std::make_unique<ChildProcess>(*pid);
}

std::string ProcfsInspector::read_comm(int pid) const {
    std::ifstream f(std::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

char ProcfsInspector::read_state(int pid) const {
    // /proc/<pid>/stat: "pid (comm) S ...", comm may contain spaces and parens
    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return '?';
    std::string stat;
    std::getline(f, stat);
    auto close = stat.rfind(')');
    if (close == std::string::npos || close + 2 >= stat.size()) return '?';
    return stat[close + 2];
}

void ProcfsInspector::reap_exited_children() {
    // Terminals we launched and that have since closed
    while (::waitpid(-1, nullptr, WNOHANG) > 0) {}
}

bool ChildProcess::alive() {
    if (exited_) return false;
    int status;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    // r == pid_: exited now; ECHILD: already reaped elsewhere
    exited_ = true;
    return false;
}

void ChildProcess::terminate() {
    if (!alive()) return;
    ::kill(pid_, SIGTERM);
    if (wait_exit(3000)) return;
    ::kill(pid_, SIGKILL);
    wait_exit(1000);
}

bool ChildProcess::wait_exit(int timeout_ms) {
    using namespace std::chrono;
    auto deadline = steady_clock::now() + milliseconds(timeout_ms);
    while (steady_clock::now() < deadline) {
        if (!alive()) return true;
        std::this_thread::sleep_for(milliseconds(50));
    }
    return !alive();
}
