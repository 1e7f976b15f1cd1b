#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>

class Logger;

// Line-oriented request loop over a pair of file descriptors (stdin/stdout in
// production). One request per line in, one response per line out.
class StdioServer {
public:
    // Returns the response line (without newline), or nullopt for no reply.
    using LineHandler = std::function<std::optional<std::string>(const std::string&)>;

    StdioServer(LineHandler handler, int in_fd, int out_fd, const Logger& log);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // With `handle_signals`, SIGINT/SIGTERM are routed through a signalfd and
    // end run() cleanly.
    bool init(bool handle_signals = true);

    // Serves until end of input, a signal, or an I/O error. Returns false on
    // an I/O error.
    bool run();

private:
    void dispatch_lines();
    bool write_all(const std::string& data);

    LineHandler handler_;
    int in_fd_;
    int out_fd_;
    const Logger& log_;

    int signal_fd_ = -1;
    std::string buffer_;
    bool output_failed_ = false;
    std::atomic<bool> running_{false};
};
