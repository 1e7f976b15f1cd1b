#include "platform/linux/stdio_server.hpp"

#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

StdioServer::StdioServer(LineHandler handler, int in_fd, int out_fd, const Logger& log)
    : handler_(std::move(handler)), in_fd_(in_fd), out_fd_(out_fd), log_(log) {}

StdioServer::~StdioServer() {
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool StdioServer::init(bool handle_signals) {
    if (handle_signals) {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGINT);
        sigaddset(&mask, SIGTERM);
        sigprocmask(SIG_BLOCK, &mask, nullptr);

        signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
        if (signal_fd_ < 0) {
            log_.error(std::string("signalfd failed: ") + std::strerror(errno));
            return false;
        }
    }

    running_.store(true, std::memory_order_release);
    return true;
}

bool StdioServer::run() {
    bool ok = true;
    while (running_.load(std::memory_order_relaxed)) {
        pollfd fds[2];
        nfds_t n = 0;
        fds[n++] = {.fd = in_fd_, .events = POLLIN, .revents = 0};
        if (signal_fd_ >= 0) fds[n++] = {.fd = signal_fd_, .events = POLLIN, .revents = 0};

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            log_.error(std::string("poll error: ") + std::strerror(errno));
            ok = false;
            break;
        }

        if (n > 1 && fds[1].revents) {
            signalfd_siginfo info;
            if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                log_.info("Received signal, shutting down");
            }
            break;
        }

        if (fds[0].revents & POLLNVAL) {
            log_.error("Input is not readable");
            ok = false;
            break;
        }
        if (!fds[0].revents) continue;

        char buf[4096];
        ssize_t r = ::read(in_fd_, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            log_.error(std::string("read error: ") + std::strerror(errno));
            ok = false;
            break;
        }
        if (r == 0) {
            // A final line without a newline still counts
            if (!buffer_.empty()) {
                buffer_ += '\n';
                dispatch_lines();
            }
            log_.info("Input closed, shutting down");
            break;
        }

        buffer_.append(buf, static_cast<size_t>(r));
        dispatch_lines();
    }

    running_.store(false, std::memory_order_release);
    return ok && !output_failed_;
}

void StdioServer::dispatch_lines() {
    size_t start = 0;
    size_t nl;
    while (running_.load(std::memory_order_relaxed) &&
           (nl = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, nl - start);
        start = nl + 1;

        auto response = handler_(line);
        if (response && !write_all(*response + "\n")) {
            log_.error("Output closed, shutting down");
            output_failed_ = true;
            running_.store(false, std::memory_order_release);
        }
    }
    buffer_.erase(0, start);
}

bool StdioServer::write_all(const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t w = ::write(out_fd_, data.data() + written, data.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(w);
    }
    return true;
}
