#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::expected<int, std::string> wait_child(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// The server blocks SIGINT/SIGTERM for its signalfd; exec keeps the mask.
void reset_signal_mask() {
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
}

void redirect_to_null(int target_fd, int flags) {
    int fd = ::open("/dev/null", flags);
    if (fd >= 0) {
        ::dup2(fd, target_fd);
        ::close(fd);
    }
}

} // namespace

std::expected<ProcessOutput, std::string> run(const std::vector<std::string>& argv,
                                              const std::string& input, RunOptions options) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2], out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));
    if (options.capture_output) {
        if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0) {
            auto msg = errno_message("pipe()");
            for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]})
                close_fd(*fd);
            return std::unexpected(msg);
        }
    }

    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]})
            close_fd(*fd);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: wire the pipes to stdio, exec
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (options.capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
        } else {
            redirect_to_null(STDOUT_FILENO, O_WRONLY);
            redirect_to_null(STDERR_FILENO, O_WRONLY);
        }
        reset_signal_mask();
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int write_fd = in_pipe[1];
    if (input.empty()) {
        close_fd(write_fd);
    } else {
        ::fcntl(write_fd, F_SETFL, ::fcntl(write_fd, F_GETFL) | O_NONBLOCK);
    }

    ProcessOutput result;
    size_t written = 0;
    std::string failure;

    while (write_fd >= 0 || out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        pollfd fds[3];
        int n = 0;
        int wi = -1, oi = -1, ei = -1;
        if (write_fd >= 0) { wi = n; fds[n++] = {.fd = write_fd, .events = POLLOUT, .revents = 0}; }
        if (out_pipe[0] >= 0) { oi = n; fds[n++] = {.fd = out_pipe[0], .events = POLLIN, .revents = 0}; }
        if (err_pipe[0] >= 0) { ei = n; fds[n++] = {.fd = err_pipe[0], .events = POLLIN, .revents = 0}; }

        if (::poll(fds, static_cast<nfds_t>(n), -1) < 0) {
            if (errno == EINTR) continue;
            failure = errno_message("poll()");
            break;
        }

        if (wi >= 0 && fds[wi].revents) {
            ssize_t w = ::write(write_fd, input.data() + written, input.size() - written);
            if (w < 0 && errno != EAGAIN && errno != EINTR) {
                // EPIPE: the child stopped reading
                close_fd(write_fd);
            } else if (w > 0) {
                written += static_cast<size_t>(w);
                if (written == input.size()) close_fd(write_fd);
            }
        }

        auto drain = [](int& fd, short revents, std::string& sink) {
            if (!revents) return;
            char buf[4096];
            ssize_t r = ::read(fd, buf, sizeof(buf));
            if (r > 0) {
                sink.append(buf, static_cast<size_t>(r));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fd);
            }
        };
        if (oi >= 0) drain(out_pipe[0], fds[oi].revents, result.out);
        if (ei >= 0) drain(err_pipe[0], fds[ei].revents, result.err);
    }

    close_fd(write_fd);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    auto code = wait_child(pid);
    if (!failure.empty()) return std::unexpected(failure);
    if (!code) return std::unexpected(code.error());
    result.exit_code = *code;
    return result;
}

std::expected<std::string, std::string> check_output(const std::vector<std::string>& argv,
                                                     const std::string& input, RunOptions options) {
    auto res = run(argv, input, options);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == 127) {
        return std::unexpected(argv[0] + ": command not found");
    }
    if (res->exit_code != 0) {
        std::string msg = argv[0] + " exited with code " + std::to_string(res->exit_code);
        auto end = res->err.find_last_not_of(" \n");
        if (end != std::string::npos) msg += ": " + res->err.substr(0, end + 1);
        return std::unexpected(msg);
    }
    return std::move(res->out);
}

std::expected<int, std::string> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    // The child reports a failed exec through this pipe; a successful exec
    // closes it (O_CLOEXEC) and the parent reads EOF.
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) return std::unexpected(errno_message("pipe()"));

    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return std::unexpected(msg);
    }

    if (pid == 0) {
        ::close(status_pipe[0]);
        ::setsid();
        redirect_to_null(STDIN_FILENO, O_RDONLY);
        redirect_to_null(STDOUT_FILENO, O_WRONLY);
        redirect_to_null(STDERR_FILENO, O_WRONLY);
        reset_signal_mask();
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        return std::unexpected(argv[0] + ": " + std::strerror(child_errno));
    }
    return static_cast<int>(pid);
}

} // namespace subprocess
