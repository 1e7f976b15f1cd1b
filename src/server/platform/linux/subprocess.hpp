#pragma once

#include <expected>
#include <string>
#include <vector>

struct ProcessOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
};

namespace subprocess {

struct RunOptions {
    // When false, stdout/stderr go to /dev/null. Needed for programs that
    // leave a background child holding the pipes open (wl-copy).
    bool capture_output = true;
};

// Runs argv[0] (looked up in $PATH) to completion, feeding `input` on stdin
// and collecting stdout/stderr. Exit code 127 means exec failed.
std::expected<ProcessOutput, std::string> run(const std::vector<std::string>& argv,
                                              const std::string& input = {},
                                              RunOptions options = {});

// Like run(), but a non-zero exit status is an error carrying stderr.
std::expected<std::string, std::string> check_output(const std::vector<std::string>& argv,
                                                     const std::string& input = {},
                                                     RunOptions options = {});

// Starts argv[0] in its own session with stdio on /dev/null and returns its
// pid without waiting. Fails if the program cannot be executed.
std::expected<int, std::string> spawn_detached(const std::vector<std::string>& argv);

} // namespace subprocess
