#pragma once

#include <cstdio>
#include <string>

// Passed by reference to every component. Never writes to stdout, which
// carries the protocol.
class Logger {
public:
    explicit Logger(std::string tag, bool verbose = false, std::FILE* sink = stderr);

    void debug(const std::string& msg) const;
    void info(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void error(const std::string& msg) const;

private:
    void write(const char* level, const std::string& msg) const;

    std::string tag_;
    bool verbose_;
    std::FILE* sink_;
};
