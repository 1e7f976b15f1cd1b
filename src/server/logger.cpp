#include "logger.hpp"

#include <print>

Logger::Logger(std::string tag, bool verbose, std::FILE* sink)
    : tag_(std::move(tag)), verbose_(verbose), sink_(sink) {}

void Logger::debug(const std::string& msg) const {
    if (verbose_) write("debug", msg);
}

void Logger::info(const std::string& msg) const {
    if (verbose_) write(nullptr, msg);
}

void Logger::warn(const std::string& msg) const {
    write("warning", msg);
}

void Logger::error(const std::string& msg) const {
    write("error", msg);
}

void Logger::write(const char* level, const std::string& msg) const {
    if (!sink_) return;
    if (level) {
        std::println(sink_, "[{}] {}: {}", tag_, level, msg);
    } else {
        std::println(sink_, "[{}] {}", tag_, msg);
    }
    std::fflush(sink_);
}
