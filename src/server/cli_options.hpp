#pragma once

#include <expected>
#include <string>

struct CliOptions {
    bool verbose = false;
    bool help = false;
    std::string config_path;  // empty: platform config dir
};

// Unknown arguments are ignored. Fails when an option is missing its value.
std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]);

void print_usage();
