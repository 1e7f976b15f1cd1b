#include "cli_options.hpp"

#include <print>

std::expected<CliOptions, std::string> parse_cli(int argc, const char* const argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected(arg + " requires a path");
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        }
    }
    return opts;
}

void print_usage() {
    // stdout is the protocol channel, help goes to stderr
    std::println(stderr, "Usage: pwsh-mcp [options]");
    std::println(stderr, "Serves MCP (JSON-RPC 2.0) on stdin/stdout.");
    std::println(stderr, "Options:");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -h, --help          Show this help");
}
