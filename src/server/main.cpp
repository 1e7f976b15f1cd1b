#include "cli_options.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "platform/clock.hpp"
#include "platform/linux/grim_screen_capture.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "platform/linux/stdio_server.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/wayland_clipboard.hpp"
#include "platform/linux/wayland_input_injector.hpp"
#include "protocol/json_rpc.hpp"
#include "server_core.hpp"

#include <format>
#include <print>
#include <signal.h>
#include <unistd.h>

int main(int argc, char* argv[]) {
    auto opts = parse_cli(argc, argv);
    if (!opts) {
        std::println(stderr, "[pwsh-mcp] error: {}", opts.error());
        print_usage();
        return 1;
    }
    if (opts->help) {
        print_usage();
        return 0;
    }

    // Helper processes may exit before reading all of their input
    ::signal(SIGPIPE, SIG_IGN);

    Logger log("pwsh-mcp", opts->verbose);

    Config config;
    if (!opts->config_path.empty()) {
        config = Config::load(opts->config_path, log);
    } else {
        config = Config::load_default(log);
    }

    log.info(std::format("Starting {} v{}", mcp::kServerName, mcp::kServerVersion));

    ProcfsInspector processes(config.terminal.process_names, log);
    SwayWindowManager windows(log);
    if (!windows.connect()) {
        log.warn("Sway IPC not available, terminal window control disabled until it appears");
    }
    WaylandClipboard clipboard;
    WaylandInputInjector input(clipboard);
    GrimScreenCapture screen;
    SteadyClock clock;

    ServerCore core(std::move(config),
                    ServerCore::Platform{
                        .processes = processes,
                        .windows = windows,
                        .input = input,
                        .clipboard = clipboard,
                        .screen = screen,
                        .clock = clock,
                    },
                    log);

    StdioServer server([&core](const std::string& line) { return core.handle_line(line); },
                       STDIN_FILENO, STDOUT_FILENO, log);
    if (!server.init()) {
        log.error("Failed to initialize stdio server");
        return 1;
    }

    log.info("Ready for requests");
    bool clean = server.run();

    log.info(std::format("Stopped after processing {} requests", core.requests_handled()));
    return clean ? 0 : 1;
}
