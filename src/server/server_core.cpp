#include "server_core.hpp"

#include "logger.hpp"
#include "platform/platform_paths.hpp"

namespace {

SessionSettings session_settings(const Config& config) {
    return {
        .window_titles = config.terminal.window_titles,
        .launch = config.terminal.launch,
        .launch_poll = config.terminal.launch_poll,
        .retry = config.retry,
    };
}

CaptureSettings capture_settings(const Config& config) {
    return {
        .window_titles = config.terminal.window_titles,
        .titlebar_height = config.capture.titlebar_height,
        .directory = config.capture.directory.empty() ? platform::capture_dir()
                                                      : config.capture.directory,
    };
}

} // namespace

ServerCore::ServerCore(Config config, Platform platform, const Logger& log)
    : config_(std::move(config)), log_(log),
      registry_(config_.server.default_timeout),
      session_(session_settings(config_), platform.processes, platform.windows, platform.clock, log_),
      executor_(session_, platform.input, platform.clock,
                SettleDelays{config_.execution.single_settle, config_.execution.multiline_settle}, log_),
      clipboard_tool_(platform.clipboard, log_),
      capture_tool_(capture_settings(config_), platform.windows, platform.screen, log_),
      dispatcher_(registry_, log_) {
    dispatcher_.register_handler(kExecuteScriptTool,
                                 [this](const nlohmann::json& a) { return call_execute_script(a); });
    dispatcher_.register_handler(kGetClipboardTool,
                                 [this](const nlohmann::json& a) { return call_get_clipboard(a); });
    dispatcher_.register_handler(kCaptureTool,
                                 [this](const nlohmann::json& a) { return call_capture(a); });
}

ToolOutcome ServerCore::call_execute_script(const nlohmann::json& args) {
    auto script = args.value("script", std::string());
    auto timeout = args.value("timeout", config_.server.default_timeout);
    return executor_.execute(script, timeout);
}

ToolOutcome ServerCore::call_get_clipboard(const nlohmann::json& /*args*/) {
    return clipboard_tool_.get();
}

ToolOutcome ServerCore::call_capture(const nlohmann::json& args) {
    std::optional<std::string> save_path;
    if (auto it = args.find("save_path"); it != args.end() && it->is_string()) {
        save_path = it->get<std::string>();
    }
    bool exclude_titlebar = args.value("exclude_titlebar", true);
    return capture_tool_.capture(save_path, exclude_titlebar);
}
