#pragma once

#include "config.hpp"
#include "platform/clipboard.hpp"
#include "platform/clock.hpp"
#include "platform/input_injector.hpp"
#include "platform/process_inspector.hpp"
#include "platform/screen_capture.hpp"
#include "platform/window_manager.hpp"
#include "protocol/dispatcher.hpp"
#include "terminal/script_executor.hpp"
#include "terminal/session.hpp"
#include "tools/capture_tool.hpp"
#include "tools/clipboard_tool.hpp"
#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

class Logger;

// Platform-independent server: wires the tool catalog to its handlers over
// injected desktop collaborators.
class ServerCore {
public:
    struct Platform {
        ProcessInspector& processes;
        WindowManager& windows;
        InputInjector& input;
        Clipboard& clipboard;
        ScreenCapture& screen;
        Clock& clock;
    };

    ServerCore(Config config, Platform platform, const Logger& log);

    ServerCore(const ServerCore&) = delete;
    ServerCore& operator=(const ServerCore&) = delete;

    std::optional<std::string> handle_line(const std::string& line) { return dispatcher_.handle_line(line); }
    nlohmann::json handle(const nlohmann::json& request) { return dispatcher_.handle(request); }

    uint64_t requests_handled() const { return dispatcher_.requests_handled(); }

private:
    ToolOutcome call_execute_script(const nlohmann::json& args);
    ToolOutcome call_get_clipboard(const nlohmann::json& args);
    ToolOutcome call_capture(const nlohmann::json& args);

    Config config_;
    const Logger& log_;

    ToolRegistry registry_;
    SessionStateMachine session_;
    ScriptExecutionOrchestrator executor_;
    ClipboardTool clipboard_tool_;
    CaptureTool capture_tool_;
    ProtocolDispatcher dispatcher_;
};
