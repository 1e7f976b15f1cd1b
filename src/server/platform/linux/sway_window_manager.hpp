#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class Logger;

// Window queries and focus over the Sway (i3-ipc) socket. Every call reads a
// fresh GET_TREE; nothing about windows is cached.
class SwayWindowManager : public WindowManager {
public:
    explicit SwayWindowManager(const Logger& log, std::string socket_path = {});
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    bool connect();

    std::optional<WindowDescriptor> find(const std::vector<std::string>& titles) override;
    void restore_if_minimized(const WindowDescriptor& window) override;
    bool activate(const WindowDescriptor& window) override;
    std::optional<WindowDescriptor> active_window() override;

    // Tree helpers, independent of the socket.
    static std::vector<WindowDescriptor> collect_windows(const nlohmann::json& tree);
    static std::optional<WindowDescriptor> match_title(const std::vector<WindowDescriptor>& windows,
                                                       const std::vector<std::string>& titles);
    static std::optional<WindowDescriptor> find_focused(const nlohmann::json& tree);
    static bool command_succeeded(const nlohmann::json& reply);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    std::optional<nlohmann::json> request(uint32_t type, const std::string& payload = "");
    std::optional<nlohmann::json> get_tree() { return request(MSG_GET_TREE); }
    bool run_command(const std::string& command);

    bool send_message(int fd, uint32_t type, const std::string& payload);
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    int connect_socket(const std::string& path);
    void disconnect();

    const Logger& log_;
    std::string sway_sock_;
    int query_fd_ = -1;
};
