#include "platform/linux/sway_window_manager.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

namespace {

constexpr char kScratchpadWorkspace[] = "__i3_scratch";

bool is_view(const json& node) {
    auto type = node.value("type", "");
    if (type != "con" && type != "floating_con") return false;
    if (!node.contains("name") || !node["name"].is_string()) return false;
    bool leaf = (!node.contains("nodes") || node["nodes"].empty()) &&
                (!node.contains("floating_nodes") || node["floating_nodes"].empty());
    return leaf;
}

WindowDescriptor to_descriptor(const json& node, bool minimized) {
    WindowDescriptor w;
    w.id = node.value("id", int64_t{0});
    w.title = node["name"].get<std::string>();
    w.minimized = minimized;
    if (node.contains("rect")) {
        auto& r = node["rect"];
        w.rect.left = r.value("x", 0);
        w.rect.top = r.value("y", 0);
        w.rect.width = std::max(0, r.value("width", 0));
        w.rect.height = std::max(0, r.value("height", 0));
    }
    return w;
}

void walk(const json& node, bool in_scratchpad, std::vector<WindowDescriptor>& out) {
    if (node.value("type", "") == "workspace" && node.value("name", "") == kScratchpadWorkspace) {
        in_scratchpad = true;
    }

    if (is_view(node)) {
        out.push_back(to_descriptor(node, in_scratchpad));
        return;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (auto& child : node[key]) walk(child, in_scratchpad, out);
    }
}

} // namespace

SwayWindowManager::SwayWindowManager(const Logger& log, std::string socket_path)
    : log_(log), sway_sock_(std::move(socket_path)) {}

SwayWindowManager::~SwayWindowManager() {
    disconnect();
}

bool SwayWindowManager::connect() {
    if (query_fd_ >= 0) return true;

    if (sway_sock_.empty()) {
        const char* sock = std::getenv("SWAYSOCK");
        if (!sock) sock = std::getenv("I3SOCK");
        if (!sock) {
            log_.warn("sway: $SWAYSOCK not set");
            return false;
        }
        sway_sock_ = sock;
    }

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

std::optional<WindowDescriptor> SwayWindowManager::find(const std::vector<std::string>& titles) {
    auto tree = get_tree();
    if (!tree) return std::nullopt;

    auto window = match_title(collect_windows(*tree), titles);
    if (!window) log_.warn("No terminal windows found");
    return window;
}

void SwayWindowManager::restore_if_minimized(const WindowDescriptor& window) {
    if (!window.minimized) return;
    log_.debug("Restoring window from scratchpad: " + window.title);
    if (!run_command(std::format("[con_id={}] scratchpad show", window.id))) {
        log_.warn("sway: could not restore window " + window.title);
    }
}

bool SwayWindowManager::activate(const WindowDescriptor& window) {
    return run_command(std::format("[con_id={}] focus", window.id));
}

std::optional<WindowDescriptor> SwayWindowManager::active_window() {
    auto tree = get_tree();
    if (!tree) return std::nullopt;
    return find_focused(*tree);
}

std::vector<WindowDescriptor> SwayWindowManager::collect_windows(const json& tree) {
    std::vector<WindowDescriptor> windows;
    walk(tree, false, windows);
    return windows;
}

std::optional<WindowDescriptor> SwayWindowManager::match_title(const std::vector<WindowDescriptor>& windows,
                                                               const std::vector<std::string>& titles) {
    for (const auto& title : titles) {
        for (const auto& w : windows) {
            if (w.title.find(title) != std::string::npos) return w;
        }
    }
    return std::nullopt;
}

std::optional<WindowDescriptor> SwayWindowManager::find_focused(const json& tree) {
    if (is_view(tree) && tree.value("focused", false)) {
        return to_descriptor(tree, false);
    }
    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!tree.contains(key)) continue;
        for (auto& child : tree[key]) {
            if (auto w = find_focused(child)) return w;
        }
    }
    return std::nullopt;
}

bool SwayWindowManager::command_succeeded(const json& reply) {
    if (!reply.is_array() || reply.empty()) return false;
    for (auto& r : reply) {
        if (!r.value("success", false)) return false;
    }
    return true;
}

std::optional<json> SwayWindowManager::request(uint32_t type, const std::string& payload) {
    // One reconnect: sway may have restarted since the last call
    for (int tries = 0; tries < 2; ++tries) {
        if (!connect()) return std::nullopt;

        uint32_t reply_type;
        std::string reply;
        if (send_message(query_fd_, type, payload) && recv_message(query_fd_, reply_type, reply)) {
            try {
                return json::parse(reply);
            } catch (const json::exception& e) {
                log_.warn(std::string("sway: bad reply: ") + e.what());
                return std::nullopt;
            }
        }
        disconnect();
    }
    log_.warn("sway: IPC request failed");
    return std::nullopt;
}

bool SwayWindowManager::run_command(const std::string& command) {
    auto reply = request(MSG_RUN_COMMAND, command);
    if (!reply) return false;
    if (!command_succeeded(*reply)) {
        log_.debug(std::format("sway: '{}' -> {}", command, reply->dump()));
        return false;
    }
    return true;
}

int SwayWindowManager::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_.warn(std::string("sway: connect failed: ") + std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void SwayWindowManager::disconnect() {
    if (query_fd_ >= 0) {
        ::close(query_fd_);
        query_fd_ = -1;
    }
}

bool SwayWindowManager::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayWindowManager::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
