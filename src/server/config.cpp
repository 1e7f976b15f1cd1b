#include "config.hpp"

#include "logger.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::chrono::milliseconds ms(const json& j) {
    return std::chrono::milliseconds(j.get<int64_t>());
}

template <typename T>
void keep_default_if(bool out_of_range, T& value, const T& fallback, const char* key,
                     const char* rule, const Logger& log) {
    if (!out_of_range) return;
    log.warn(std::format("config: {} {}, using default", key, rule));
    value = fallback;
}

// Out-of-range values fall back to their own default; the rest of the file
// still applies.
void check_ranges(Config& cfg, const Logger& log) {
    const Config def;
    constexpr std::chrono::milliseconds zero{0};

    keep_default_if(cfg.server.default_timeout < 1 || cfg.server.default_timeout > 300,
                    cfg.server.default_timeout, def.server.default_timeout,
                    "server.default_timeout", "must be within 1-300", log);
    keep_default_if(cfg.terminal.launch_poll < zero, cfg.terminal.launch_poll,
                    def.terminal.launch_poll, "terminal.launch_poll_ms", "must not be negative", log);
    for (auto& s : cfg.terminal.launch) {
        keep_default_if(s.window_timeout < zero, s.window_timeout, LaunchStrategy{}.window_timeout,
                        "terminal.launch[].window_timeout_ms", "must not be negative", log);
    }
    keep_default_if(cfg.retry.max_attempts < 1, cfg.retry.max_attempts, def.retry.max_attempts,
                    "retry.max_attempts", "must be at least 1", log);
    keep_default_if(cfg.retry.interval < zero, cfg.retry.interval, def.retry.interval,
                    "retry.interval_ms", "must not be negative", log);
    keep_default_if(cfg.retry.backoff < 0.0, cfg.retry.backoff, def.retry.backoff,
                    "retry.backoff", "must not be negative", log);
    keep_default_if(cfg.retry.max_interval < zero, cfg.retry.max_interval, def.retry.max_interval,
                    "retry.max_interval_ms", "must not be negative", log);
    keep_default_if(cfg.execution.single_settle < zero, cfg.execution.single_settle,
                    def.execution.single_settle, "execution.single_settle_ms", "must not be negative", log);
    keep_default_if(cfg.execution.multiline_settle < zero, cfg.execution.multiline_settle,
                    def.execution.multiline_settle, "execution.multiline_settle_ms",
                    "must not be negative", log);
    keep_default_if(cfg.capture.titlebar_height < 0, cfg.capture.titlebar_height,
                    def.capture.titlebar_height, "capture.titlebar_height", "must not be negative", log);
}

} // namespace

Config Config::load(const std::string& path, const Logger& log) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        log.warn("config: could not open " + path + ", using defaults");
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("default_timeout")) cfg.server.default_timeout = s["default_timeout"].get<int>();
        }

        if (j.contains("terminal")) {
            auto& t = j["terminal"];
            if (t.contains("process_names"))
                cfg.terminal.process_names = t["process_names"].get<std::vector<std::string>>();
            if (t.contains("window_titles"))
                cfg.terminal.window_titles = t["window_titles"].get<std::vector<std::string>>();
            if (t.contains("launch_poll_ms")) cfg.terminal.launch_poll = ms(t["launch_poll_ms"]);
            if (t.contains("launch")) {
                std::vector<LaunchStrategy> launch;
                for (auto& entry : t["launch"]) {
                    LaunchStrategy s;
                    s.command = entry.at("command").get<std::vector<std::string>>();
                    s.name = entry.value("name", s.command.empty() ? std::string() : s.command.front());
                    if (entry.contains("window_timeout_ms")) s.window_timeout = ms(entry["window_timeout_ms"]);
                    if (!s.command.empty()) launch.push_back(std::move(s));
                }
                cfg.terminal.launch = std::move(launch);
            }
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            if (r.contains("max_attempts")) cfg.retry.max_attempts = r["max_attempts"].get<int>();
            if (r.contains("interval_ms")) cfg.retry.interval = ms(r["interval_ms"]);
            if (r.contains("backoff")) cfg.retry.backoff = r["backoff"].get<double>();
            if (r.contains("max_interval_ms")) cfg.retry.max_interval = ms(r["max_interval_ms"]);
        }

        if (j.contains("execution")) {
            auto& e = j["execution"];
            if (e.contains("single_settle_ms")) cfg.execution.single_settle = ms(e["single_settle_ms"]);
            if (e.contains("multiline_settle_ms")) cfg.execution.multiline_settle = ms(e["multiline_settle_ms"]);
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("titlebar_height")) cfg.capture.titlebar_height = c["titlebar_height"].get<int>();
            if (c.contains("directory")) cfg.capture.directory = c["directory"].get<std::string>();
        }

    } catch (const json::exception& e) {
        log.warn(std::string("config: parse error: ") + e.what());
        return Config{};
    }

    check_ranges(cfg, log);
    return cfg;
}

Config Config::load_default(const Logger& log) {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string(), log);
    }
    return Config{};
}
