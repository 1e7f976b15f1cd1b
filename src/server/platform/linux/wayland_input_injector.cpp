#include "platform/linux/wayland_input_injector.hpp"

#include "platform/linux/subprocess.hpp"

#include <thread>
#include <vector>

using namespace std::chrono_literals;

WaylandInputInjector::WaylandInputInjector(Clipboard& clipboard)
    : clipboard_(clipboard) {}

std::expected<void, std::string> WaylandInputInjector::paste(const std::string& text, bool submit) {
    // Ctrl+C abandons whatever is half-typed at the prompt
    if (auto res = wtype({"-M", "ctrl", "-k", "c"}, "clear"); !res) return res;
    std::this_thread::sleep_for(200ms);

    if (auto res = clipboard_.write(text); !res) return res;
    // Give wl-copy time to take ownership of the selection
    std::this_thread::sleep_for(100ms);

    if (auto res = wtype({"-M", "ctrl", "-M", "shift", "-k", "v"}, "paste"); !res) return res;

    if (submit) {
        if (auto res = wtype({"-k", "Return"}, "submit"); !res) return res;
    }
    return {};
}

std::expected<void, std::string> WaylandInputInjector::wtype(const std::vector<std::string>& args,
                                                             const char* what) {
    std::vector<std::string> argv = {"wtype"};
    argv.insert(argv.end(), args.begin(), args.end());

    auto res = subprocess::check_output(argv);
    if (!res) return std::unexpected(std::string("wtype ") + what + " failed: " + res.error());
    return {};
}
