#pragma once

#include "platform/clipboard.hpp"
#include "platform/input_injector.hpp"

#include <string>
#include <vector>

// Pastes through the clipboard with wtype key chords. Typing text key by key
// mangles line endings and races the shell, so it is never used.
class WaylandInputInjector : public InputInjector {
public:
    explicit WaylandInputInjector(Clipboard& clipboard);

    std::expected<void, std::string> paste(const std::string& text, bool submit) override;

private:
    static std::expected<void, std::string> wtype(const std::vector<std::string>& args,
                                                  const char* what);

    Clipboard& clipboard_;
};
