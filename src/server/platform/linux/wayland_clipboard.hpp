#pragma once

#include "platform/clipboard.hpp"

// System clipboard through wl-copy / wl-paste.
class WaylandClipboard : public Clipboard {
public:
    std::expected<std::string, std::string> read() override;
    std::expected<void, std::string> write(const std::string& text) override;
};
