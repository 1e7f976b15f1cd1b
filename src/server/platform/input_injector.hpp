#pragma once

#include <expected>
#include <string>

class InputInjector {
public:
    virtual ~InputInjector() = default;
    // Paste `text` into the focused window, pressing Enter afterwards if `submit`.
    virtual std::expected<void, std::string> paste(const std::string& text, bool submit) = 0;
};
