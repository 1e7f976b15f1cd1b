#pragma once

#include "terminal/window_info.hpp"

#include <optional>
#include <string>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;

    // First window whose title contains one of `titles`, tried in order.
    virtual std::optional<WindowDescriptor> find(const std::vector<std::string>& titles) = 0;
    virtual void restore_if_minimized(const WindowDescriptor& window) = 0;
    // Returns false if the compositor rejected the request.
    virtual bool activate(const WindowDescriptor& window) = 0;
    virtual std::optional<WindowDescriptor> active_window() = 0;
};
