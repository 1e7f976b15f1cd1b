#pragma once

#include <cstdint>
#include <string>

// Screen rectangle in compositor coordinates.
struct Rect {
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;

    bool valid() const { return width > 0 && height > 0; }
};

// A terminal window as seen at one point in time. Re-query instead of
// holding on to it: the window may move, resize or close.
struct WindowDescriptor {
    int64_t id = 0;            // compositor container id
    std::string title;
    Rect rect;
    bool minimized = false;    // hidden in the scratchpad
};
