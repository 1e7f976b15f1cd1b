#pragma once

#include "terminal/window_info.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct CapturedImage {
    std::vector<uint8_t> png;
    int width = 0;
    int height = 0;
};

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;
    virtual std::expected<CapturedImage, std::string> grab(const Rect& region) = 0;
};
