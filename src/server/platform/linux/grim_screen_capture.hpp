#pragma once

#include "platform/screen_capture.hpp"

#include <optional>
#include <utility>

// Grabs a screen region as PNG with grim.
class GrimScreenCapture : public ScreenCapture {
public:
    std::expected<CapturedImage, std::string> grab(const Rect& region) override;

    // Width and height from the IHDR chunk, nullopt if `data` is not a PNG.
    static std::optional<std::pair<int, int>> png_dimensions(const std::vector<uint8_t>& data);
};
