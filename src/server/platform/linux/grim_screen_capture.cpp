#include "platform/linux/grim_screen_capture.hpp"

#include "platform/linux/subprocess.hpp"

#include <cstring>
#include <format>

namespace {

constexpr uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

uint32_t read_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

std::expected<CapturedImage, std::string> GrimScreenCapture::grab(const Rect& region) {
    if (!region.valid()) {
        return std::unexpected(std::format("invalid region {}x{}", region.width, region.height));
    }

    auto geometry = std::format("{},{} {}x{}", region.left, region.top, region.width, region.height);
    auto out = subprocess::check_output({"grim", "-g", geometry, "-t", "png", "-"});
    if (!out) return std::unexpected(out.error());

    CapturedImage image;
    image.png.assign(out->begin(), out->end());

    auto dims = png_dimensions(image.png);
    if (!dims) return std::unexpected("grim did not produce a PNG image");
    image.width = dims->first;
    image.height = dims->second;
    return image;
}

std::optional<std::pair<int, int>> GrimScreenCapture::png_dimensions(const std::vector<uint8_t>& data) {
    // signature (8) + chunk length (4) + "IHDR" (4) + width (4) + height (4)
    if (data.size() < 24) return std::nullopt;
    if (std::memcmp(data.data(), kPngSignature, sizeof(kPngSignature)) != 0) return std::nullopt;
    if (std::memcmp(data.data() + 12, "IHDR", 4) != 0) return std::nullopt;

    auto width = read_be32(data.data() + 16);
    auto height = read_be32(data.data() + 20);
    return std::pair{static_cast<int>(width), static_cast<int>(height)};
}
