#include <catch2/catch_test_macros.hpp>

#include "platform/linux/grim_screen_capture.hpp"

namespace {

std::vector<uint8_t> png_header(uint32_t width, uint32_t height) {
    std::vector<uint8_t> data = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n',
                                 0, 0, 0, 13, 'I', 'H', 'D', 'R'};
    for (uint32_t v : {width, height}) {
        data.push_back(static_cast<uint8_t>(v >> 24));
        data.push_back(static_cast<uint8_t>(v >> 16));
        data.push_back(static_cast<uint8_t>(v >> 8));
        data.push_back(static_cast<uint8_t>(v));
    }
    return data;
}

} // namespace

TEST_CASE("PNG dimensions", "[capture]") {

    SECTION("ReadsIhdr") {
        auto dims = GrimScreenCapture::png_dimensions(png_header(1920, 1045));
        REQUIRE(dims);
        REQUIRE(dims->first == 1920);
        REQUIRE(dims->second == 1045);
    }

    SECTION("RejectsTruncated") {
        auto data = png_header(10, 10);
        data.resize(20);
        REQUIRE_FALSE(GrimScreenCapture::png_dimensions(data));
    }

    SECTION("RejectsOtherFormats") {
        auto data = png_header(10, 10);
        data[1] = 'J';
        REQUIRE_FALSE(GrimScreenCapture::png_dimensions(data));
        REQUIRE_FALSE(GrimScreenCapture::png_dimensions({}));
    }

    SECTION("InvalidRegionNeverRunsGrim") {
        GrimScreenCapture capture;
        auto image = capture.grab(Rect{0, 0, 100, 0});
        REQUIRE_FALSE(image);
    }
}
