#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace llmchat {

// 8-bit interleaved image, as handed over by the UI layer (typically RGBA from a bitmap).
struct Image {
    int32_t width = 0;
    int32_t height = 0;
    int32_t channels = 4;
    std::vector<uint8_t> pixels;

    size_t expectedSize() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) *
               static_cast<size_t>(channels);
    }
};

namespace image_utils {

// Longest edge accepted by the vision encoder before downscaling kicks in.
constexpr int kDefaultMaxEdge = 1024;

// Converts to 3-channel RGB and shrinks the image so that its longest edge is at most maxEdge,
// keeping the aspect ratio. Throws std::invalid_argument on a malformed image.
Image prepareVisionInput(const Image& image, const int maxEdge = kDefaultMaxEdge);

} // namespace image_utils

} // namespace llmchat
