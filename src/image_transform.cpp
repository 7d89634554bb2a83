#include "llmchat/common/logging.h"
#include "llmchat/image.h"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace llmchat::image_utils {

namespace {

void validate(const Image& image) {
    if (image.width <= 0 || image.height <= 0) {
        throw std::invalid_argument("Image has an empty size (" + std::to_string(image.width) +
                                    "x" + std::to_string(image.height) + ")");
    }
    if (image.channels != 1 && image.channels != 3 && image.channels != 4) {
        throw std::invalid_argument("Unsupported image channel count: " +
                                    std::to_string(image.channels));
    }
    if (image.pixels.size() != image.expectedSize()) {
        throw std::invalid_argument("Image buffer holds " + std::to_string(image.pixels.size()) +
                                    " bytes, expected " + std::to_string(image.expectedSize()));
    }
}

cv::Mat toRgb(const cv::Mat& src) {
    cv::Mat rgb;
    switch (src.channels()) {
        case 1:
            cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB);
            break;
        case 4:
            cv::cvtColor(src, rgb, cv::COLOR_RGBA2RGB);
            break;
        default:
            rgb = src.clone();
            break;
    }
    return rgb;
}

// Shrink so that the longest edge fits in maxEdge. Never upscales.
void fitWithin(cv::Mat& image, const int maxEdge) {
    const int longEdge = std::max(image.rows, image.cols);
    if (longEdge <= maxEdge) {
        return;
    }
    const double scale = static_cast<double>(maxEdge) / longEdge;
    const int newCols = std::max(1, static_cast<int>(std::lround(image.cols * scale)));
    const int newRows = std::max(1, static_cast<int>(std::lround(image.rows * scale)));
    cv::resize(image, image, cv::Size(newCols, newRows), 0, 0, cv::INTER_AREA);
}

} // namespace

Image prepareVisionInput(const Image& image, const int maxEdge) {
    if (maxEdge <= 0) {
        throw std::invalid_argument("maxEdge must be positive");
    }
    validate(image);

    // Wraps the caller's buffer without copying. toRgb() always produces a new matrix.
    const cv::Mat src(image.height, image.width, CV_8UC(image.channels),
                      const_cast<uint8_t*>(image.pixels.data()));
    cv::Mat rgb = toRgb(src);
    fitWithin(rgb, maxEdge);
    if (!rgb.isContinuous()) {
        rgb = rgb.clone();
    }

    Image result;
    result.width = rgb.cols;
    result.height = rgb.rows;
    result.channels = 3;
    result.pixels.assign(rgb.data, rgb.data + rgb.total() * rgb.elemSize());

    LOG(DEBUG) << "Prepared vision input " << image.width << "x" << image.height << "x"
               << image.channels << " -> " << result.width << "x" << result.height << "x3";
    return result;
}

} // namespace llmchat::image_utils
