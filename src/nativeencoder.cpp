#include "nativeencoder.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::vector<int> OpenCVNativeEncoder::encodeParams(ImageFormat format, double quality)
{
    const int percent = static_cast<int>(std::lround(std::max(0.0, std::min(1.0, quality)) * 100.0));

    switch (format) {
        case ImageFormat::Jpeg:
            return { cv::IMWRITE_JPEG_QUALITY, std::max(1, percent), cv::IMWRITE_JPEG_OPTIMIZE, 1 };
        case ImageFormat::Webp:
            return { cv::IMWRITE_WEBP_QUALITY, std::max(1, percent) };
        case ImageFormat::Png:
            return { cv::IMWRITE_PNG_COMPRESSION, 9 };
        default:
            return {};
    }
}

std::vector<uchar> OpenCVNativeEncoder::encode(const cv::Mat& bgra, ImageFormat format, double quality)
{
    const FormatDefinition& def = FormatRegistry::definition(format);
    if (!def.nativeEncodable) {
        throw std::invalid_argument(std::string(def.name) + " is not natively encodable");
    }

    cv::Mat input = bgra;
    if (!def.supportsAlpha && bgra.channels() == 4) {
        cv::cvtColor(bgra, input, cv::COLOR_BGRA2BGR);
    }

    std::vector<uchar> buffer;
    const std::string extension = std::string(".") + def.extension;
    if (!cv::imencode(extension, input, buffer, encodeParams(format, quality))) {
        buffer.clear();
    }
    return buffer;
}
