#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include "codecregistry.h"
#include "formatcapabilityresolver.h"
#include "nativeencoder.h"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

namespace testsupport {

/**
 * Deterministic size model: lossy formats produce
 * width * height * (0.02 + 0.5 * q^2) bytes, lossless ones 3 bytes per pixel
 */
inline size_t modelSize(int width, int height, double quality, bool lossless)
{
    const double pixels = static_cast<double>(width) * height;
    if (lossless) {
        return static_cast<size_t>(pixels * 3.0);
    }
    return static_cast<size_t>(pixels * (0.02 + 0.5 * quality * quality));
}

struct EncodeCall {
    ImageFormat format;
    int width;
    int height;
    double quality;
};

/**
 * NativeEncoder stand-in following modelSize, with per-format failure and
 * allocation-failure injection
 */
class FakeNativeEncoder : public NativeEncoder {
public:
    std::vector<uchar> encode(const cv::Mat& bgra, ImageFormat format, double quality) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back({ format, bgra.cols, bgra.rows, quality });
        if (failing.count(format)) {
            throw std::runtime_error("injected native failure");
        }
        if (outOfMemory.count(format)) {
            throw cv::Exception(cv::Error::StsNoMem, "injected allocation failure", "encode", __FILE__, __LINE__);
        }
        if (empty.count(format)) {
            return {};
        }
        const bool lossless = !FormatRegistry::supportsQuality(format);
        return std::vector<uchar>(std::max<size_t>(1, modelSize(bgra.cols, bgra.rows, quality, lossless)), 0x5A);
    }

    std::mutex mutex;
    std::vector<EncodeCall> calls;
    std::set<ImageFormat> failing;
    std::set<ImageFormat> empty;
    std::set<ImageFormat> outOfMemory;
};

/**
 * Extension codec stand-in following modelSize
 */
class FakeCodec : public Codec {
public:
    FakeCodec(bool fail, std::atomic<int>* encodeCount, std::atomic<int>* initCount)
        : m_fail(fail), m_encodeCount(encodeCount), m_initCount(initCount) {}

    void initialize() override
    {
        if (m_initCount) {
            (*m_initCount)++;
        }
    }

    std::vector<uchar> encode(const cv::Mat& rgba, const CodecOptions& options) override
    {
        if (m_encodeCount) {
            (*m_encodeCount)++;
        }
        if (m_fail) {
            throw std::runtime_error("injected codec failure");
        }
        const double quality = options.quality > 0 ? options.quality / 100.0
                                                   : 1.0 - (options.cqLevel - 5) / 45.0;
        return std::vector<uchar>(std::max<size_t>(1, modelSize(rgba.cols, rgba.rows, quality, false)), 0xA5);
    }

private:
    bool m_fail;
    std::atomic<int>* m_encodeCount;
    std::atomic<int>* m_initCount;
};

/**
 * Codec whose initialization always fails
 */
class BrokenCodec : public Codec {
public:
    void initialize() override { throw std::runtime_error("module failed to load"); }
    std::vector<uchar> encode(const cv::Mat&, const CodecOptions&) override { return {}; }
};

/**
 * Support snapshot where exactly the listed formats are supported
 */
inline FormatSupport makeSupport(std::initializer_list<ImageFormat> supported)
{
    std::map<ImageFormat, FormatCapability> caps;
    for (ImageFormat format : FormatRegistry::allFormats()) {
        FormatCapability cap;
        cap.format = format;
        cap.isLossless = FormatRegistry::definition(format).lossless;
        cap.nativeEncodeSupported = !FormatRegistry::isExtensionCodec(format);
        cap.isNativelyDisplayable = !FormatRegistry::isExtensionCodec(format);
        cap.supported = false;
        caps[format] = cap;
    }
    for (ImageFormat format : supported) {
        caps[format].supported = true;
        caps[format].extensionCodecAvailable = FormatRegistry::isExtensionCodec(format);
    }
    return FormatSupport(caps);
}

/**
 * Solid BGRA image
 */
inline cv::Mat makeImage(int width, int height, uchar alpha = 255)
{
    return cv::Mat(height, width, CV_8UC4, cv::Scalar(40, 120, 200, alpha));
}

/**
 * Encode a small image to real PNG bytes
 */
inline std::vector<uchar> encodePng(const cv::Mat& image)
{
    std::vector<uchar> bytes;
    cv::imencode(".png", image, bytes);
    return bytes;
}

} // namespace testsupport

#endif // TESTSUPPORT_H
