#ifndef NATIVEENCODER_H
#define NATIVEENCODER_H

#include "formatregistry.h"
#include <opencv2/core.hpp>
#include <vector>

/**
 * Encoder for the formats OpenCV's imgcodecs handles directly
 */
class NativeEncoder {
public:
    virtual ~NativeEncoder() = default;

    /**
     * Encode a BGRA image
     * @param bgra 8-bit BGRA image
     * @param format JPEG, PNG or WebP
     * @param quality Normalized quality in [0, 1]; ignored by lossless formats
     * @return Encoded bytes, empty if the encoder produced nothing
     * @throws std::exception if the encoder rejects the input
     */
    virtual std::vector<uchar> encode(const cv::Mat& bgra, ImageFormat format, double quality) = 0;
};

/**
 * NativeEncoder built on cv::imencode
 */
class OpenCVNativeEncoder : public NativeEncoder {
public:
    std::vector<uchar> encode(const cv::Mat& bgra, ImageFormat format, double quality) override;

    /**
     * Build the imencode parameter list for a format
     * @param format Target format
     * @param quality Normalized quality in [0, 1]
     */
    static std::vector<int> encodeParams(ImageFormat format, double quality);
};

#endif // NATIVEENCODER_H
