#ifndef ENCODINGENGINE_H
#define ENCODINGENGINE_H

#include "codecregistry.h"
#include "formatcapabilityresolver.h"
#include "nativeencoder.h"
#include <opencv2/core.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised when every format in the fallback chain failed to encode
 */
class EncodingError : public std::runtime_error
{
public:
    explicit EncodingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Outcome of one successful encode
 */
struct EncodeAttemptResult {
    std::vector<uchar> bytes;
    size_t byteLength = 0;
    ImageFormat formatUsed = ImageFormat::Jpeg;
    bool isDisplayableNatively = true;
    int width = 0;                      // Dimensions actually encoded
    int height = 0;
};

/**
 * Resizes a decoded image and encodes it, walking the fallback chain of the
 * requested format until one encoder succeeds.
 *
 * Native formats go through NativeEncoder; AVIF and JPEG XL go through the
 * CodecRegistry, which loads each codec on first use.
 */
class EncodingEngine
{
public:
    /**
     * @param support Format support snapshot used to build fallback chains
     * @param nativeEncoder Encoder for JPEG, PNG and WebP
     * @param codecs Extension codec registry (owned by the caller, must outlive the engine)
     */
    EncodingEngine(FormatSupport support,
                   std::shared_ptr<NativeEncoder> nativeEncoder,
                   CodecRegistry& codecs);

    /**
     * Resize and encode
     * @param source 8-bit BGRA image
     * @param maxWidth Bounding width (UNBOUNDED_DIMENSION for none)
     * @param maxHeight Bounding height (UNBOUNDED_DIMENSION for none)
     * @param format Requested format
     * @param quality Normalized quality in [0, 1]
     * @return First successful result in fallback order
     * @throws EncodingError if every format in the chain failed
     */
    EncodeAttemptResult encode(const cv::Mat& source, int maxWidth, int maxHeight,
                               ImageFormat format, double quality);

    /**
     * Encode an already sized image (no resize step)
     */
    EncodeAttemptResult encodeSized(const cv::Mat& image, ImageFormat format, double quality);

    /**
     * Produce a small natively displayable preview (WebP, quality 0.5,
     * longest side at most 800 px), used when the main result is not
     * natively displayable
     * @throws EncodingError if no native format could encode the preview
     */
    std::vector<uchar> generatePreview(const cv::Mat& image);

    const FormatSupport& formatSupport() const { return m_support; }

    static const int PREVIEW_MAX_DIMENSION = 800;
    static constexpr double PREVIEW_QUALITY = 0.5;

private:
    std::vector<uchar> encodeWithFormat(const cv::Mat& image, ImageFormat format, double quality);

    FormatSupport m_support;
    std::shared_ptr<NativeEncoder> m_nativeEncoder;
    CodecRegistry& m_codecs;
};

#endif // ENCODINGENGINE_H
