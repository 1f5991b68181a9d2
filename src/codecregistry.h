#ifndef CODECREGISTRY_H
#define CODECREGISTRY_H

#include "formatregistry.h"
#include <opencv2/core.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised when an extension codec cannot be created or initialized
 */
class CodecUnavailableError : public std::runtime_error
{
public:
    explicit CodecUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Format-specific tuning derived from a normalized quality value
 */
struct CodecOptions {
    // AVIF
    int cqLevel = 0;        // Constant quantizer, 0 (best) .. 63 (worst)
    int cqAlphaLevel = 0;
    int subsample = 1;      // 0 = 4:0:0, 1 = 4:2:0, 2 = 4:2:2, 3 = 4:4:4

    // JPEG XL
    int quality = 0;        // 0 .. 100

    // Shared
    int effort = 1;         // Low effort keeps each search pass cheap
};

/**
 * Translate a normalized quality in [0, 1] into codec options
 * @param format Extension codec format (AVIF or JXL)
 * @param quality Normalized quality, clamped to [MIN_QUALITY, 1]
 */
CodecOptions buildCodecOptions(ImageFormat format, double quality);

/**
 * Opaque encoder for one extension format
 */
class Codec {
public:
    virtual ~Codec() = default;

    /**
     * One-time setup, called by the registry before the first encode
     * @throws std::exception on failure
     */
    virtual void initialize() {}

    /**
     * Encode pixels
     * @param rgba 8-bit, 4-channel image in RGBA order
     * @param options Tuning parameters
     * @return Encoded bytes (empty means the codec produced nothing)
     */
    virtual std::vector<uchar> encode(const cv::Mat& rgba, const CodecOptions& options) = 0;
};

using CodecFactory = std::function<std::unique_ptr<Codec>()>;

/**
 * Lazily creates and memoizes extension codecs, one instance per format.
 *
 * A codec is created and initialized on the first get() for its format. The
 * outcome is cached, including failures, so a codec that failed to load is
 * not retried for the lifetime of the registry.
 */
class CodecRegistry
{
public:
    CodecRegistry() = default;

    /**
     * Create a registry with the libavif and libjxl codecs registered
     */
    static std::unique_ptr<CodecRegistry> createDefault();

    /**
     * Register (or replace) the factory for a format. Clears any cached state.
     */
    void registerFactory(ImageFormat format, CodecFactory factory);

    /**
     * Check if a factory exists for a format
     */
    bool hasFactory(ImageFormat format) const;

    /**
     * Get the codec for a format, loading it on first use
     * @return Codec owned by the registry
     * @throws CodecUnavailableError if no factory exists or loading failed
     */
    Codec& get(ImageFormat format);

    /**
     * Load every registered codec
     * @return Number of codecs that are ready
     */
    int preload();

    /**
     * Check if a codec has already been loaded successfully
     */
    bool isLoaded(ImageFormat format) const;

private:
    struct Entry {
        CodecFactory factory;
        std::unique_ptr<Codec> codec;
        bool attempted = false;
        std::string error;
    };

    mutable std::mutex m_mutex;
    std::map<ImageFormat, Entry> m_entries;
};

#endif // CODECREGISTRY_H
