#ifndef FORMATCAPABILITYRESOLVER_H
#define FORMATCAPABILITYRESOLVER_H

#include "formatregistry.h"
#include <opencv2/core.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

/**
 * Detected usability of one output format
 */
struct FormatCapability {
    ImageFormat format = ImageFormat::Jpeg;
    bool nativeEncodeSupported = false;
    bool extensionCodecAvailable = false;  // A loadable codec is registered
    bool requiresSharedMemory = false;
    bool isLossless = false;
    bool isNativelyDisplayable = false;
    bool supported = false;                // Final verdict used for fallback chains
};

/**
 * Snapshot of format support, safe to copy into each execution unit
 */
class FormatSupport
{
public:
    FormatSupport();
    explicit FormatSupport(std::map<ImageFormat, FormatCapability> capabilities);

    const FormatCapability& capability(ImageFormat format) const;
    bool isSupported(ImageFormat format) const;

    /**
     * First supported format in priority order (WebP, JPEG, PNG, AVIF, JXL)
     * @return The first supported format, JPEG if none
     */
    ImageFormat firstSupportedFormat() const;

    /**
     * Return the format itself when supported, otherwise the first supported one
     */
    ImageFormat ensureSupported(ImageFormat format) const;

    /**
     * Ordered list of formats to try when encoding to the requested format.
     *
     * Extension-codec requests fall back to [webp, jpeg, png]; native requests
     * try the remaining native formats and never pull in an extension codec.
     * The list is de-duplicated, starts with the requested format, only holds
     * supported formats and always contains JPEG.
     */
    std::vector<ImageFormat> fallbackOrder(ImageFormat requested) const;

    /**
     * Unfiltered fallback chain for a requested format
     */
    static std::vector<ImageFormat> candidateOrder(ImageFormat requested);

private:
    std::map<ImageFormat, FormatCapability> m_capabilities;
};

/**
 * Source of the raw runtime facts the resolver combines
 */
class RuntimeProbe {
public:
    virtual ~RuntimeProbe() = default;

    /**
     * Attempt a trivial encode of a 1x1 surface
     */
    virtual bool canEncodeNatively(ImageFormat format) = 0;

    /**
     * Check if threaded codecs can share memory between their threads
     */
    virtual bool hasSharedMemory() = 0;

    /**
     * Decode a known-good sample with the native decoder. May be slow or hang.
     */
    virtual bool canDecodeNatively(ImageFormat format, const std::vector<uchar>& sample) = 0;
};

/**
 * RuntimeProbe backed by OpenCV imgcodecs and the libjxl thread runner
 */
class DefaultRuntimeProbe : public RuntimeProbe {
public:
    bool canEncodeNatively(ImageFormat format) override;
    bool hasSharedMemory() override;
    bool canDecodeNatively(ImageFormat format, const std::vector<uchar>& sample) override;
};

/**
 * Determines which output formats are usable on this machine.
 *
 * Resolution never throws: anything that cannot be established degrades to
 * "unsupported", and JPEG and PNG are always available as a baseline.
 */
class FormatCapabilityResolver
{
public:
    /**
     * @param probe Runtime facts source (shared with the bounded decode probe thread)
     * @param extensionCodecFormats Formats backed by a registered extension codec
     * @param decodeProbeTimeoutMs Bounded wait for the native AVIF decode probe
     */
    explicit FormatCapabilityResolver(std::shared_ptr<RuntimeProbe> probe = std::make_shared<DefaultRuntimeProbe>(),
                                      std::vector<ImageFormat> extensionCodecFormats = { ImageFormat::Avif, ImageFormat::Jxl },
                                      int decodeProbeTimeoutMs = 150);

    /**
     * Probe the runtime once. Later calls return the cached result.
     * @return Format support snapshot
     */
    FormatSupport resolve();

    /**
     * Discard the cached result and probe again, e.g. after a fatal
     * capability constraint was detected at runtime
     */
    FormatSupport refresh();

    /**
     * Fallback chain using the current snapshot (resolves first if needed)
     */
    std::vector<ImageFormat> fallbackOrder(ImageFormat requested);

    /**
     * Check if the runtime reported shared memory support in the last resolve
     */
    bool sharedMemoryAvailable();

    /**
     * Embedded AVIF sample used for the native decode probe
     */
    static std::vector<uchar> avifDecodeSample();

private:
    FormatSupport detect();
    bool probeNativeDecodeWithTimeout(ImageFormat format);

    std::shared_ptr<RuntimeProbe> m_probe;
    std::vector<ImageFormat> m_extensionCodecFormats;
    int m_decodeProbeTimeoutMs;

    std::mutex m_mutex;
    bool m_resolved;
    bool m_sharedMemory;
    FormatSupport m_support;
};

#endif // FORMATCAPABILITYRESOLVER_H
