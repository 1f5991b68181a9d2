#include "formatcapabilityresolver.h"
#include "extensioncodecs.h"
#include "platformdetector.h"
#include <QByteArray>
#include <QDebug>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <system_error>
#include <thread>

namespace {

// Minimal AVIF still image, split to keep lines readable
const char AVIF_SAMPLE_BASE64[] =
    "AAAAIGZ0eXBhdmlmAAAAAG1pZjFtaWFmTWExMwgAAAAAM21ldGEAAAAAAAAA"
    "IWhkbHIAAAAAAAAAAHBpY3QAAAAAAAAAAAAAAAAAAAAVDaXRlbQAAAAAAAAA"
    "BgWlbmYAAAAA5aWxvYwAAAAAAAAAB8AAAAAgAAAAAAADgZmluZmUAAAAAAAA"
    "BAQAAABhhdjAxQ29sb3IAAAAAAAABAAAACWlQURPwAAAFZG1kYXQBAAAADAY"
    "IkoKQAiDiAA==";

FormatCapability baseCapability(ImageFormat format)
{
    const FormatDefinition& def = FormatRegistry::definition(format);
    FormatCapability cap;
    cap.format = format;
    cap.requiresSharedMemory = def.requiresSharedMemory;
    cap.isLossless = def.lossless;
    cap.isNativelyDisplayable = def.nativeEncodable;
    cap.supported = false;
    return cap;
}

} // namespace

// --- FormatSupport ---

FormatSupport::FormatSupport()
{
    // Baseline before any probing: JPEG and PNG only
    for (ImageFormat format : FormatRegistry::allFormats()) {
        FormatCapability cap = baseCapability(format);
        if (format == ImageFormat::Jpeg || format == ImageFormat::Png) {
            cap.nativeEncodeSupported = true;
            cap.supported = true;
        }
        m_capabilities[format] = cap;
    }
}

FormatSupport::FormatSupport(std::map<ImageFormat, FormatCapability> capabilities)
    : m_capabilities(std::move(capabilities))
{
    for (ImageFormat format : FormatRegistry::allFormats()) {
        if (m_capabilities.find(format) == m_capabilities.end()) {
            m_capabilities[format] = baseCapability(format);
        }
    }
    m_capabilities[ImageFormat::Jpeg].supported = true;
}

const FormatCapability& FormatSupport::capability(ImageFormat format) const
{
    return m_capabilities.at(format);
}

bool FormatSupport::isSupported(ImageFormat format) const
{
    auto it = m_capabilities.find(format);
    return it != m_capabilities.end() && it->second.supported;
}

ImageFormat FormatSupport::firstSupportedFormat() const
{
    for (ImageFormat format : FormatRegistry::priorityOrder()) {
        if (isSupported(format)) {
            return format;
        }
    }
    return ImageFormat::Jpeg;
}

ImageFormat FormatSupport::ensureSupported(ImageFormat format) const
{
    if (isSupported(format)) {
        return format;
    }
    const ImageFormat fallback = firstSupportedFormat();
    qWarning() << "FormatSupport: Format" << FormatRegistry::name(format)
               << "is not supported. Falling back to" << FormatRegistry::name(fallback);
    return fallback;
}

std::vector<ImageFormat> FormatSupport::candidateOrder(ImageFormat requested)
{
    std::vector<ImageFormat> order;
    order.push_back(requested);

    if (FormatRegistry::isExtensionCodec(requested)) {
        order.push_back(ImageFormat::Webp);
        order.push_back(ImageFormat::Jpeg);
        order.push_back(ImageFormat::Png);
    } else {
        // Extension codecs are slow; they are only used when asked for explicitly
        if (requested != ImageFormat::Webp) order.push_back(ImageFormat::Webp);
        if (requested != ImageFormat::Jpeg) order.push_back(ImageFormat::Jpeg);
        if (requested != ImageFormat::Png) order.push_back(ImageFormat::Png);
    }

    std::vector<ImageFormat> unique;
    for (ImageFormat format : order) {
        if (std::find(unique.begin(), unique.end(), format) == unique.end()) {
            unique.push_back(format);
        }
    }
    return unique;
}

std::vector<ImageFormat> FormatSupport::fallbackOrder(ImageFormat requested) const
{
    std::vector<ImageFormat> order;
    for (ImageFormat format : candidateOrder(requested)) {
        if (isSupported(format)) {
            order.push_back(format);
        }
    }

    if (std::find(order.begin(), order.end(), ImageFormat::Jpeg) == order.end()) {
        order.push_back(ImageFormat::Jpeg);
    }
    return order;
}

// --- DefaultRuntimeProbe ---

bool DefaultRuntimeProbe::canEncodeNatively(ImageFormat format)
{
    const FormatDefinition& def = FormatRegistry::definition(format);
    const std::string extension = std::string(".") + def.extension;

    try {
        if (!cv::haveImageWriter(extension)) {
            return false;
        }
        cv::Mat pixel(1, 1, def.supportsAlpha ? CV_8UC4 : CV_8UC3, cv::Scalar::all(0));
        std::vector<uchar> buffer;
        return cv::imencode(extension, pixel, buffer) && !buffer.empty();
    } catch (const cv::Exception& e) {
        qDebug() << "RuntimeProbe: Native encode probe failed for" << def.name << ":" << e.what();
        return false;
    }
}

bool DefaultRuntimeProbe::hasSharedMemory()
{
    const int cores = PlatformDetector::getInstance().profile().logicalCores;
    return cores > 1 && JxlCodec::parallelRunnerAvailable();
}

bool DefaultRuntimeProbe::canDecodeNatively(ImageFormat format, const std::vector<uchar>& sample)
{
    Q_UNUSED(format);
    try {
        cv::Mat decoded = cv::imdecode(sample, cv::IMREAD_UNCHANGED);
        return !decoded.empty();
    } catch (const cv::Exception& e) {
        qDebug() << "RuntimeProbe: Native decode probe failed:" << e.what();
        return false;
    }
}

// --- FormatCapabilityResolver ---

FormatCapabilityResolver::FormatCapabilityResolver(std::shared_ptr<RuntimeProbe> probe,
                                                   std::vector<ImageFormat> extensionCodecFormats,
                                                   int decodeProbeTimeoutMs)
    : m_probe(std::move(probe)),
      m_extensionCodecFormats(std::move(extensionCodecFormats)),
      m_decodeProbeTimeoutMs(decodeProbeTimeoutMs),
      m_resolved(false),
      m_sharedMemory(false)
{
}

FormatSupport FormatCapabilityResolver::resolve()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_resolved) {
        m_support = detect();
        m_resolved = true;
    }
    return m_support;
}

FormatSupport FormatCapabilityResolver::refresh()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_support = detect();
    m_resolved = true;
    return m_support;
}

std::vector<ImageFormat> FormatCapabilityResolver::fallbackOrder(ImageFormat requested)
{
    return resolve().fallbackOrder(requested);
}

bool FormatCapabilityResolver::sharedMemoryAvailable()
{
    resolve();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sharedMemory;
}

std::vector<uchar> FormatCapabilityResolver::avifDecodeSample()
{
    const QByteArray decoded = QByteArray::fromBase64(QByteArray(AVIF_SAMPLE_BASE64));
    return std::vector<uchar>(decoded.begin(), decoded.end());
}

FormatSupport FormatCapabilityResolver::detect()
{
    std::map<ImageFormat, FormatCapability> capabilities;

    if (!m_probe) {
        qWarning() << "FormatCapabilityResolver: No runtime probe, using baseline formats";
        m_sharedMemory = false;
        return FormatSupport();
    }

    m_sharedMemory = false;
    try {
        m_sharedMemory = m_probe->hasSharedMemory();
    } catch (const std::exception& e) {
        qWarning() << "FormatCapabilityResolver: Shared memory probe failed:" << e.what();
    }

    for (ImageFormat format : FormatRegistry::allFormats()) {
        FormatCapability cap = baseCapability(format);

        try {
            cap.nativeEncodeSupported = m_probe->canEncodeNatively(format);
        } catch (const std::exception& e) {
            qWarning() << "FormatCapabilityResolver: Encode probe failed for"
                       << FormatRegistry::name(format) << ":" << e.what();
            cap.nativeEncodeSupported = false;
        }
        cap.supported = cap.nativeEncodeSupported;

        cap.extensionCodecAvailable = std::find(m_extensionCodecFormats.begin(), m_extensionCodecFormats.end(),
                                                format) != m_extensionCodecFormats.end();
        if (cap.extensionCodecAvailable) {
            if (cap.requiresSharedMemory && !m_sharedMemory && !cap.nativeEncodeSupported) {
                qWarning() << "FormatCapabilityResolver: Shared memory not available. Disabling"
                           << FormatRegistry::name(format) << "codec support.";
                cap.supported = false;
            } else {
                cap.supported = true;
            }
        }

        capabilities[format] = cap;
    }

    // Universal baseline
    capabilities[ImageFormat::Jpeg].nativeEncodeSupported = true;
    capabilities[ImageFormat::Jpeg].supported = true;
    capabilities[ImageFormat::Png].nativeEncodeSupported = true;
    capabilities[ImageFormat::Png].supported = true;

    capabilities[ImageFormat::Avif].isNativelyDisplayable = probeNativeDecodeWithTimeout(ImageFormat::Avif);
    capabilities[ImageFormat::Jxl].isNativelyDisplayable = false;

    if (!m_sharedMemory) {
        qWarning() << "FormatCapabilityResolver: Shared memory is not available."
                   << "Multithreaded codecs will be limited.";
    }

    FormatSupport support(std::move(capabilities));
    for (ImageFormat format : FormatRegistry::allFormats()) {
        const FormatCapability& cap = support.capability(format);
        qDebug() << "FormatCapabilityResolver:" << FormatRegistry::name(format)
                 << "supported=" << cap.supported
                 << "native=" << cap.nativeEncodeSupported
                 << "codec=" << cap.extensionCodecAvailable
                 << "displayable=" << cap.isNativelyDisplayable;
    }
    return support;
}

bool FormatCapabilityResolver::probeNativeDecodeWithTimeout(ImageFormat format)
{
    // The probe thread may outlive this call, so it owns its inputs
    auto promise = std::make_shared<std::promise<bool>>();
    std::future<bool> outcome = promise->get_future();
    std::shared_ptr<RuntimeProbe> probe = m_probe;
    std::vector<uchar> sample = avifDecodeSample();

    try {
        std::thread([promise, probe, format, sample]() {
            bool decoded = false;
            try {
                decoded = probe->canDecodeNatively(format, sample);
            } catch (const std::exception& e) {
                qDebug() << "FormatCapabilityResolver: Decode probe threw:" << e.what();
            }
            promise->set_value(decoded);
        }).detach();
    } catch (const std::system_error& e) {
        qWarning() << "FormatCapabilityResolver: Could not start decode probe:" << e.what();
        return false;
    }

    if (outcome.wait_for(std::chrono::milliseconds(m_decodeProbeTimeoutMs)) != std::future_status::ready) {
        qWarning() << "FormatCapabilityResolver: Native" << FormatRegistry::name(format)
                   << "decode probe timed out after" << m_decodeProbeTimeoutMs << "ms";
        return false;
    }
    return outcome.get();
}
