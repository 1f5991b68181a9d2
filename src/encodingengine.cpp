#include "encodingengine.h"
#include "imageiohelper.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QStringList>
#include <opencv2/imgproc.hpp>
#include <new>

namespace {

// Allocation failures are not a per-format problem, so they leave the chain
bool isOutOfMemory(const std::exception& e)
{
    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return true;
    }
    const cv::Exception* cvError = dynamic_cast<const cv::Exception*>(&e);
    return cvError && cvError->code == cv::Error::StsNoMem;
}

} // namespace

EncodingEngine::EncodingEngine(FormatSupport support,
                               std::shared_ptr<NativeEncoder> nativeEncoder,
                               CodecRegistry& codecs)
    : m_support(std::move(support)),
      m_nativeEncoder(std::move(nativeEncoder)),
      m_codecs(codecs)
{
}

EncodeAttemptResult EncodingEngine::encode(const cv::Mat& source, int maxWidth, int maxHeight,
                                           ImageFormat format, double quality)
{
    if (source.empty()) {
        throw EncodingError("Cannot encode an empty image");
    }
    const cv::Mat resized = ImageIOHelper::resizeToFit(source, maxWidth, maxHeight);
    return encodeSized(resized, format, quality);
}

EncodeAttemptResult EncodingEngine::encodeSized(const cv::Mat& image, ImageFormat format, double quality)
{
    const std::vector<ImageFormat> attempts = m_support.fallbackOrder(format);
    QStringList errors;
    QStringList tried;

    for (ImageFormat candidate : attempts) {
        const QString name = FormatRegistry::name(candidate);
        tried << name;

        QElapsedTimer timer;
        timer.start();
        try {
            std::vector<uchar> bytes = encodeWithFormat(image, candidate, quality);
            if (bytes.empty()) {
                errors << QString("%1: returned no data").arg(name);
                continue;
            }

            qDebug() << "EncodingEngine: Encoded" << image.cols << "x" << image.rows
                     << "with" << name << "q=" << quality
                     << "size=" << bytes.size() << "in" << timer.elapsed() << "ms";

            EncodeAttemptResult result;
            result.byteLength = bytes.size();
            result.bytes = std::move(bytes);
            result.formatUsed = candidate;
            result.isDisplayableNatively = !FormatRegistry::isExtensionCodec(candidate);
            result.width = image.cols;
            result.height = image.rows;
            return result;
        } catch (const std::exception& e) {
            if (isOutOfMemory(e)) {
                throw;
            }
            qWarning() << "EncodingEngine: Encode failed for" << name << ":" << e.what();
            errors << QString("%1: %2").arg(name, QString::fromUtf8(e.what()));
        }
    }

    const QString message = QString("Encoding failed for all formats: %1. Details: %2")
                                .arg(tried.join(", "), errors.join("; "));
    qCritical() << "EncodingEngine:" << message;
    throw EncodingError(message.toStdString());
}

std::vector<uchar> EncodingEngine::generatePreview(const cv::Mat& image)
{
    const cv::Mat preview = ImageIOHelper::resizeToFit(image, PREVIEW_MAX_DIMENSION, PREVIEW_MAX_DIMENSION);

    // Previews must always be natively displayable
    QStringList errors;
    for (ImageFormat format : FormatSupport::candidateOrder(ImageFormat::Webp)) {
        if (!m_support.isSupported(format)) {
            continue;
        }
        try {
            std::vector<uchar> bytes = m_nativeEncoder->encode(preview, format, PREVIEW_QUALITY);
            if (!bytes.empty()) {
                return bytes;
            }
            errors << QString("%1: returned no data").arg(FormatRegistry::name(format));
        } catch (const std::exception& e) {
            if (isOutOfMemory(e)) {
                throw;
            }
            errors << QString("%1: %2").arg(FormatRegistry::name(format), QString::fromUtf8(e.what()));
        }
    }
    throw EncodingError("Preview generation failed: " + errors.join("; ").toStdString());
}

std::vector<uchar> EncodingEngine::encodeWithFormat(const cv::Mat& image, ImageFormat format, double quality)
{
    if (!FormatRegistry::isExtensionCodec(format)) {
        return m_nativeEncoder->encode(image, format, quality);
    }

    Codec& codec = m_codecs.get(format);
    cv::Mat rgba;
    cv::cvtColor(image, rgba, cv::COLOR_BGRA2RGBA);
    return codec.encode(rgba, buildCodecOptions(format, quality));
}
