#ifndef IMAGEFEATURES_H
#define IMAGEFEATURES_H

#include "formatcapabilityresolver.h"
#include <QString>
#include <opencv2/core.hpp>
#include <vector>

/**
 * What a source image needs from its output format
 */
struct DetectedFeatures {
    bool hasAlpha = false;
    bool isAnimated = false;
    ImageFormat recommendation = ImageFormat::Webp;
};

/**
 * Cheap feature probes used to pick an output format in "auto" mode
 */
class ImageFeatures
{
public:
    /**
     * Detect alpha and animation and derive a format recommendation.
     * WebP is recommended whenever it is supported; otherwise PNG for
     * images with alpha or animation and JPEG for the rest.
     * @param image Decoded BGRA pixels
     * @param fileBytes Original file bytes, used for animation sniffing
     * @param mimeHint MIME type if known, sniffed from the bytes when empty
     * @param support Current format support
     */
    static DetectedFeatures detect(const cv::Mat& image, const std::vector<uchar>& fileBytes,
                                   const QString& mimeHint, const FormatSupport& support);

    /**
     * Sample the four corners and the center for any alpha below 255
     */
    static bool hasAlpha(const cv::Mat& image);

    /**
     * GIF is always treated as animated. WebP needs an ANIM chunk in the
     * first 100 bytes, PNG an acTL chunk in the first 200 bytes.
     */
    static bool isAnimated(const std::vector<uchar>& fileBytes, const QString& mimeType);

    /**
     * Identify JPEG, PNG, GIF, WebP, AVIF or JPEG XL from magic bytes
     * @return MIME type, empty if unknown
     */
    static QString sniffMimeType(const std::vector<uchar>& bytes);

    /**
     * Output format for a user selection
     * @param selected "auto" or a format name
     * @param features Features of the item
     * @param support Current format support
     * @return The recommendation for "auto", otherwise the selection if
     *         supported, otherwise the first supported format
     */
    static ImageFormat resolveOutputFormat(const QString& selected, const DetectedFeatures& features,
                                           const FormatSupport& support);

private:
    static bool containsTag(const std::vector<uchar>& bytes, size_t window, const char* tag);
};

#endif // IMAGEFEATURES_H
