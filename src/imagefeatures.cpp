#include "imagefeatures.h"
#include <QDebug>
#include <algorithm>
#include <cstring>

DetectedFeatures ImageFeatures::detect(const cv::Mat& image, const std::vector<uchar>& fileBytes,
                                       const QString& mimeHint, const FormatSupport& support)
{
    DetectedFeatures features;
    features.hasAlpha = hasAlpha(image);
    features.isAnimated = isAnimated(fileBytes, mimeHint.isEmpty() ? sniffMimeType(fileBytes) : mimeHint);

    if (support.isSupported(ImageFormat::Webp)) {
        features.recommendation = ImageFormat::Webp;
    } else if (features.hasAlpha || features.isAnimated) {
        features.recommendation = ImageFormat::Png;
    } else {
        features.recommendation = ImageFormat::Jpeg;
    }
    return features;
}

bool ImageFeatures::hasAlpha(const cv::Mat& image)
{
    if (image.empty() || image.channels() != 4 || image.depth() != CV_8U) {
        return false;
    }

    const int right = image.cols - 1;
    const int bottom = image.rows - 1;
    const cv::Point samples[] = {
        cv::Point(0, 0), cv::Point(right, 0), cv::Point(0, bottom),
        cv::Point(right, bottom), cv::Point(image.cols / 2, image.rows / 2)
    };

    for (const cv::Point& p : samples) {
        if (image.at<cv::Vec4b>(p)[3] < 255) {
            return true;
        }
    }
    return false;
}

bool ImageFeatures::isAnimated(const std::vector<uchar>& fileBytes, const QString& mimeType)
{
    if (mimeType == "image/gif") {
        return true;
    }
    if (mimeType == "image/webp") {
        return containsTag(fileBytes, 100, "ANIM");
    }
    if (mimeType == "image/png" || mimeType == "image/apng") {
        return containsTag(fileBytes, 200, "acTL");
    }
    return false;
}

QString ImageFeatures::sniffMimeType(const std::vector<uchar>& bytes)
{
    auto startsWith = [&bytes](size_t offset, const unsigned char* magic, size_t length) {
        return bytes.size() >= offset + length && std::memcmp(bytes.data() + offset, magic, length) == 0;
    };

    static const unsigned char jpeg[] = { 0xFF, 0xD8, 0xFF };
    static const unsigned char png[] = { 0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A };
    static const unsigned char gif87[] = { 'G', 'I', 'F', '8', '7', 'a' };
    static const unsigned char gif89[] = { 'G', 'I', 'F', '8', '9', 'a' };
    static const unsigned char riff[] = { 'R', 'I', 'F', 'F' };
    static const unsigned char webp[] = { 'W', 'E', 'B', 'P' };
    static const unsigned char ftyp[] = { 'f', 't', 'y', 'p' };
    static const unsigned char avif[] = { 'a', 'v', 'i', 'f' };
    static const unsigned char avis[] = { 'a', 'v', 'i', 's' };
    static const unsigned char jxlCodestream[] = { 0xFF, 0x0A };
    static const unsigned char jxlContainer[] = { 0x00, 0x00, 0x00, 0x0C, 'J', 'X', 'L', ' ', 0x0D, 0x0A, 0x87, 0x0A };

    if (startsWith(0, jpeg, sizeof(jpeg))) return "image/jpeg";
    if (startsWith(0, png, sizeof(png))) return "image/png";
    if (startsWith(0, gif87, sizeof(gif87)) || startsWith(0, gif89, sizeof(gif89))) return "image/gif";
    if (startsWith(0, riff, sizeof(riff)) && startsWith(8, webp, sizeof(webp))) return "image/webp";
    if (startsWith(4, ftyp, sizeof(ftyp)) &&
        (startsWith(8, avif, sizeof(avif)) || startsWith(8, avis, sizeof(avis)))) return "image/avif";
    if (startsWith(0, jxlCodestream, sizeof(jxlCodestream)) ||
        startsWith(0, jxlContainer, sizeof(jxlContainer))) return "image/jxl";
    return QString();
}

ImageFormat ImageFeatures::resolveOutputFormat(const QString& selected, const DetectedFeatures& features,
                                               const FormatSupport& support)
{
    if (selected.compare("auto", Qt::CaseInsensitive) == 0) {
        return features.recommendation;
    }

    bool ok = false;
    const ImageFormat format = FormatRegistry::fromName(selected, &ok);
    if (!ok) {
        qWarning() << "ImageFeatures: Unknown format" << selected << "- using recommendation";
        return features.recommendation;
    }
    return support.ensureSupported(format);
}

bool ImageFeatures::containsTag(const std::vector<uchar>& bytes, size_t window, const char* tag)
{
    const size_t tagLength = std::strlen(tag);
    const size_t end = std::min(window, bytes.size());
    if (end < tagLength) {
        return false;
    }
    const auto first = bytes.begin();
    const auto last = bytes.begin() + static_cast<std::ptrdiff_t>(end);
    return std::search(first, last, tag, tag + tagLength) != last;
}
