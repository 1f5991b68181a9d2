#include "imageiohelper.h"
#include <QFile>
#include <algorithm>
#include <cmath>

cv::Mat ImageIOHelper::decode(const std::vector<uchar>& bytes)
{
    if (bytes.empty()) {
        throw ImageDecodeError("Empty image buffer");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ImageDecodeError(std::string("Failed to decode image: ") + e.what());
    }

    if (decoded.empty()) {
        throw ImageDecodeError("Failed to decode image: unsupported or corrupt data");
    }
    return toBGRA(decoded);
}

cv::Mat ImageIOHelper::toBGRA(const cv::Mat& image)
{
    if (image.empty()) {
        return cv::Mat();
    }

    cv::Mat eightBit;
    switch (image.depth()) {
        case CV_8U:
            eightBit = image;
            break;
        case CV_16U:
            image.convertTo(eightBit, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            image.convertTo(eightBit, CV_8U, 255.0);
            break;
        default:
            image.convertTo(eightBit, CV_8U);
            break;
    }

    cv::Mat bgra;
    switch (eightBit.channels()) {
        case 1:
            cv::cvtColor(eightBit, bgra, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(eightBit, bgra, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            bgra = eightBit;
            break;
        default:
            throw ImageDecodeError("Unsupported channel count: " + std::to_string(eightBit.channels()));
    }
    return bgra;
}

ImageSize ImageIOHelper::fitWithin(int width, int height, int maxWidth, int maxHeight)
{
    ImageSize size;
    double w = width;
    double h = height;

    if (w > maxWidth) {
        h = std::round(h * maxWidth / w);
        w = maxWidth;
    }
    if (h > maxHeight) {
        w = std::round(w * maxHeight / h);
        h = maxHeight;
    }

    // Zero-sized images cannot be encoded
    size.width = std::max(1, static_cast<int>(w));
    size.height = std::max(1, static_cast<int>(h));
    return size;
}

cv::Mat ImageIOHelper::resizeToFit(const cv::Mat& image, int maxWidth, int maxHeight)
{
    const ImageSize size = fitWithin(image.cols, image.rows, maxWidth, maxHeight);
    if (size.width == image.cols && size.height == image.rows) {
        return image;
    }

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(size.width, size.height), 0, 0, cv::INTER_AREA);
    return resized;
}

bool ImageIOHelper::readFile(const QString& filePath, std::vector<uchar>& bytes)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    const QByteArray data = file.readAll();
    file.close();

    bytes.assign(data.begin(), data.end());
    return !bytes.empty();
}

bool ImageIOHelper::writeFile(const QString& filePath, const std::vector<uchar>& bytes)
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    qint64 written = file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    file.close();

    return written == static_cast<qint64>(bytes.size());
}
