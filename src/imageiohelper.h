#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <opencv2/opencv.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised when a source buffer cannot be decoded into pixels
 */
class ImageDecodeError : public std::runtime_error
{
public:
    explicit ImageDecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Pixel dimensions after applying a bounding box
 */
struct ImageSize {
    int width = 0;
    int height = 0;
};

// Sentinel for "no limit" on a dimension
constexpr int UNBOUNDED_DIMENSION = 0x7fffffff;

/**
 * Helper functions for byte-buffer image I/O
 *
 * Every decoded image is normalized to 8-bit BGRA so that alpha detection,
 * resizing and the extension codecs all see the same layout.
 * File access goes through Qt's file APIs so Unicode paths work everywhere.
 */
class ImageIOHelper
{
public:
    /**
     * Decode an encoded image held in memory
     * @param bytes Encoded file contents
     * @return 8-bit BGRA image
     * @throws ImageDecodeError if the buffer is empty or not a decodable image
     */
    static cv::Mat decode(const std::vector<uchar>& bytes);

    /**
     * Convert any decoded image to 8-bit BGRA
     * @param image Image with 1, 3 or 4 channels of any depth
     * @return 8-bit BGRA image (empty if the input was empty)
     */
    static cv::Mat toBGRA(const cv::Mat& image);

    /**
     * Fit a size into a bounding box preserving aspect ratio.
     * Width is constrained first, then height; both are rounded and
     * never drop below 1 pixel. Images are never enlarged.
     * @param width Source width
     * @param height Source height
     * @param maxWidth Bounding width (UNBOUNDED_DIMENSION for none)
     * @param maxHeight Bounding height (UNBOUNDED_DIMENSION for none)
     */
    static ImageSize fitWithin(int width, int height, int maxWidth, int maxHeight);

    /**
     * Resize an image into a bounding box (see fitWithin)
     * @return The source itself when no resize is needed, otherwise a new image
     */
    static cv::Mat resizeToFit(const cv::Mat& image, int maxWidth, int maxHeight);

    /**
     * Read a whole file with Unicode path support
     * @param filePath Path to the file
     * @param bytes Receives the contents
     * @return true if successful
     */
    static bool readFile(const QString& filePath, std::vector<uchar>& bytes);

    /**
     * Write a buffer to disk with Unicode path support
     * @param filePath Destination path
     * @param bytes Data to write
     * @return true if every byte was written
     */
    static bool writeFile(const QString& filePath, const std::vector<uchar>& bytes);
};

#endif // IMAGEIOHELPER_H
