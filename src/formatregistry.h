#ifndef FORMATREGISTRY_H
#define FORMATREGISTRY_H

#include <QString>
#include <vector>

enum class ImageFormat {
    Jpeg,
    Png,
    Webp,
    Avif,
    Jxl
};

/**
 * Static description of one output format
 */
struct FormatDefinition {
    ImageFormat id;
    const char* name;           // Canonical lowercase identifier ("jpeg", "webp", ...)
    const char* label;          // Human readable label
    const char* mimeType;
    const char* extension;      // Without the leading dot
    bool supportsAlpha;
    bool supportsAnimation;
    bool lossless;              // No meaningful quality axis
    bool nativeEncodable;       // Encoded through OpenCV imgcodecs
    bool requiresSharedMemory;  // Extension codec needs a threaded runtime
};

// Quality constants shared by the engine and the search
constexpr double DEFAULT_QUALITY = 0.8;
constexpr double MIN_QUALITY = 0.05;
constexpr int MAX_RESIZE_ITERATIONS = 5;

class FormatRegistry
{
public:
    /**
     * Get the table entry for a format
     * @param format Format identifier
     * @return Reference to the static definition
     */
    static const FormatDefinition& definition(ImageFormat format);

    /**
     * Parse a format name ("jpeg", "jpg", "png", "webp", "avif", "jxl")
     * @param name Format name, case insensitive
     * @param ok Set to false when the name is unknown (may be nullptr)
     * @return Parsed format, Jpeg when unknown
     */
    static ImageFormat fromName(const QString& name, bool* ok = nullptr);

    static QString name(ImageFormat format);
    static QString extension(ImageFormat format);
    static QString mimeType(ImageFormat format);

    /**
     * Check if a format has a variable quality axis
     * @param format Format identifier
     * @return false for lossless formats (PNG)
     */
    static bool supportsQuality(ImageFormat format);

    /**
     * Check if a format is encoded through a loadable codec instead of OpenCV
     * @param format Format identifier
     * @return true for AVIF and JPEG XL
     */
    static bool isExtensionCodec(ImageFormat format);

    /**
     * All known formats in table order
     */
    static const std::vector<ImageFormat>& allFormats();

    /**
     * Preferred order when a replacement for an unsupported format is needed.
     * Native formats come first because they encode fastest.
     */
    static const std::vector<ImageFormat>& priorityOrder();
};

#endif // FORMATREGISTRY_H
