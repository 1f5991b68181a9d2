#include "formatregistry.h"

namespace {

const FormatDefinition FORMAT_TABLE[] = {
    // id                 name    label      mime          ext     alpha  anim   lossless native shm
    { ImageFormat::Jpeg, "jpeg", "JPEG",    "image/jpeg", "jpg",  false, false, false,   true,  false },
    { ImageFormat::Png,  "png",  "PNG",     "image/png",  "png",  true,  false, true,    true,  false },
    { ImageFormat::Webp, "webp", "WebP",    "image/webp", "webp", true,  true,  false,   true,  false },
    { ImageFormat::Avif, "avif", "AVIF",    "image/avif", "avif", true,  true,  false,   false, false },
    { ImageFormat::Jxl,  "jxl",  "JPEG XL", "image/jxl",  "jxl",  true,  false, false,   false, true  },
};

} // namespace

const FormatDefinition& FormatRegistry::definition(ImageFormat format)
{
    for (const auto& def : FORMAT_TABLE) {
        if (def.id == format) {
            return def;
        }
    }
    return FORMAT_TABLE[0];
}

ImageFormat FormatRegistry::fromName(const QString& name, bool* ok)
{
    const QString key = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }

    if (key == "jpg") {
        return ImageFormat::Jpeg;
    }
    for (const auto& def : FORMAT_TABLE) {
        if (key == QLatin1String(def.name)) {
            return def.id;
        }
    }

    if (ok) {
        *ok = false;
    }
    return ImageFormat::Jpeg;
}

QString FormatRegistry::name(ImageFormat format)
{
    return QString::fromLatin1(definition(format).name);
}

QString FormatRegistry::extension(ImageFormat format)
{
    return QString::fromLatin1(definition(format).extension);
}

QString FormatRegistry::mimeType(ImageFormat format)
{
    return QString::fromLatin1(definition(format).mimeType);
}

bool FormatRegistry::supportsQuality(ImageFormat format)
{
    return !definition(format).lossless;
}

bool FormatRegistry::isExtensionCodec(ImageFormat format)
{
    return !definition(format).nativeEncodable;
}

const std::vector<ImageFormat>& FormatRegistry::allFormats()
{
    static const std::vector<ImageFormat> formats = {
        ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Webp,
        ImageFormat::Avif, ImageFormat::Jxl
    };
    return formats;
}

const std::vector<ImageFormat>& FormatRegistry::priorityOrder()
{
    static const std::vector<ImageFormat> order = {
        ImageFormat::Webp, ImageFormat::Jpeg, ImageFormat::Png,
        ImageFormat::Avif, ImageFormat::Jxl
    };
    return order;
}
