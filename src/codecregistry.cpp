#include "codecregistry.h"
#include "extensioncodecs.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>

CodecOptions buildCodecOptions(ImageFormat format, double quality)
{
    const double q = std::max(MIN_QUALITY, std::min(1.0, quality));
    CodecOptions options;

    if (format == ImageFormat::Avif) {
        options.cqLevel = static_cast<int>(std::lround((1.0 - q) * 45.0)) + 5;
        options.cqAlphaLevel = options.cqLevel;
        options.effort = 1;
        options.subsample = 1;
    } else if (format == ImageFormat::Jxl) {
        options.quality = static_cast<int>(std::lround(q * 100.0));
        options.effort = 1;
    }
    return options;
}

std::unique_ptr<CodecRegistry> CodecRegistry::createDefault()
{
    auto registry = std::make_unique<CodecRegistry>();
    registry->registerFactory(ImageFormat::Avif, [] { return std::unique_ptr<Codec>(new AvifCodec()); });
    registry->registerFactory(ImageFormat::Jxl, [] { return std::unique_ptr<Codec>(new JxlCodec()); });
    return registry;
}

void CodecRegistry::registerFactory(ImageFormat format, CodecFactory factory)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry& entry = m_entries[format];
    entry.factory = std::move(factory);
    entry.codec.reset();
    entry.attempted = false;
    entry.error.clear();
}

bool CodecRegistry::hasFactory(ImageFormat format) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(format) != m_entries.end();
}

Codec& CodecRegistry::get(ImageFormat format)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(format);
    if (it == m_entries.end()) {
        throw CodecUnavailableError("No codec registered for " + FormatRegistry::name(format).toStdString());
    }

    Entry& entry = it->second;
    if (!entry.attempted) {
        entry.attempted = true;
        QElapsedTimer timer;
        timer.start();
        try {
            std::unique_ptr<Codec> codec = entry.factory();
            if (!codec) {
                throw CodecUnavailableError("factory returned no codec");
            }
            codec->initialize();
            entry.codec = std::move(codec);
            qDebug() << "CodecRegistry: Loaded" << FormatRegistry::name(format)
                     << "in" << timer.elapsed() << "ms";
        } catch (const std::exception& e) {
            entry.error = e.what();
            qWarning() << "CodecRegistry: Failed to load" << FormatRegistry::name(format) << ":" << e.what();
        }
    }

    if (!entry.codec) {
        throw CodecUnavailableError("Codec for " + FormatRegistry::name(format).toStdString()
                                    + " unavailable: " + entry.error);
    }
    return *entry.codec;
}

int CodecRegistry::preload()
{
    std::vector<ImageFormat> formats;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& pair : m_entries) {
            formats.push_back(pair.first);
        }
    }

    int ready = 0;
    for (ImageFormat format : formats) {
        try {
            get(format);
            ready++;
        } catch (const CodecUnavailableError&) {
            // Already logged by get(); the native chain still covers this format
        }
    }
    return ready;
}

bool CodecRegistry::isLoaded(ImageFormat format) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(format);
    return it != m_entries.end() && it->second.codec != nullptr;
}
