#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QMutex>
#include <QTextStream>
#include <memory>
#include "batchoptimizer.h"
#include "configmanager.h"
#include "formatcapabilityresolver.h"
#include "platformdetector.h"
#include "sizeformatter.h"
#include "taskprocessor.h"

namespace {

/**
 * Apply command-line overrides on top of the stored configuration
 * @return false if an override value is malformed
 */
bool applyOverrides(const QCommandLineParser& parser, AppConfig& config, QString& error)
{
    bool ok = true;
    if (parser.isSet("quality")) {
        config.quality = parser.value("quality").toDouble(&ok);
        if (!ok || config.quality <= 0.0 || config.quality > 1.0) {
            error = "Quality must be in (0, 1]";
            return false;
        }
    }
    if (parser.isSet("format")) {
        config.format = parser.value("format").toLower();
        bool known = config.format == "auto";
        if (!known) {
            FormatRegistry::fromName(config.format, &known);
        }
        if (!known) {
            error = QString("Unknown format: %1").arg(config.format);
            return false;
        }
    }
    if (parser.isSet("max-width")) {
        config.maxWidth = parser.value("max-width").toInt(&ok);
        if (!ok || config.maxWidth < 0) {
            error = "Invalid --max-width";
            return false;
        }
    }
    if (parser.isSet("max-height")) {
        config.maxHeight = parser.value("max-height").toInt(&ok);
        if (!ok || config.maxHeight < 0) {
            error = "Invalid --max-height";
            return false;
        }
    }
    if (parser.isSet("target-kb")) {
        config.targetSizeKB = parser.value("target-kb").toInt(&ok);
        if (!ok) {
            error = "Invalid --target-kb";
            return false;
        }
        config.targetSizeEnabled = true;
    }
    if (parser.isSet("output")) {
        config.outputDirectory = parser.value("output");
    }
    return true;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("PixelPress");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("PixelPress");

    QCommandLineParser parser;
    parser.setApplicationDescription("Batch image optimizer");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { "config", "Read settings from an INI file.", "file" },
        { "quality", "Encoding quality in (0, 1].", "value" },
        { "format", "Output format: auto, jpeg, png, webp, avif or jxl.", "name" },
        { "max-width", "Maximum output width, 0 for none.", "px" },
        { "max-height", "Maximum output height, 0 for none.", "px" },
        { "target-kb", "Search for the best quality under this size.", "kb" },
        { "output", "Directory for optimized files.", "dir" },
    });
    parser.addPositionalArgument("files", "Images to optimize.", "files...");
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        err << "No input files\n";
        parser.showHelp(1);
    }

    std::unique_ptr<ConfigManager> configManager(parser.isSet("config")
                                                 ? new ConfigManager(parser.value("config"))
                                                 : new ConfigManager());
    AppConfig config = configManager->loadConfig();
    QString error;
    if (!applyOverrides(parser, config, error)) {
        err << error << "\n";
        return 2;
    }

    const PlatformDetector& platform = PlatformDetector::getInstance();

    FormatCapabilityResolver resolver;
    const FormatSupport support = resolver.resolve();

    SearchParameters searchParams;
    searchParams.tolerance = config.searchTolerance;

    PoolOptions poolOptions = PoolOptions::fromPlatform();
    poolOptions.minWorkers = config.minWorkers;
    poolOptions.warmupEnabled = config.warmupEnabled;
    WorkerPool pool(TaskProcessor::factory(support, searchParams), poolOptions);

    // Status changes arrive on the batch runner threads
    ImageQueue queue;
    QMutex outMutex;
    QObject::connect(&queue, &ImageQueue::statusChanged, [&queue, &out, &outMutex](int index, ItemStatus status) {
        if (status == ItemStatus::Processing) {
            const QString fileName = queue.item(index).fileName;
            QMutexLocker locker(&outMutex);
            out << "Optimizing " << fileName << "\n";
            out.flush();
        }
    });

    for (const QString& file : files) {
        if (queue.addImage(file) < 0) {
            err << "Skipping " << file << "\n";
        }
    }
    if (queue.isEmpty()) {
        err << "Nothing to optimize\n";
        return 1;
    }

    FileLockRegistry locks;
    BatchOptimizer batch(queue, pool, locks, support, platform.hardwareConcurrencyHint());
    BatchSettings settings = BatchSettings::fromConfig(config, platform.isLowMemoryDevice());
    // Only the optimized files are written, previews would be discarded
    settings.generatePreviews = false;
    batch.setSettings(settings);

    const BatchSummary summary = batch.optimizeAll();

    QDir outputDir(config.outputDirectory);
    if (!outputDir.exists() && !outputDir.mkpath(".")) {
        err << "Cannot create output directory " << config.outputDirectory << "\n";
        pool.shutdown();
        return 1;
    }

    int writeFailures = 0;
    for (int i = 0; i < queue.size(); ++i) {
        const ImageQueueItem item = queue.item(i);
        if (!item.hasResult) {
            out << item.fileName << ": failed: " << item.errorMessage << "\n";
            continue;
        }

        const EncodeAttemptResult& result = item.result.result;
        const QString outputPath = outputDir.filePath(
            SizeFormatter::optimizedFileName(item.fileName, result.formatUsed));
        if (!ImageIOHelper::writeFile(outputPath, result.bytes)) {
            err << "Failed to write " << outputPath << "\n";
            writeFailures++;
            continue;
        }

        out << item.fileName << " -> " << QDir::toNativeSeparators(outputPath) << " ("
            << SizeFormatter::formatFileSize(item.originalSize()) << " -> "
            << SizeFormatter::formatFileSize(static_cast<qint64>(result.byteLength)) << ", "
            << SizeFormatter::compressionLabel(item.originalSize(), static_cast<qint64>(result.byteLength))
            << ", " << result.width << "x" << result.height << ")";
        if (!item.warning.isEmpty()) {
            out << " warning: " << item.warning;
        }
        out << "\n";
    }

    out << "\nOptimized " << summary.successCount << " of " << queue.size() << " images";
    if (summary.successCount > 0) {
        out << ": " << SizeFormatter::formatFileSize(summary.originalTotal) << " -> "
            << SizeFormatter::formatFileSize(summary.optimizedTotal) << " (saved "
            << SizeFormatter::savings(summary.originalTotal, summary.optimizedTotal) << ", "
            << SizeFormatter::compressionLabel(summary.originalTotal, summary.optimizedTotal) << ")";
    }
    out << "\n";
    if (summary.failedCount > 0) {
        out << summary.failedCount << " failed\n";
    }
    if (summary.overTargetCount > 0) {
        out << summary.overTargetCount << " above the target size\n";
    }
    out.flush();

    pool.shutdown();
    return (summary.successCount == 0 || writeFailures == summary.successCount) ? 1 : 0;
}
