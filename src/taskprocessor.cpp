#include "taskprocessor.h"
#include "imageiohelper.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>

TaskProcessor::TaskProcessor(FormatSupport support,
                             std::shared_ptr<NativeEncoder> nativeEncoder,
                             std::unique_ptr<CodecRegistry> codecs,
                             const SearchParameters& searchParams)
    : m_codecs(std::move(codecs)),
      m_engine(std::move(support), std::move(nativeEncoder), *m_codecs),
      m_searchParams(searchParams)
{
}

TaskHandlerFactory TaskProcessor::factory(const FormatSupport& support, const SearchParameters& searchParams)
{
    return [support, searchParams]() -> std::unique_ptr<TaskHandler> {
        return std::unique_ptr<TaskHandler>(new TaskProcessor(support,
                                                              std::make_shared<OpenCVNativeEncoder>(),
                                                              CodecRegistry::createDefault(),
                                                              searchParams));
    };
}

OptimizedImage TaskProcessor::process(const TaskMessage& message)
{
    QElapsedTimer timer;
    timer.start();

    try {
        const cv::Mat image = ImageIOHelper::decode(message.file);

        OptimizedImage optimized;
        switch (message.type) {
        case TaskType::OptimizeWithSettings:
            optimized = optimizeWithSettings(image, message.settings);
            break;
        case TaskType::OptimizeToTargetSize:
            optimized = optimizeToTargetSize(image, message.settings);
            break;
        case TaskType::Warmup:
            throw TaskError("Warmup is not an optimization task");
        }

        if (message.settings.generatePreview && !optimized.result.isDisplayableNatively) {
            attachPreview(image, optimized);
        }

        qDebug() << "TaskProcessor: Task" << message.id << "done in" << timer.elapsed() << "ms,"
                 << FormatRegistry::name(optimized.result.formatUsed)
                 << optimized.result.width << "x" << optimized.result.height
                 << optimized.result.byteLength << "bytes";
        return optimized;
    } catch (const cv::Exception& e) {
        // Allocation failure leaves the unit in an unknown state
        if (e.code == cv::Error::StsNoMem) {
            throw FatalUnitError(std::string("Out of memory: ") + e.what());
        }
        throw;
    }
}

void TaskProcessor::warmup()
{
    QElapsedTimer timer;
    timer.start();
    const int ready = m_codecs->preload();
    qInfo() << "TaskProcessor: Warmup loaded" << ready << "extension codecs in" << timer.elapsed() << "ms";
}

OptimizedImage TaskProcessor::optimizeWithSettings(const cv::Mat& image, const TaskSettings& settings)
{
    const double quality = std::min(settings.quality, FIXED_QUALITY_CAP);

    OptimizedImage optimized;
    optimized.result = m_engine.encode(image, settings.maxWidth, settings.maxHeight, settings.format, quality);
    optimized.reachedTarget = true;
    optimized.attempts = 1;
    return optimized;
}

OptimizedImage TaskProcessor::optimizeToTargetSize(const cv::Mat& image, const TaskSettings& settings)
{
    if (settings.targetSize == 0) {
        throw TaskError("Target size must be positive");
    }

    TargetSizeSearch search(m_engine, m_searchParams);
    SearchOutcome outcome = search.search(image, settings.maxWidth, settings.maxHeight,
                                          settings.format, settings.targetSize);

    OptimizedImage optimized;
    optimized.result = std::move(outcome.result);
    optimized.reachedTarget = outcome.reachedTarget;
    optimized.attempts = outcome.attempts;
    return optimized;
}

void TaskProcessor::attachPreview(const cv::Mat& image, OptimizedImage& optimized)
{
    try {
        optimized.previewBytes = m_engine.generatePreview(image);
        optimized.hasPreview = true;
    } catch (const EncodingError& e) {
        // The optimized bytes are still valid, only the preview is missing
        qWarning() << "TaskProcessor: Preview unavailable:" << e.what();
        optimized.hasPreview = false;
    }
}
