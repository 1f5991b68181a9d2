#include "batchoptimizer.h"
#include "concurrencylimiter.h"
#include "imagefeatures.h"
#include "sizeformatter.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>

BatchSettings BatchSettings::fromConfig(const AppConfig& config, bool lowMemoryDevice)
{
    BatchSettings settings;
    settings.format = config.format.isEmpty() ? QString("auto") : config.format;
    settings.quality = std::max(MIN_QUALITY, std::min(1.0, config.quality));
    settings.useTargetSize = config.targetSizeEnabled;

    int targetKB = config.targetSizeKB;
    if (targetKB < MIN_TARGET_KB) {
        qInfo() << "BatchSettings: Target size raised to minimum" << MIN_TARGET_KB << "KB";
        targetKB = MIN_TARGET_KB;
    } else if (targetKB > MAX_TARGET_KB) {
        qInfo() << "BatchSettings: Target size capped at" << MAX_TARGET_KB << "KB";
        targetKB = MAX_TARGET_KB;
    }
    settings.targetSizeBytes = static_cast<size_t>(targetKB) * 1024;

    settings.maxWidth = config.maxWidth > 0 ? config.maxWidth : UNBOUNDED_DIMENSION;
    settings.maxHeight = config.maxHeight > 0 ? config.maxHeight : UNBOUNDED_DIMENSION;

    if (lowMemoryDevice) {
        if (settings.maxWidth > LOW_MEMORY_DIMENSION_CAP) {
            settings.maxWidth = LOW_MEMORY_DIMENSION_CAP;
            qInfo() << "BatchSettings: Low memory detected, constraining width to" << LOW_MEMORY_DIMENSION_CAP;
        }
        if (settings.maxHeight > LOW_MEMORY_DIMENSION_CAP) {
            settings.maxHeight = LOW_MEMORY_DIMENSION_CAP;
            qInfo() << "BatchSettings: Low memory detected, constraining height to" << LOW_MEMORY_DIMENSION_CAP;
        }
    }

    settings.concurrency = std::max(0, config.maxConcurrency);
    return settings;
}

BatchOptimizer::BatchOptimizer(ImageQueue& queue, WorkerPool& pool, FileLockRegistry& locks,
                               FormatSupport support, int hardwareConcurrency)
    : m_queue(queue),
      m_pool(pool),
      m_locks(locks),
      m_support(std::move(support)),
      m_hardwareConcurrency(std::max(1, hardwareConcurrency)),
      m_running(false),
      m_lastSkipped(0)
{
}

BatchSummary BatchOptimizer::optimizeAll()
{
    if (m_running.exchange(true)) {
        qWarning() << "BatchOptimizer: A batch is already running";
        return summary();
    }

    std::vector<int> indices = m_queue.indicesWithStatus(ItemStatus::Queued);
    const std::vector<int> failed = m_queue.indicesWithStatus(ItemStatus::Error);
    indices.insert(indices.end(), failed.begin(), failed.end());
    std::sort(indices.begin(), indices.end());

    m_lastSkipped = 0;
    if (indices.empty()) {
        qInfo() << "BatchOptimizer: Nothing to optimize";
        m_running = false;
        return summary();
    }

    QElapsedTimer timer;
    timer.start();

    const int taskCount = static_cast<int>(indices.size());
    const int limit = m_settings.concurrency > 0
        ? std::min(m_settings.concurrency, taskCount)
        : ConcurrencyLimiter::defaultLimit(m_hardwareConcurrency, taskCount);

    // Let the pool grow for the workload before the first dispatch
    m_pool.warmup(taskCount);

    std::vector<std::function<void()>> tasks;
    tasks.reserve(indices.size());
    for (int index : indices) {
        tasks.push_back([this, index]() {
            if (!optimizeItem(index)) {
                m_lastSkipped++;
            }
        });
    }

    qInfo() << "BatchOptimizer: Optimizing" << taskCount << "items," << limit << "at a time";
    try {
        ConcurrencyLimiter::runEach(tasks, limit);
    } catch (...) {
        m_running = false;
        throw;
    }
    m_running = false;

    const BatchSummary result = summary();
    qInfo() << "BatchOptimizer: Batch done in" << timer.elapsed() << "ms:"
             << result.successCount << "succeeded," << result.failedCount << "failed,"
             << result.skippedCount << "skipped";
    return result;
}

bool BatchOptimizer::retry(int index)
{
    if (m_running.load()) {
        qWarning() << "BatchOptimizer: Retry refused while a batch is running";
        return false;
    }
    if (index < 0 || index >= m_queue.size()) {
        return false;
    }
    return optimizeItem(index);
}

bool BatchOptimizer::removeItem(int index)
{
    if (m_running.load()) {
        qWarning() << "BatchOptimizer: Removal refused while a batch is running";
        return false;
    }

    FileLockGuard lock(m_locks, index);
    if (!lock.ownsLock()) {
        qWarning() << "BatchOptimizer: Item" << index << "is busy, not removed";
        return false;
    }
    return m_queue.removeImage(index);
}

BatchSummary BatchOptimizer::summary() const
{
    BatchSummary result;
    result.skippedCount = m_lastSkipped.load();

    for (const ImageQueueItemSummary& item : m_queue.summaries()) {
        if (item.status == ItemStatus::Error) {
            result.failedCount++;
        }
        if (!item.hasResult) {
            continue;
        }
        result.originalTotal += item.originalSize;
        result.optimizedTotal += item.optimizedSize;
        result.successCount++;
        if (!item.reachedTarget) {
            result.overTargetCount++;
        }
    }
    return result;
}

bool BatchOptimizer::optimizeItem(int index)
{
    FileLockGuard lock(m_locks, index);
    if (!lock.ownsLock()) {
        qWarning() << "BatchOptimizer: Skipping item" << index << "- already being processed";
        return false;
    }

    m_queue.updateStatus(index, ItemStatus::Processing);
    try {
        const ImageQueueItem item = m_queue.item(index);
        const ImageFormat format = resolveFormat(item);

        TaskSettings taskSettings;
        taskSettings.quality = m_settings.quality;
        taskSettings.targetSize = m_settings.targetSizeBytes;
        taskSettings.maxWidth = m_settings.maxWidth;
        taskSettings.maxHeight = m_settings.maxHeight;
        taskSettings.format = format;
        taskSettings.generatePreview = m_settings.generatePreviews;

        const TaskType type = m_settings.useTargetSize ? TaskType::OptimizeToTargetSize
                                                       : TaskType::OptimizeWithSettings;
        std::future<OptimizedImage> future = m_pool.dispatch(type, item.bytes, taskSettings);
        const OptimizedImage optimized = future.get();

        QString warning;
        if (!optimized.reachedTarget) {
            warning = QString("Target %1 not reached, result is %2")
                          .arg(SizeFormatter::formatFileSize(static_cast<qint64>(m_settings.targetSizeBytes)),
                               SizeFormatter::formatFileSize(static_cast<qint64>(optimized.result.byteLength)));
            qWarning() << "BatchOptimizer:" << item.fileName << warning;
        }
        m_queue.setResult(index, optimized, warning);
    } catch (const std::exception& e) {
        qWarning() << "BatchOptimizer: Optimization failed for item" << index << ":" << e.what();
        m_queue.setError(index, QString::fromUtf8(e.what()));
    }
    return true;
}

ImageFormat BatchOptimizer::resolveFormat(const ImageQueueItem& item) const
{
    // A per-item choice other than "auto" beats the batch-wide one
    const bool hasOverride = !item.formatOverride.isEmpty() &&
                             item.formatOverride.compare("auto", Qt::CaseInsensitive) != 0;
    const QString selected = hasOverride ? item.formatOverride : m_settings.format;

    DetectedFeatures features;
    if (selected.compare("auto", Qt::CaseInsensitive) == 0) {
        const cv::Mat image = ImageIOHelper::decode(item.bytes);
        features = ImageFeatures::detect(image, item.bytes, QString(), m_support);
    } else {
        features.recommendation = m_support.firstSupportedFormat();
    }
    return ImageFeatures::resolveOutputFormat(selected, features, m_support);
}
