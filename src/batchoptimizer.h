#ifndef BATCHOPTIMIZER_H
#define BATCHOPTIMIZER_H

#include "configmanager.h"
#include "filelockregistry.h"
#include "formatcapabilityresolver.h"
#include "imagequeue.h"
#include "workerpool.h"
#include <atomic>

/**
 * Settings applied to every item of a batch
 */
struct BatchSettings {
    QString format = "auto";
    double quality = DEFAULT_QUALITY;
    bool useTargetSize = false;
    size_t targetSizeBytes = 100 * 1024;
    int maxWidth = UNBOUNDED_DIMENSION;
    int maxHeight = UNBOUNDED_DIMENSION;
    int concurrency = 0;                // 0 = automatic
    bool generatePreviews = true;       // Off for front ends that never display results

    /**
     * Derive batch settings from the stored configuration.
     * Target size is clamped to 10 KB..10000 KB, zero dimensions mean
     * unbounded, and low-memory devices cap both dimensions at 2048.
     */
    static BatchSettings fromConfig(const AppConfig& config, bool lowMemoryDevice);

    static constexpr int MIN_TARGET_KB = 10;
    static constexpr int MAX_TARGET_KB = 10000;
    static constexpr int LOW_MEMORY_DIMENSION_CAP = 2048;
};

/**
 * Totals over the items that have a successful result
 */
struct BatchSummary {
    qint64 originalTotal = 0;
    qint64 optimizedTotal = 0;
    int successCount = 0;
    int failedCount = 0;
    int skippedCount = 0;               // Lock conflicts in the last batch
    int overTargetCount = 0;
};

/**
 * Runs the queue through the worker pool.
 *
 * Each item is handled under its FileLockRegistry entry; a busy item is
 * skipped rather than waited for. Failures stay with their item and are
 * retryable, they never abort the batch.
 */
class BatchOptimizer
{
public:
    BatchOptimizer(ImageQueue& queue, WorkerPool& pool, FileLockRegistry& locks,
                   FormatSupport support, int hardwareConcurrency);

    void setSettings(const BatchSettings& settings) { m_settings = settings; }
    const BatchSettings& settings() const { return m_settings; }

    /**
     * Optimize every item that has no result yet (Queued or Error)
     * @return Summary after the batch
     */
    BatchSummary optimizeAll();

    /**
     * Optimize one item again with the current settings
     * @return false if a batch is running, the index is invalid or the item is locked
     */
    bool retry(int index);

    /**
     * Remove an item from the queue
     * @return false if a batch is running or the item is locked or processing
     */
    bool removeItem(int index);

    BatchSummary summary() const;

    bool isRunning() const { return m_running.load(); }

private:
    /**
     * Lock, dispatch and record one item
     * @return false if the item was skipped because its lock was held
     */
    bool optimizeItem(int index);
    ImageFormat resolveFormat(const ImageQueueItem& item) const;

    ImageQueue& m_queue;
    WorkerPool& m_pool;
    FileLockRegistry& m_locks;
    FormatSupport m_support;
    int m_hardwareConcurrency;
    BatchSettings m_settings;

    std::atomic<bool> m_running;
    std::atomic<int> m_lastSkipped;
};

#endif // BATCHOPTIMIZER_H
