#include <catch2/catch_test_macros.hpp>
#include "batchoptimizer.h"
#include "testsupport.h"

#include <atomic>
#include <string>

using namespace testsupport;

namespace {

std::vector<uchar> payload(const std::string& text)
{
    return std::vector<uchar>(text.begin(), text.end());
}

/**
 * Halves every payload; "bad" always fails and "flaky" fails on its first run
 */
class HalvingHandler : public TaskHandler {
public:
    explicit HalvingHandler(std::atomic<int>* flakyRuns) : m_flakyRuns(flakyRuns) {}

    OptimizedImage process(const TaskMessage& message) override
    {
        const std::string text(message.file.begin(), message.file.end());
        if (text == "bad") {
            throw std::runtime_error("corrupt image");
        }
        if (text == "flaky" && (*m_flakyRuns)++ == 0) {
            throw std::runtime_error("transient failure");
        }

        OptimizedImage optimized;
        optimized.result.byteLength = std::max<size_t>(1, message.file.size() / 2);
        optimized.result.bytes.assign(optimized.result.byteLength, 0x11);
        optimized.result.formatUsed = message.settings.format;
        optimized.hasPreview = message.settings.generatePreview;
        if (message.type == TaskType::OptimizeToTargetSize) {
            optimized.reachedTarget = optimized.result.byteLength <= message.settings.targetSize;
        }
        return optimized;
    }

    void warmup() override {}

private:
    std::atomic<int>* m_flakyRuns;
};

struct BatchFixture {
    explicit BatchFixture(const FormatSupport& support = makeSupport({ ImageFormat::Jpeg, ImageFormat::Png,
                                                                        ImageFormat::Webp }))
        : pool([this]() -> std::unique_ptr<TaskHandler> {
                   return std::unique_ptr<TaskHandler>(new HalvingHandler(&flakyRuns));
               },
               poolOptions()),
          batch(queue, pool, locks, support, 4)
    {
        BatchSettings settings;
        settings.format = "webp";
        batch.setSettings(settings);
    }

    static PoolOptions poolOptions()
    {
        PoolOptions options;
        options.hardwareConcurrency = 4;
        options.memoryGB = 8;
        options.warmupEnabled = false;
        return options;
    }

    std::atomic<int> flakyRuns { 0 };
    ImageQueue queue;
    FileLockRegistry locks;
    WorkerPool pool;
    BatchOptimizer batch;
};

} // namespace

TEST_CASE("Batch settings are clamped from the configuration")
{
    AppConfig config;
    config.format = "";
    config.quality = 2.0;
    config.targetSizeEnabled = true;
    config.targetSizeKB = 1;
    config.maxWidth = 0;
    config.maxHeight = 3000;
    config.maxConcurrency = -3;

    BatchSettings settings = BatchSettings::fromConfig(config, false);
    CHECK(settings.format == "auto");
    CHECK(settings.quality == 1.0);
    CHECK(settings.useTargetSize);
    CHECK(settings.targetSizeBytes == 10 * 1024);
    CHECK(settings.maxWidth == UNBOUNDED_DIMENSION);
    CHECK(settings.maxHeight == 3000);
    CHECK(settings.concurrency == 0);

    config.quality = 0.0;
    config.targetSizeKB = 50000;
    settings = BatchSettings::fromConfig(config, true);
    CHECK(settings.quality == MIN_QUALITY);
    CHECK(settings.targetSizeBytes == static_cast<size_t>(BatchSettings::MAX_TARGET_KB) * 1024);
    CHECK(settings.maxWidth == BatchSettings::LOW_MEMORY_DIMENSION_CAP);
    CHECK(settings.maxHeight == BatchSettings::LOW_MEMORY_DIMENSION_CAP);

    config.maxWidth = 1000;
    CHECK(BatchSettings::fromConfig(config, true).maxWidth == 1000);
}

TEST_CASE("Batch optimizes every queued item and reports failures")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaaaaaaaa"));
    f.queue.addImageData("/in/b.png", payload("bad"));
    f.queue.addImageData("/in/c.png", payload("cccccccccccccccccccc"));

    const BatchSummary summary = f.batch.optimizeAll();
    CHECK_FALSE(f.batch.isRunning());
    CHECK(summary.successCount == 2);
    CHECK(summary.failedCount == 1);
    CHECK(summary.skippedCount == 0);
    CHECK(summary.originalTotal == 30);
    CHECK(summary.optimizedTotal == 15);

    CHECK(f.queue.item(0).status == ItemStatus::Completed);
    CHECK(f.queue.item(0).result.result.formatUsed == ImageFormat::Webp);
    CHECK(f.queue.item(1).status == ItemStatus::Error);
    CHECK(f.queue.item(1).errorMessage.contains("corrupt image"));
    CHECK(f.queue.item(2).status == ItemStatus::Completed);
    CHECK(f.locks.lockedCount() == 0);
}

TEST_CASE("Queue summaries report sizes without the payload")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaaaaaaaa"));
    f.queue.addImageData("/in/b.png", payload("bad"));
    f.queue.addImageData("/in/c.png", payload("cccc"));

    const std::vector<ImageQueueItemSummary> before = f.queue.summaries();
    REQUIRE(before.size() == 3);
    CHECK(before[0].status == ItemStatus::Queued);
    CHECK(before[0].originalSize == 10);
    CHECK_FALSE(before[0].hasResult);
    CHECK(before[0].optimizedSize == 0);

    f.batch.optimizeAll();
    const std::vector<ImageQueueItemSummary> after = f.queue.summaries();
    REQUIRE(after.size() == 3);
    CHECK(after[0].status == ItemStatus::Completed);
    CHECK(after[0].optimizedSize == 5);
    CHECK(after[0].reachedTarget);
    CHECK(after[1].status == ItemStatus::Error);
    CHECK_FALSE(after[1].hasResult);
    CHECK(after[1].originalSize == 3);
    CHECK(after[2].optimizedSize == 2);
}

TEST_CASE("Preview generation follows the batch settings")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaa"));
    f.queue.addImageData("/in/b.png", payload("bbbb"));

    CHECK(f.batch.retry(0));
    CHECK(f.queue.item(0).result.hasPreview);

    BatchSettings settings = f.batch.settings();
    settings.generatePreviews = false;
    f.batch.setSettings(settings);
    CHECK(f.batch.retry(1));
    CHECK_FALSE(f.queue.item(1).result.hasPreview);
}

TEST_CASE("Failed items are picked up again, completed ones are not")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaa"));
    f.queue.addImageData("/in/flaky.png", payload("flaky"));

    BatchSummary summary = f.batch.optimizeAll();
    CHECK(summary.successCount == 1);
    CHECK(summary.failedCount == 1);

    summary = f.batch.optimizeAll();
    CHECK(summary.successCount == 2);
    CHECK(summary.failedCount == 0);
    CHECK(f.flakyRuns.load() == 2);
}

TEST_CASE("Retry re-runs a single item")
{
    BatchFixture f;
    f.queue.addImageData("/in/flaky.png", payload("flaky"));

    f.batch.optimizeAll();
    REQUIRE(f.queue.item(0).status == ItemStatus::Error);

    CHECK(f.batch.retry(0));
    CHECK(f.queue.item(0).status == ItemStatus::Completed);
    CHECK(f.queue.item(0).errorMessage.isEmpty());
    CHECK_FALSE(f.batch.retry(5));
}

TEST_CASE("Locked items are skipped, not failed")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaa"));
    f.queue.addImageData("/in/b.png", payload("bbbb"));

    REQUIRE(f.locks.acquire(1));
    const BatchSummary summary = f.batch.optimizeAll();
    CHECK(summary.successCount == 1);
    CHECK(summary.skippedCount == 1);
    CHECK(summary.failedCount == 0);
    CHECK(f.queue.item(1).status == ItemStatus::Queued);

    CHECK_FALSE(f.batch.retry(1));
    CHECK_FALSE(f.batch.removeItem(1));
    CHECK(f.queue.size() == 2);

    f.locks.release(1);
    CHECK(f.batch.removeItem(1));
    CHECK(f.queue.size() == 1);
}

TEST_CASE("Missed target sizes are kept with a warning")
{
    BatchFixture f;
    BatchSettings settings = f.batch.settings();
    settings.useTargetSize = true;
    settings.targetSizeBytes = 4;
    f.batch.setSettings(settings);

    f.queue.addImageData("/in/small.png", payload("tiny"));
    f.queue.addImageData("/in/large.png", payload("much larger payload"));

    const BatchSummary summary = f.batch.optimizeAll();
    CHECK(summary.successCount == 2);
    CHECK(summary.overTargetCount == 1);
    CHECK(f.queue.item(0).warning.isEmpty());
    CHECK_FALSE(f.queue.item(1).warning.isEmpty());
    CHECK(f.queue.item(1).status == ItemStatus::Completed);
}

TEST_CASE("Per-item format beats the batch format")
{
    BatchFixture f;
    f.queue.addImageData("/in/a.png", payload("aaaa"));
    f.queue.addImageData("/in/b.png", payload("bbbb"));
    f.queue.setFormatOverride(0, "jpeg");
    f.queue.setFormatOverride(1, "auto");

    BatchSettings settings = f.batch.settings();
    settings.format = "png";
    f.batch.setSettings(settings);

    f.batch.optimizeAll();
    CHECK(f.queue.item(0).result.result.formatUsed == ImageFormat::Jpeg);
    CHECK(f.queue.item(1).result.result.formatUsed == ImageFormat::Png);
}

TEST_CASE("Automatic format follows image features and support")
{
    const std::vector<uchar> transparent = encodePng(makeImage(16, 16, 0));

    SECTION("WebP when available")
    {
        BatchFixture f;
        BatchSettings settings = f.batch.settings();
        settings.format = "auto";
        f.batch.setSettings(settings);
        f.queue.addImageData("/in/t.png", transparent);

        f.batch.optimizeAll();
        CHECK(f.queue.item(0).result.result.formatUsed == ImageFormat::Webp);
    }

    SECTION("PNG keeps transparency without WebP")
    {
        BatchFixture f(makeSupport({ ImageFormat::Jpeg, ImageFormat::Png }));
        BatchSettings settings = f.batch.settings();
        settings.format = "auto";
        f.batch.setSettings(settings);
        f.queue.addImageData("/in/t.png", transparent);
        f.queue.addImageData("/in/o.png", encodePng(makeImage(16, 16)));

        f.batch.optimizeAll();
        CHECK(f.queue.item(0).result.result.formatUsed == ImageFormat::Png);
        CHECK(f.queue.item(1).result.result.formatUsed == ImageFormat::Jpeg);
    }

    SECTION("Undecodable input fails the item")
    {
        BatchFixture f;
        BatchSettings settings = f.batch.settings();
        settings.format = "auto";
        f.batch.setSettings(settings);
        f.queue.addImageData("/in/x.png", payload("not an image"));

        const BatchSummary summary = f.batch.optimizeAll();
        CHECK(summary.failedCount == 1);
    }
}

TEST_CASE("Empty queue is a no-op")
{
    BatchFixture f;
    const BatchSummary summary = f.batch.optimizeAll();
    CHECK(summary.successCount == 0);
    CHECK(summary.failedCount == 0);
    CHECK(f.pool.size() == 0);
}
