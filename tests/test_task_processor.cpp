#include <catch2/catch_test_macros.hpp>
#include "taskprocessor.h"
#include "imageiohelper.h"
#include "testsupport.h"

using namespace testsupport;

namespace {

struct ProcessorFixture {
    explicit ProcessorFixture(std::initializer_list<ImageFormat> supported)
        : native(std::make_shared<FakeNativeEncoder>())
    {
        std::unique_ptr<CodecRegistry> registry(new CodecRegistry());
        registry->registerFactory(ImageFormat::Avif, [this] {
            return std::unique_ptr<Codec>(new FakeCodec(false, &codecEncodes, &codecInits));
        });
        codecs = registry.get();
        processor.reset(new TaskProcessor(makeSupport(supported), native, std::move(registry)));
    }

    TaskMessage message(TaskType type, ImageFormat format, const cv::Mat& image) const
    {
        TaskMessage task;
        task.id = 7;
        task.type = type;
        task.file = encodePng(image);
        task.settings.format = format;
        return task;
    }

    std::atomic<int> codecEncodes { 0 };
    std::atomic<int> codecInits { 0 };
    std::shared_ptr<FakeNativeEncoder> native;
    CodecRegistry* codecs = nullptr;
    std::unique_ptr<TaskProcessor> processor;
};

} // namespace

TEST_CASE("Fixed-settings quality is capped")
{
    ProcessorFixture f({ ImageFormat::Jpeg, ImageFormat::Webp });
    TaskMessage task = f.message(TaskType::OptimizeWithSettings, ImageFormat::Jpeg, makeImage(64, 48));
    task.settings.quality = 1.0;

    const OptimizedImage optimized = f.processor->process(task);
    CHECK(optimized.result.formatUsed == ImageFormat::Jpeg);
    CHECK(optimized.result.width == 64);
    CHECK(optimized.result.height == 48);
    CHECK(optimized.reachedTarget);
    CHECK(optimized.attempts == 1);
    CHECK_FALSE(optimized.hasPreview);
    REQUIRE(f.native->calls.size() == 1);
    CHECK(f.native->calls[0].quality == TaskProcessor::FIXED_QUALITY_CAP);

    task.settings.quality = 0.5;
    f.processor->process(task);
    REQUIRE(f.native->calls.size() == 2);
    CHECK(f.native->calls[1].quality == 0.5);
}

TEST_CASE("Extension results carry a native preview")
{
    ProcessorFixture f({ ImageFormat::Jpeg, ImageFormat::Webp, ImageFormat::Avif });
    TaskMessage task = f.message(TaskType::OptimizeWithSettings, ImageFormat::Avif, makeImage(64, 64));

    SECTION("preview requested")
    {
        const OptimizedImage optimized = f.processor->process(task);
        CHECK(optimized.result.formatUsed == ImageFormat::Avif);
        CHECK_FALSE(optimized.result.isDisplayableNatively);
        CHECK(optimized.hasPreview);
        CHECK_FALSE(optimized.previewBytes.empty());
        CHECK(f.codecEncodes.load() == 1);
        REQUIRE(f.native->calls.size() == 1);
        CHECK(f.native->calls[0].format == ImageFormat::Webp);
        CHECK(f.native->calls[0].quality == EncodingEngine::PREVIEW_QUALITY);
    }

    SECTION("preview turned off")
    {
        task.settings.generatePreview = false;
        const OptimizedImage optimized = f.processor->process(task);
        CHECK(optimized.result.formatUsed == ImageFormat::Avif);
        CHECK_FALSE(optimized.hasPreview);
        CHECK(optimized.previewBytes.empty());
        CHECK(f.native->calls.empty());
    }

    SECTION("preview failure keeps the result")
    {
        f.native->failing = { ImageFormat::Jpeg, ImageFormat::Webp };
        const OptimizedImage optimized = f.processor->process(task);
        CHECK(optimized.result.formatUsed == ImageFormat::Avif);
        CHECK_FALSE(optimized.hasPreview);
    }
}

TEST_CASE("Native results have no preview")
{
    ProcessorFixture f({ ImageFormat::Jpeg, ImageFormat::Webp, ImageFormat::Avif });
    const OptimizedImage optimized =
        f.processor->process(f.message(TaskType::OptimizeWithSettings, ImageFormat::Webp, makeImage(32, 32)));
    CHECK(optimized.result.isDisplayableNatively);
    CHECK_FALSE(optimized.hasPreview);
    CHECK(f.native->calls.size() == 1);
}

TEST_CASE("Target-size task searches for the budget")
{
    ProcessorFixture f({ ImageFormat::Jpeg, ImageFormat::Webp });
    TaskMessage task = f.message(TaskType::OptimizeToTargetSize, ImageFormat::Webp, makeImage(800, 600));

    SECTION("positive target")
    {
        task.settings.targetSize = 30000;
        const OptimizedImage optimized = f.processor->process(task);
        CHECK(optimized.reachedTarget);
        CHECK(optimized.result.byteLength <= 30000);
        CHECK(optimized.attempts > 1);
        CHECK(f.native->calls.size() == static_cast<size_t>(optimized.attempts));
    }

    SECTION("zero target is rejected")
    {
        task.settings.targetSize = 0;
        CHECK_THROWS_AS(f.processor->process(task), TaskError);
        CHECK(f.native->calls.empty());
    }
}

TEST_CASE("Allocation failure faults the unit, other failures do not")
{
    ProcessorFixture f({ ImageFormat::Jpeg });
    const TaskMessage task = f.message(TaskType::OptimizeWithSettings, ImageFormat::Jpeg, makeImage(32, 32));

    SECTION("out of memory")
    {
        f.native->outOfMemory = { ImageFormat::Jpeg };
        CHECK_THROWS_AS(f.processor->process(task), FatalUnitError);
    }

    SECTION("encoder failure")
    {
        f.native->failing = { ImageFormat::Jpeg };
        CHECK_THROWS_AS(f.processor->process(task), EncodingError);
    }

    SECTION("undecodable input")
    {
        TaskMessage broken = task;
        broken.file = { 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };
        CHECK_THROWS_AS(f.processor->process(broken), ImageDecodeError);
    }
}

TEST_CASE("Warmup preloads the processor's own codecs")
{
    ProcessorFixture f({ ImageFormat::Jpeg, ImageFormat::Webp, ImageFormat::Avif });
    CHECK_FALSE(f.codecs->isLoaded(ImageFormat::Avif));

    f.processor->warmup();
    CHECK(f.codecInits.load() == 1);
    CHECK(f.codecs->isLoaded(ImageFormat::Avif));

    f.processor->process(f.message(TaskType::OptimizeWithSettings, ImageFormat::Avif, makeImage(16, 16)));
    CHECK(f.codecInits.load() == 1);
    CHECK(f.codecEncodes.load() == 1);
}

TEST_CASE("Warmup is not a processing task")
{
    ProcessorFixture f({ ImageFormat::Jpeg });
    CHECK_THROWS_AS(f.processor->process(f.message(TaskType::Warmup, ImageFormat::Jpeg, makeImage(8, 8))),
                    TaskError);
}
