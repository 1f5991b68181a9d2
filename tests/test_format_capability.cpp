#include <catch2/catch_test_macros.hpp>
#include "formatcapabilityresolver.h"
#include "testsupport.h"

#include <chrono>
#include <thread>

namespace {

class FakeProbe : public RuntimeProbe {
public:
    bool canEncodeNatively(ImageFormat format) override
    {
        encodeProbes++;
        if (throwOnEncode) {
            throw std::runtime_error("probe crashed");
        }
        return nativeFormats.count(format) > 0;
    }

    bool hasSharedMemory() override { return sharedMemory; }

    bool canDecodeNatively(ImageFormat, const std::vector<uchar>& sample) override
    {
        if (decodeDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(decodeDelayMs));
        }
        return decodeSupported && !sample.empty();
    }

    std::set<ImageFormat> nativeFormats { ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Webp };
    bool sharedMemory = false;
    bool decodeSupported = false;
    bool throwOnEncode = false;
    int decodeDelayMs = 0;
    std::atomic<int> encodeProbes { 0 };
};

using Formats = std::vector<ImageFormat>;

} // namespace

TEST_CASE("JXL without shared memory falls back to native formats")
{
    auto probe = std::make_shared<FakeProbe>();
    FormatCapabilityResolver resolver(probe);

    const FormatSupport support = resolver.resolve();
    CHECK_FALSE(support.isSupported(ImageFormat::Jxl));
    CHECK(support.isSupported(ImageFormat::Avif));
    CHECK_FALSE(resolver.sharedMemoryAvailable());

    CHECK(FormatSupport::candidateOrder(ImageFormat::Jxl) ==
          Formats{ ImageFormat::Jxl, ImageFormat::Webp, ImageFormat::Jpeg, ImageFormat::Png });
    CHECK(resolver.fallbackOrder(ImageFormat::Jxl) ==
          Formats{ ImageFormat::Webp, ImageFormat::Jpeg, ImageFormat::Png });
}

TEST_CASE("JXL is usable when shared memory is available")
{
    auto probe = std::make_shared<FakeProbe>();
    probe->sharedMemory = true;
    FormatCapabilityResolver resolver(probe);

    CHECK(resolver.fallbackOrder(ImageFormat::Jxl) ==
          Formats{ ImageFormat::Jxl, ImageFormat::Webp, ImageFormat::Jpeg, ImageFormat::Png });
    CHECK_FALSE(resolver.resolve().capability(ImageFormat::Jxl).isNativelyDisplayable);
}

TEST_CASE("Native requests never pull in extension codecs")
{
    const FormatSupport support = testsupport::makeSupport(
        { ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Webp, ImageFormat::Avif, ImageFormat::Jxl });

    CHECK(support.fallbackOrder(ImageFormat::Png) ==
          Formats{ ImageFormat::Png, ImageFormat::Webp, ImageFormat::Jpeg });
    CHECK(support.fallbackOrder(ImageFormat::Jpeg) ==
          Formats{ ImageFormat::Jpeg, ImageFormat::Webp, ImageFormat::Png });
    CHECK(support.fallbackOrder(ImageFormat::Avif) ==
          Formats{ ImageFormat::Avif, ImageFormat::Webp, ImageFormat::Jpeg, ImageFormat::Png });
}

TEST_CASE("Fallback order always contains JPEG")
{
    const FormatSupport support = testsupport::makeSupport({});
    CHECK(support.isSupported(ImageFormat::Jpeg));
    CHECK(support.fallbackOrder(ImageFormat::Webp) == Formats{ ImageFormat::Jpeg });
    CHECK(support.fallbackOrder(ImageFormat::Avif) == Formats{ ImageFormat::Jpeg });
}

TEST_CASE("Unsupported format falls back to the first supported one")
{
    const FormatSupport withWebp = testsupport::makeSupport({ ImageFormat::Jpeg, ImageFormat::Webp });
    CHECK(withWebp.ensureSupported(ImageFormat::Avif) == ImageFormat::Webp);
    CHECK(withWebp.ensureSupported(ImageFormat::Jpeg) == ImageFormat::Jpeg);

    const FormatSupport baseline;
    CHECK(baseline.firstSupportedFormat() == ImageFormat::Jpeg);
    CHECK(baseline.isSupported(ImageFormat::Png));
    CHECK_FALSE(baseline.isSupported(ImageFormat::Webp));
}

TEST_CASE("Failing probes degrade to the JPEG and PNG baseline")
{
    auto probe = std::make_shared<FakeProbe>();
    probe->throwOnEncode = true;
    FormatCapabilityResolver resolver(probe, {});

    const FormatSupport support = resolver.resolve();
    CHECK(support.isSupported(ImageFormat::Jpeg));
    CHECK(support.isSupported(ImageFormat::Png));
    CHECK_FALSE(support.isSupported(ImageFormat::Webp));
    CHECK_FALSE(support.isSupported(ImageFormat::Avif));
    CHECK_FALSE(support.isSupported(ImageFormat::Jxl));
}

TEST_CASE("Resolution is cached until refreshed")
{
    auto probe = std::make_shared<FakeProbe>();
    FormatCapabilityResolver resolver(probe);

    resolver.resolve();
    const int afterFirst = probe->encodeProbes.load();
    CHECK(afterFirst == static_cast<int>(FormatRegistry::allFormats().size()));

    resolver.resolve();
    resolver.fallbackOrder(ImageFormat::Webp);
    CHECK(probe->encodeProbes.load() == afterFirst);

    probe->nativeFormats.erase(ImageFormat::Webp);
    const FormatSupport refreshed = resolver.refresh();
    CHECK(probe->encodeProbes.load() == 2 * afterFirst);
    CHECK_FALSE(refreshed.isSupported(ImageFormat::Webp));
}

TEST_CASE("Native AVIF decode probe is bounded by its timeout")
{
    auto probe = std::make_shared<FakeProbe>();
    probe->decodeSupported = true;

    SECTION("fast decoder reports AVIF as displayable")
    {
        FormatCapabilityResolver resolver(probe, { ImageFormat::Avif, ImageFormat::Jxl }, 2000);
        CHECK(resolver.resolve().capability(ImageFormat::Avif).isNativelyDisplayable);
    }

    SECTION("slow decoder times out")
    {
        probe->decodeDelayMs = 1000;
        FormatCapabilityResolver resolver(probe, { ImageFormat::Avif, ImageFormat::Jxl }, 50);

        const auto start = std::chrono::steady_clock::now();
        const FormatSupport support = resolver.resolve();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK_FALSE(support.capability(ImageFormat::Avif).isNativelyDisplayable);
        CHECK(elapsed < std::chrono::milliseconds(900));
    }
}

TEST_CASE("Embedded AVIF sample is an ISO-BMFF avif file")
{
    const std::vector<uchar> sample = FormatCapabilityResolver::avifDecodeSample();
    REQUIRE(sample.size() > 12);
    CHECK(std::string(sample.begin() + 4, sample.begin() + 12) == "ftypavif");
}
