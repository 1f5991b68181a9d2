#include <catch2/catch_test_macros.hpp>
#include "imagefeatures.h"
#include "testsupport.h"

#include <string>

using namespace testsupport;

namespace {

std::vector<uchar> bytesOf(const std::string& text)
{
    return std::vector<uchar>(text.begin(), text.end());
}

std::vector<uchar> webpWithChunk(const char* chunk)
{
    std::string file = "RIFF";
    file += std::string(4, '\0');
    file += "WEBPVP8X";
    file += std::string(14, '\0');
    file += chunk;
    file += std::string(20, '\0');
    return bytesOf(file);
}

} // namespace

TEST_CASE("Alpha is found from sampled pixels")
{
    CHECK_FALSE(ImageFeatures::hasAlpha(makeImage(32, 32)));
    CHECK(ImageFeatures::hasAlpha(makeImage(32, 32, 0)));

    cv::Mat corner = makeImage(32, 32);
    corner.at<cv::Vec4b>(31, 31)[3] = 128;
    CHECK(ImageFeatures::hasAlpha(corner));

    cv::Mat center = makeImage(32, 32);
    center.at<cv::Vec4b>(16, 16)[3] = 10;
    CHECK(ImageFeatures::hasAlpha(center));

    // Only the corners and the center are sampled
    cv::Mat edge = makeImage(32, 32);
    edge.at<cv::Vec4b>(0, 5)[3] = 0;
    CHECK_FALSE(ImageFeatures::hasAlpha(edge));

    CHECK_FALSE(ImageFeatures::hasAlpha(cv::Mat()));
    CHECK_FALSE(ImageFeatures::hasAlpha(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0))));
}

TEST_CASE("MIME type is sniffed from magic bytes")
{
    CHECK(ImageFeatures::sniffMimeType({ 0xFF, 0xD8, 0xFF, 0xE0 }) == "image/jpeg");
    CHECK(ImageFeatures::sniffMimeType(encodePng(makeImage(4, 4))) == "image/png");
    CHECK(ImageFeatures::sniffMimeType(bytesOf("GIF89a....")) == "image/gif");
    CHECK(ImageFeatures::sniffMimeType(webpWithChunk("ANIM")) == "image/webp");
    CHECK(ImageFeatures::sniffMimeType(FormatCapabilityResolver::avifDecodeSample()) == "image/avif");
    CHECK(ImageFeatures::sniffMimeType({ 0xFF, 0x0A, 0x00 }) == "image/jxl");
    CHECK(ImageFeatures::sniffMimeType(bytesOf("hello world")).isEmpty());
    CHECK(ImageFeatures::sniffMimeType({}).isEmpty());
}

TEST_CASE("Animation is detected per container")
{
    CHECK(ImageFeatures::isAnimated(bytesOf("GIF87a"), "image/gif"));

    CHECK(ImageFeatures::isAnimated(webpWithChunk("ANIM"), "image/webp"));
    CHECK_FALSE(ImageFeatures::isAnimated(webpWithChunk("ALPH"), "image/webp"));

    std::vector<uchar> png = encodePng(makeImage(4, 4));
    CHECK_FALSE(ImageFeatures::isAnimated(png, "image/png"));
    const std::string actl = "acTL";
    png.insert(png.begin() + 33, actl.begin(), actl.end());
    CHECK(ImageFeatures::isAnimated(png, "image/png"));

    // Tags outside the sniffing window do not count
    std::vector<uchar> late(300, 0);
    std::copy(actl.begin(), actl.end(), late.begin() + 250);
    CHECK_FALSE(ImageFeatures::isAnimated(late, "image/png"));

    CHECK_FALSE(ImageFeatures::isAnimated({ 0xFF, 0xD8, 0xFF }, "image/jpeg"));
}

TEST_CASE("Recommendation prefers WebP when supported")
{
    const std::vector<uchar> png = encodePng(makeImage(8, 8, 0));

    const DetectedFeatures withWebp = ImageFeatures::detect(makeImage(8, 8, 0), png, QString(),
                                                            makeSupport({ ImageFormat::Jpeg, ImageFormat::Webp }));
    CHECK(withWebp.hasAlpha);
    CHECK(withWebp.recommendation == ImageFormat::Webp);

    const FormatSupport noWebp = makeSupport({ ImageFormat::Jpeg, ImageFormat::Png });
    CHECK(ImageFeatures::detect(makeImage(8, 8, 0), png, QString(), noWebp).recommendation == ImageFormat::Png);
    CHECK(ImageFeatures::detect(makeImage(8, 8), bytesOf("GIF89a"), QString(), noWebp).recommendation
          == ImageFormat::Png);
    CHECK(ImageFeatures::detect(makeImage(8, 8), { 0xFF, 0xD8, 0xFF }, QString(), noWebp).recommendation
          == ImageFormat::Jpeg);
}

TEST_CASE("Output format follows the user selection")
{
    const FormatSupport support = makeSupport({ ImageFormat::Jpeg, ImageFormat::Png, ImageFormat::Webp });
    DetectedFeatures features;
    features.recommendation = ImageFormat::Png;

    CHECK(ImageFeatures::resolveOutputFormat("auto", features, support) == ImageFormat::Png);
    CHECK(ImageFeatures::resolveOutputFormat("AUTO", features, support) == ImageFormat::Png);
    CHECK(ImageFeatures::resolveOutputFormat("jpeg", features, support) == ImageFormat::Jpeg);
    CHECK(ImageFeatures::resolveOutputFormat("avif", features, support) == ImageFormat::Webp);
    CHECK(ImageFeatures::resolveOutputFormat("bmp", features, support) == ImageFormat::Png);
}
