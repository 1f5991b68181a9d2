#include "extensioncodecs.h"
#include <avif/avif.h>
#include <jxl/encode.h>
#include <jxl/resizable_parallel_runner.h>
#include <algorithm>
#include <cstring>

namespace {

struct AvifImageDeleter {
    void operator()(avifImage* image) const { avifImageDestroy(image); }
};
using AvifImagePtr = std::unique_ptr<avifImage, AvifImageDeleter>;

struct AvifEncoderDeleter {
    void operator()(avifEncoder* encoder) const { avifEncoderDestroy(encoder); }
};
using AvifEncoderPtr = std::unique_ptr<avifEncoder, AvifEncoderDeleter>;

struct JxlEncoderDeleter {
    void operator()(JxlEncoder* encoder) const { JxlEncoderDestroy(encoder); }
};
using JxlEncoderPtr = std::unique_ptr<JxlEncoder, JxlEncoderDeleter>;

avifPixelFormat pixelFormatForSubsample(int subsample)
{
    switch (subsample) {
        case 0: return AVIF_PIXEL_FORMAT_YUV400;
        case 2: return AVIF_PIXEL_FORMAT_YUV422;
        case 3: return AVIF_PIXEL_FORMAT_YUV444;
        default: return AVIF_PIXEL_FORMAT_YUV420;
    }
}

void checkRgba(const cv::Mat& rgba)
{
    if (rgba.empty() || rgba.type() != CV_8UC4) {
        throw std::runtime_error("expected a non-empty 8-bit RGBA image");
    }
}

} // namespace

// --- AVIF ---

void AvifCodec::initialize()
{
    // Codec availability depends on how libavif was built (aom, rav1e, svt)
    const char* name = avifCodecName(AVIF_CODEC_CHOICE_AUTO, AVIF_CODEC_FLAG_CAN_ENCODE);
    if (!name) {
        throw CodecUnavailableError("libavif was built without an AV1 encoder");
    }
}

std::vector<uchar> AvifCodec::encode(const cv::Mat& rgba, const CodecOptions& options)
{
    checkRgba(rgba);

    AvifImagePtr image(avifImageCreate(static_cast<uint32_t>(rgba.cols), static_cast<uint32_t>(rgba.rows),
                                       8, pixelFormatForSubsample(options.subsample)));
    if (!image) {
        throw std::runtime_error("avifImageCreate failed");
    }

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, image.get());
    rgb.format = AVIF_RGB_FORMAT_RGBA;
    rgb.depth = 8;
    rgb.pixels = const_cast<uint8_t*>(rgba.ptr<uint8_t>());
    rgb.rowBytes = static_cast<uint32_t>(rgba.step[0]);

    avifResult result = avifImageRGBToYUV(image.get(), &rgb);
    if (result != AVIF_RESULT_OK) {
        throw std::runtime_error(std::string("avifImageRGBToYUV failed: ") + avifResultToString(result));
    }

    AvifEncoderPtr encoder(avifEncoderCreate());
    if (!encoder) {
        throw std::runtime_error("avifEncoderCreate failed");
    }
    // Each execution unit already runs in its own thread
    encoder->maxThreads = 1;
    encoder->speed = std::max(AVIF_SPEED_SLOWEST, std::min(AVIF_SPEED_FASTEST, 10 - options.effort));
    encoder->minQuantizer = options.cqLevel;
    encoder->maxQuantizer = options.cqLevel;
    encoder->minQuantizerAlpha = options.cqAlphaLevel;
    encoder->maxQuantizerAlpha = options.cqAlphaLevel;

    avifRWData output = AVIF_DATA_EMPTY;
    result = avifEncoderWrite(encoder.get(), image.get(), &output);
    if (result != AVIF_RESULT_OK) {
        avifRWDataFree(&output);
        throw std::runtime_error(std::string("avifEncoderWrite failed: ") + avifResultToString(result));
    }

    std::vector<uchar> bytes(output.data, output.data + output.size);
    avifRWDataFree(&output);
    return bytes;
}

// --- JPEG XL ---

void JxlCodec::RunnerDeleter::operator()(void* runner) const
{
    JxlResizableParallelRunnerDestroy(runner);
}

JxlCodec::JxlCodec() = default;

JxlCodec::~JxlCodec() = default;

bool JxlCodec::parallelRunnerAvailable()
{
    void* runner = JxlResizableParallelRunnerCreate(nullptr);
    if (!runner) {
        return false;
    }
    JxlResizableParallelRunnerDestroy(runner);
    return true;
}

void JxlCodec::initialize()
{
    m_runner.reset(JxlResizableParallelRunnerCreate(nullptr));
    if (!m_runner) {
        throw CodecUnavailableError("JxlResizableParallelRunnerCreate failed");
    }
}

std::vector<uchar> JxlCodec::encode(const cv::Mat& rgba, const CodecOptions& options)
{
    checkRgba(rgba);
    if (!m_runner) {
        initialize();
    }

    const cv::Mat pixels = rgba.isContinuous() ? rgba : rgba.clone();
    const uint32_t width = static_cast<uint32_t>(pixels.cols);
    const uint32_t height = static_cast<uint32_t>(pixels.rows);

    JxlEncoderPtr encoder(JxlEncoderCreate(nullptr));
    if (!encoder) {
        throw std::runtime_error("JxlEncoderCreate failed");
    }

    JxlResizableParallelRunnerSetThreads(m_runner.get(), JxlResizableParallelRunnerSuggestThreads(width, height));
    if (JXL_ENC_SUCCESS != JxlEncoderSetParallelRunner(encoder.get(), JxlResizableParallelRunner, m_runner.get())) {
        throw std::runtime_error("JxlEncoderSetParallelRunner failed");
    }

    JxlBasicInfo basicInfo;
    JxlEncoderInitBasicInfo(&basicInfo);
    basicInfo.xsize = width;
    basicInfo.ysize = height;
    basicInfo.bits_per_sample = 8;
    basicInfo.num_color_channels = 3;
    basicInfo.num_extra_channels = 1;
    basicInfo.alpha_bits = 8;
    basicInfo.uses_original_profile = JXL_FALSE;
    if (JXL_ENC_SUCCESS != JxlEncoderSetBasicInfo(encoder.get(), &basicInfo)) {
        throw std::runtime_error("JxlEncoderSetBasicInfo failed: " +
                                 std::to_string(JxlEncoderGetError(encoder.get())));
    }

    JxlColorEncoding colorEncoding = {};
    JxlColorEncodingSetToSRGB(&colorEncoding, JXL_FALSE);
    if (JXL_ENC_SUCCESS != JxlEncoderSetColorEncoding(encoder.get(), &colorEncoding)) {
        throw std::runtime_error("JxlEncoderSetColorEncoding failed");
    }

    JxlEncoderFrameSettings* frameSettings = JxlEncoderFrameSettingsCreate(encoder.get(), nullptr);
    JxlEncoderFrameSettingsSetOption(frameSettings, JXL_ENC_FRAME_SETTING_EFFORT, std::max(1, options.effort));
    JxlEncoderSetFrameDistance(frameSettings, JxlEncoderDistanceFromQuality(static_cast<float>(options.quality)));

    JxlPixelFormat pixelFormat = { 4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0 };
    const size_t inputSize = pixels.total() * pixels.elemSize();
    if (JXL_ENC_SUCCESS != JxlEncoderAddImageFrame(frameSettings, &pixelFormat, pixels.data, inputSize)) {
        throw std::runtime_error("JxlEncoderAddImageFrame failed: " +
                                 std::to_string(JxlEncoderGetError(encoder.get())));
    }
    JxlEncoderCloseInput(encoder.get());

    std::vector<uchar> compressed(64 * 1024);
    uint8_t* nextOut = compressed.data();
    size_t availOut = compressed.size();
    JxlEncoderStatus status = JXL_ENC_NEED_MORE_OUTPUT;
    while (status == JXL_ENC_NEED_MORE_OUTPUT) {
        status = JxlEncoderProcessOutput(encoder.get(), &nextOut, &availOut);
        if (status == JXL_ENC_NEED_MORE_OUTPUT) {
            const size_t offset = nextOut - compressed.data();
            compressed.resize(compressed.size() * 2);
            nextOut = compressed.data() + offset;
            availOut = compressed.size() - offset;
        }
    }
    if (status != JXL_ENC_SUCCESS) {
        throw std::runtime_error("JxlEncoderProcessOutput failed");
    }

    compressed.resize(nextOut - compressed.data());
    return compressed;
}
