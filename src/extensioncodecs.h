#ifndef EXTENSIONCODECS_H
#define EXTENSIONCODECS_H

#include "codecregistry.h"
#include <memory>

/**
 * AVIF encoder backed by libavif
 */
class AvifCodec : public Codec {
public:
    AvifCodec() = default;
    ~AvifCodec() override = default;

    void initialize() override;
    std::vector<uchar> encode(const cv::Mat& rgba, const CodecOptions& options) override;
};

/**
 * JPEG XL encoder backed by libjxl.
 * Requires the libjxl thread parallel runner; initialize() fails without it.
 */
class JxlCodec : public Codec {
public:
    JxlCodec();
    ~JxlCodec() override;

    void initialize() override;
    std::vector<uchar> encode(const cv::Mat& rgba, const CodecOptions& options) override;

    /**
     * Check if a libjxl parallel runner can be created on this machine
     * @return true if threaded JPEG XL encoding is possible
     */
    static bool parallelRunnerAvailable();

private:
    struct RunnerDeleter {
        void operator()(void* runner) const;
    };

    std::unique_ptr<void, RunnerDeleter> m_runner;
};

#endif // EXTENSIONCODECS_H
