#ifndef TASKPROCESSOR_H
#define TASKPROCESSOR_H

#include "codecregistry.h"
#include "encodingengine.h"
#include "targetsizesearch.h"
#include "workermessages.h"
#include <functional>
#include <memory>

/**
 * Unit-side handler for task messages
 */
class TaskHandler {
public:
    virtual ~TaskHandler() = default;

    /**
     * Run one optimization task
     * @throws FatalUnitError if the unit must be torn down
     * @throws std::exception for an ordinary task failure
     */
    virtual OptimizedImage process(const TaskMessage& message) = 0;

    /**
     * Pre-load expensive resources. Failure is non-fatal.
     */
    virtual void warmup() = 0;
};

using TaskHandlerFactory = std::function<std::unique_ptr<TaskHandler>()>;

/**
 * Decodes, resizes and encodes one image inside an execution unit.
 *
 * Every instance owns its codec registry and encoder, so two units never
 * share codec state.
 */
class TaskProcessor : public TaskHandler
{
public:
    TaskProcessor(FormatSupport support,
                  std::shared_ptr<NativeEncoder> nativeEncoder,
                  std::unique_ptr<CodecRegistry> codecs,
                  const SearchParameters& searchParams = SearchParameters());

    OptimizedImage process(const TaskMessage& message) override;
    void warmup() override;

    /**
     * Factory producing processors backed by OpenCV and the default codec registry
     * @param support Format support snapshot copied into every processor
     * @param searchParams Target-size search tuning
     */
    static TaskHandlerFactory factory(const FormatSupport& support,
                                      const SearchParameters& searchParams = SearchParameters());

    // Fixed-settings encodes never exceed this quality
    static constexpr double FIXED_QUALITY_CAP = 0.92;

private:
    OptimizedImage optimizeWithSettings(const cv::Mat& image, const TaskSettings& settings);
    OptimizedImage optimizeToTargetSize(const cv::Mat& image, const TaskSettings& settings);
    void attachPreview(const cv::Mat& image, OptimizedImage& optimized);

    std::unique_ptr<CodecRegistry> m_codecs;
    EncodingEngine m_engine;
    SearchParameters m_searchParams;
};

#endif // TASKPROCESSOR_H
