#ifndef TARGETSIZESEARCH_H
#define TARGETSIZESEARCH_H

#include "encodingengine.h"
#include <cstddef>

/**
 * Tuning of the target-size search.
 * The tolerance is the fraction of the target a result must fill before the
 * search accepts it as close enough.
 */
struct SearchParameters {
    double tolerance = 0.9;
    int maxAttempts = 15;               // Encode budget per resolution, native formats
    int maxAttemptsExtension = 8;       // Same for AVIF/JXL, each attempt is costly
    int maxResizes = MAX_RESIZE_ITERATIONS;

    double seedQuality = 0.8;
    double initialCeiling = 0.95;
    double resizedCeiling = 0.92;
    double resizedQuality = 0.75;
    double convergenceThreshold = 0.05;
    double ceilingMargin = 0.05;

    double safetyFactor = 0.95;
    int minDimension = 100;

    size_t preDownscaleTargetBytes = 100 * 1024;
    int preDownscaleThreshold = 1600;
    double preDownscaleFactor = 0.6;
};

/**
 * Mutable state of one search, scoped to a single task
 */
struct SearchState {
    int width = 1;
    int height = 1;
    double minQuality = MIN_QUALITY;
    double maxQuality = 0.95;
    double currentQuality = DEFAULT_QUALITY;
    int iterationCount = 0;
    int resizeCount = 0;

    bool hasBest = false;
    EncodeAttemptResult bestResult;
    bool hasLast = false;
    EncodeAttemptResult lastResult;
};

enum class SearchStep {
    EncodeAgain,    // Bisected the quality bracket
    Resized,        // Bracket converged without a fit, dimensions reduced
    Finished
};

/**
 * The quality bisection / resize state machine, free of any I/O.
 *
 * The driver asks for the next (width, height, quality), encodes, and feeds the
 * result back through record(). The machine stops on a close-enough fit, on a
 * converged bracket with a fit, or when the budget or the dimension floor is
 * exhausted.
 */
class SearchStateMachine
{
public:
    /**
     * @param sourceWidth Width of the decoded source
     * @param sourceHeight Height of the decoded source
     * @param maxWidth Bounding width (UNBOUNDED_DIMENSION for none)
     * @param maxHeight Bounding height (UNBOUNDED_DIMENSION for none)
     * @param targetBytes Byte budget
     * @param extensionFormat True when the requested format uses an extension codec
     * @param params Tuning
     */
    SearchStateMachine(int sourceWidth, int sourceHeight, int maxWidth, int maxHeight,
                       size_t targetBytes, bool extensionFormat,
                       const SearchParameters& params = SearchParameters());

    const SearchState& state() const { return m_state; }
    size_t targetBytes() const { return m_targetBytes; }

    /**
     * Check if another encode may be issued
     */
    bool hasBudget() const;

    bool isFinished() const { return m_finished; }

    /**
     * Feed the result of encoding at the current (width, height, quality)
     * @return What the machine did with it
     */
    SearchStep record(EncodeAttemptResult result);

    /**
     * Check if the result returned by takeResult() fits the budget
     */
    bool reachedTarget() const { return m_state.hasBest; }

    /**
     * Best fitting result if one was found, otherwise the last attempt
     * @throws std::logic_error if nothing was recorded
     */
    EncodeAttemptResult takeResult();

    /**
     * Bound on encode calls for this machine
     */
    int maxTotalAttempts() const;

    /**
     * Seed quality from the target's bytes per pixel
     */
    static double seedQuality(size_t targetBytes, double pixelCount, const SearchParameters& params);

private:
    bool resize(size_t lastSize);

    SearchParameters m_params;
    SearchState m_state;
    size_t m_targetBytes;
    int m_attemptsPerPass;
    bool m_finished;
};

/**
 * Outcome of a target-size search
 */
struct SearchOutcome {
    EncodeAttemptResult result;
    bool reachedTarget = false;     // false means best effort above the target
    int attempts = 0;
    int resizes = 0;
};

/**
 * Drives SearchStateMachine with an EncodingEngine to converge on a byte budget
 */
class TargetSizeSearch
{
public:
    explicit TargetSizeSearch(EncodingEngine& engine, const SearchParameters& params = SearchParameters());

    /**
     * Search for the highest quality encode not exceeding targetBytes.
     * Best effort: the result may exceed the target when even minimum quality
     * at the minimum dimension does not fit.
     * @throws EncodingError if the fallback chain fails on any attempt
     */
    SearchOutcome search(const cv::Mat& source, int maxWidth, int maxHeight,
                         ImageFormat format, size_t targetBytes);

private:
    EncodingEngine& m_engine;
    SearchParameters m_params;
};

#endif // TARGETSIZESEARCH_H
