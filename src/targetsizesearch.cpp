#include "targetsizesearch.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>
#include <stdexcept>

SearchStateMachine::SearchStateMachine(int sourceWidth, int sourceHeight, int maxWidth, int maxHeight,
                                       size_t targetBytes, bool extensionFormat,
                                       const SearchParameters& params)
    : m_params(params),
      m_targetBytes(targetBytes),
      m_attemptsPerPass(extensionFormat ? params.maxAttemptsExtension : params.maxAttempts),
      m_finished(false)
{
    double width = std::max(1, sourceWidth);
    double height = std::max(1, sourceHeight);

    // Initial constraint resize
    if (width > maxWidth || height > maxHeight) {
        const double ratio = std::min(static_cast<double>(maxWidth) / width,
                                      static_cast<double>(maxHeight) / height);
        width = std::round(width * ratio);
        height = std::round(height * ratio);
    }

    // Don't spend passes encoding a huge canvas towards a tiny budget
    if (targetBytes < m_params.preDownscaleTargetBytes &&
        (width > m_params.preDownscaleThreshold || height > m_params.preDownscaleThreshold)) {
        width = std::round(width * m_params.preDownscaleFactor);
        height = std::round(height * m_params.preDownscaleFactor);
        qDebug() << "TargetSizeSearch: Pre-resize for small target:" << width << "x" << height;
    }

    m_state.width = std::max(1, static_cast<int>(width));
    m_state.height = std::max(1, static_cast<int>(height));
    m_state.minQuality = MIN_QUALITY;
    m_state.maxQuality = m_params.initialCeiling;
    m_state.currentQuality = seedQuality(targetBytes, width * height, m_params);
}

double SearchStateMachine::seedQuality(size_t targetBytes, double pixelCount, const SearchParameters& params)
{
    // Roughly 0.15 bytes per pixel gives a decent JPEG/WebP
    const double bytesPerPixel = static_cast<double>(targetBytes) / std::max(1.0, pixelCount);
    double quality = params.seedQuality;
    if (bytesPerPixel < 0.1) quality = 0.6;
    if (bytesPerPixel < 0.05) quality = 0.4;
    return quality;
}

int SearchStateMachine::maxTotalAttempts() const
{
    return m_attemptsPerPass * (m_params.maxResizes + 1);
}

bool SearchStateMachine::hasBudget() const
{
    return !m_finished && m_state.iterationCount < m_attemptsPerPass * (m_state.resizeCount + 1);
}

SearchStep SearchStateMachine::record(EncodeAttemptResult result)
{
    if (m_finished) {
        return SearchStep::Finished;
    }

    m_state.iterationCount++;
    const size_t size = result.byteLength;
    const bool lossless = !FormatRegistry::supportsQuality(result.formatUsed);

    if (size <= m_targetBytes) {
        m_state.bestResult = result;
        m_state.hasBest = true;

        const bool closeEnough = static_cast<double>(size) >= m_targetBytes * m_params.tolerance;
        const bool nearCeiling = m_state.currentQuality >= m_state.maxQuality - m_params.ceilingMargin;
        if (closeEnough || nearCeiling || lossless) {
            m_state.lastResult = std::move(result);
            m_state.hasLast = true;
            m_finished = true;
            return SearchStep::Finished;
        }
        m_state.minQuality = m_state.currentQuality;
    } else if (lossless) {
        // Quality does not change the size; skip straight to resizing
        m_state.maxQuality = m_state.minQuality;
        m_state.currentQuality = m_state.minQuality;
    } else {
        m_state.maxQuality = m_state.currentQuality;
    }

    m_state.lastResult = std::move(result);
    m_state.hasLast = true;

    if (m_state.maxQuality - m_state.minQuality < m_params.convergenceThreshold) {
        if (m_state.hasBest) {
            m_finished = true;
            return SearchStep::Finished;
        }
        if (!resize(size)) {
            m_finished = true;
            return SearchStep::Finished;
        }
        return SearchStep::Resized;
    }

    m_state.currentQuality = (m_state.minQuality + m_state.maxQuality) / 2.0;
    if (!hasBudget()) {
        m_finished = true;
        return SearchStep::Finished;
    }
    return SearchStep::EncodeAgain;
}

bool SearchStateMachine::resize(size_t lastSize)
{
    if (m_state.resizeCount >= m_params.maxResizes) {
        qDebug() << "TargetSizeSearch: Resize budget exhausted";
        return false;
    }

    // Never enlarge an image that is already below the floor
    const int floorWidth = std::min(m_params.minDimension, m_state.width);
    const int floorHeight = std::min(m_params.minDimension, m_state.height);
    if (m_state.width <= floorWidth && m_state.height <= floorHeight) {
        qDebug() << "TargetSizeSearch: Dimension floor reached";
        return false;
    }

    const double ratio = static_cast<double>(m_targetBytes) / std::max<size_t>(1, lastSize);
    const double scale = std::sqrt(ratio) * m_params.safetyFactor;

    m_state.width = std::max(floorWidth, static_cast<int>(std::floor(m_state.width * scale)));
    m_state.height = std::max(floorHeight, static_cast<int>(std::floor(m_state.height * scale)));
    m_state.resizeCount++;

    // Smaller canvas, so start optimistic again
    m_state.minQuality = MIN_QUALITY;
    m_state.maxQuality = m_params.resizedCeiling;
    m_state.currentQuality = m_params.resizedQuality;

    qDebug() << "TargetSizeSearch: Quality floor hit, resizing to"
             << m_state.width << "x" << m_state.height;
    return true;
}

EncodeAttemptResult SearchStateMachine::takeResult()
{
    if (m_state.hasBest) {
        return std::move(m_state.bestResult);
    }
    if (m_state.hasLast) {
        return std::move(m_state.lastResult);
    }
    throw std::logic_error("SearchStateMachine: no encode result recorded");
}

// --- TargetSizeSearch ---

TargetSizeSearch::TargetSizeSearch(EncodingEngine& engine, const SearchParameters& params)
    : m_engine(engine),
      m_params(params)
{
}

SearchOutcome TargetSizeSearch::search(const cv::Mat& source, int maxWidth, int maxHeight,
                                       ImageFormat format, size_t targetBytes)
{
    if (source.empty()) {
        throw EncodingError("Cannot search on an empty image");
    }

    QElapsedTimer timer;
    timer.start();

    SearchStateMachine machine(source.cols, source.rows, maxWidth, maxHeight, targetBytes,
                               FormatRegistry::isExtensionCodec(format), m_params);

    while (machine.hasBudget()) {
        const SearchState& state = machine.state();
        qDebug() << "TargetSizeSearch: Pass" << state.iterationCount + 1
                 << "Q=" << QString::number(state.currentQuality, 'f', 3)
                 << state.width << "x" << state.height;

        EncodeAttemptResult result = m_engine.encode(source, state.width, state.height,
                                                     format, state.currentQuality);
        if (machine.record(std::move(result)) == SearchStep::Finished) {
            break;
        }
    }

    SearchOutcome outcome;
    outcome.reachedTarget = machine.reachedTarget();
    outcome.attempts = machine.state().iterationCount;
    outcome.resizes = machine.state().resizeCount;
    outcome.result = machine.takeResult();

    qDebug() << "TargetSizeSearch: Finished in" << timer.elapsed() << "ms after"
             << outcome.attempts << "attempts," << outcome.resizes << "resizes, size="
             << outcome.result.byteLength << "target=" << targetBytes;
    if (!outcome.reachedTarget) {
        qWarning() << "TargetSizeSearch: Target" << targetBytes << "not reached, best effort is"
                   << outcome.result.byteLength << "bytes";
    }
    return outcome;
}
