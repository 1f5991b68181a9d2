#ifndef WORKERMESSAGES_H
#define WORKERMESSAGES_H

#include "encodingengine.h"
#include "imageiohelper.h"
#include <QtGlobal>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Kind of work an execution unit is asked to do
 */
enum class TaskType {
    OptimizeWithSettings,
    OptimizeToTargetSize,
    Warmup
};

/**
 * Per-task settings. quality is used by OptimizeWithSettings, targetSize
 * by OptimizeToTargetSize.
 */
struct TaskSettings {
    double quality = DEFAULT_QUALITY;
    size_t targetSize = 0;              // Bytes
    int maxWidth = UNBOUNDED_DIMENSION;
    int maxHeight = UNBOUNDED_DIMENSION;
    ImageFormat format = ImageFormat::Webp;
    bool generatePreview = true;        // Attach a native preview to AVIF/JXL results
};

/**
 * Orchestrator to unit. The unit receives its own copy of the file bytes.
 */
struct TaskMessage {
    quint64 id = 0;                     // Correlation id, 0 for warmup
    TaskType type = TaskType::OptimizeWithSettings;
    std::vector<uchar> file;
    TaskSettings settings;
};

/**
 * Result of one optimization task
 */
struct OptimizedImage {
    EncodeAttemptResult result;
    bool hasPreview = false;
    std::vector<uchar> previewBytes;    // Natively displayable stand-in for AVIF/JXL results
    bool reachedTarget = true;          // false means over the byte budget (soft failure)
    int attempts = 1;
};

/**
 * Unit to orchestrator. warmupComplete replies carry no correlation id.
 */
struct ReplyMessage {
    quint64 id = 0;
    bool success = false;
    OptimizedImage result;
    std::string error;
    bool warmupComplete = false;
};

/**
 * A unit reported an ordinary per-task failure
 */
class TaskError : public std::runtime_error
{
public:
    explicit TaskError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * The unit executing a call crashed or the pool shut down before it replied
 */
class WorkerFault : public std::runtime_error
{
public:
    explicit WorkerFault(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thrown by a task handler when the unit itself is no longer usable.
 * Escaping the handler faults the unit instead of failing one task.
 */
class FatalUnitError : public std::runtime_error
{
public:
    explicit FatalUnitError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif // WORKERMESSAGES_H
