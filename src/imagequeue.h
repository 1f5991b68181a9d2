#ifndef IMAGEQUEUE_H
#define IMAGEQUEUE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QFileInfo>
#include <QMutex>
#include <vector>
#include "workermessages.h"

enum class ItemStatus {
    Queued,
    Processing,
    Completed,
    Error
};

struct ImageQueueItem {
    QString filePath;
    QString fileName;
    std::vector<uchar> bytes;
    ItemStatus status;
    QString formatOverride;     // Empty means the batch-wide selection applies
    QDateTime addedTime;
    QDateTime startTime;
    QDateTime endTime;
    double processingTimeSeconds;

    bool hasResult;
    OptimizedImage result;
    QString errorMessage;
    QString warning;            // Soft problem such as a missed target size

    ImageQueueItem() :
        status(ItemStatus::Queued),
        processingTimeSeconds(0.0),
        hasResult(false)
    {}

    ImageQueueItem(const QString& path, std::vector<uchar> data) :
        filePath(path),
        fileName(QFileInfo(path).fileName()),
        bytes(std::move(data)),
        status(ItemStatus::Queued),
        addedTime(QDateTime::currentDateTime()),
        processingTimeSeconds(0.0),
        hasResult(false)
    {}

    qint64 originalSize() const { return static_cast<qint64>(bytes.size()); }
};

/**
 * Sizes and status of an item, without its bytes
 */
struct ImageQueueItemSummary {
    ItemStatus status = ItemStatus::Queued;
    bool hasResult = false;
    qint64 originalSize = 0;
    qint64 optimizedSize = 0;
    bool reachedTarget = true;
};

/**
 * Ordered list of images for one session.
 * All accessors are thread-safe; item() returns a copy.
 */
class ImageQueue : public QObject
{
    Q_OBJECT

public:
    explicit ImageQueue(QObject *parent = nullptr);

    /**
     * Add image file to the queue
     * @param filePath Path to image file
     * @return Index of added item, -1 if missing, unreadable or already queued
     */
    int addImage(const QString& filePath);

    /**
     * Add an in-memory image
     * @param filePath Identifier (used for duplicate detection and naming)
     * @param bytes Encoded file contents
     * @return Index of added item, -1 if already queued or empty
     */
    int addImageData(const QString& filePath, std::vector<uchar> bytes);

    /**
     * Remove image from queue by index
     * @return false for an invalid index or an item being processed
     */
    bool removeImage(int index);

    /**
     * Copy of an item
     * @throws std::out_of_range for an invalid index
     */
    ImageQueueItem item(int index) const;

    int size() const;
    bool isEmpty() const;

    /**
     * Indices of items in a given status
     */
    std::vector<int> indicesWithStatus(ItemStatus status) const;

    /**
     * Summaries of every item, in queue order
     */
    std::vector<ImageQueueItemSummary> summaries() const;

    void updateStatus(int index, ItemStatus status);

    /**
     * Store a successful result and mark the item Completed
     */
    void setResult(int index, const OptimizedImage& result, const QString& warning = QString());

    /**
     * Mark the item Error, keeping any earlier result
     */
    void setError(int index, const QString& errorMessage);

    /**
     * Per-item output format ("auto" or a format name, empty to clear)
     */
    void setFormatOverride(int index, const QString& format);

    /**
     * Check if any item is currently being processed
     */
    bool isProcessing() const;

    static QString getStatusString(ItemStatus status);

signals:
    void imageAdded(int index);
    void imageRemoved(int index);
    void statusChanged(int index, ItemStatus status);

private:
    bool isValid(int index) const;
    void finishTiming(ImageQueueItem& item);

    mutable QMutex m_mutex;
    std::vector<ImageQueueItem> m_images;
};

#endif // IMAGEQUEUE_H
