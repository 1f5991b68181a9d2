#include "imagequeue.h"
#include "imageiohelper.h"
#include <QDebug>
#include <QMutexLocker>
#include <stdexcept>

ImageQueue::ImageQueue(QObject *parent)
    : QObject(parent)
{
}

int ImageQueue::addImage(const QString& filePath)
{
    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists() || !fileInfo.isFile()) {
        qWarning() << "ImageQueue: File not found:" << filePath;
        return -1;
    }

    std::vector<uchar> bytes;
    if (!ImageIOHelper::readFile(filePath, bytes)) {
        qWarning() << "ImageQueue: Failed to read" << filePath;
        return -1;
    }
    return addImageData(fileInfo.absoluteFilePath(), std::move(bytes));
}

int ImageQueue::addImageData(const QString& filePath, std::vector<uchar> bytes)
{
    if (bytes.empty()) {
        return -1;
    }

    int index;
    {
        QMutexLocker locker(&m_mutex);
        for (const auto& image : m_images) {
            if (image.filePath == filePath) {
                return -1; // Already exists
            }
        }
        m_images.emplace_back(filePath, std::move(bytes));
        index = static_cast<int>(m_images.size() - 1);
    }

    emit imageAdded(index);
    return index;
}

bool ImageQueue::removeImage(int index)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!isValid(index)) {
            return false;
        }
        // Don't allow removal of an item being processed
        if (m_images[index].status == ItemStatus::Processing) {
            return false;
        }
        m_images.erase(m_images.begin() + index);
    }

    emit imageRemoved(index);
    return true;
}

ImageQueueItem ImageQueue::item(int index) const
{
    QMutexLocker locker(&m_mutex);
    if (!isValid(index)) {
        throw std::out_of_range("ImageQueue: invalid index " + std::to_string(index));
    }
    return m_images[index];
}

int ImageQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_images.size());
}

bool ImageQueue::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_images.empty();
}

std::vector<int> ImageQueue::indicesWithStatus(ItemStatus status) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<int> indices;
    for (int i = 0; i < static_cast<int>(m_images.size()); ++i) {
        if (m_images[i].status == status) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<ImageQueueItemSummary> ImageQueue::summaries() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<ImageQueueItemSummary> result;
    result.reserve(m_images.size());
    for (const ImageQueueItem& item : m_images) {
        ImageQueueItemSummary summary;
        summary.status = item.status;
        summary.hasResult = item.hasResult;
        summary.originalSize = item.originalSize();
        if (item.hasResult) {
            summary.optimizedSize = static_cast<qint64>(item.result.result.byteLength);
            summary.reachedTarget = item.result.reachedTarget;
        }
        result.push_back(summary);
    }
    return result;
}

void ImageQueue::updateStatus(int index, ItemStatus status)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!isValid(index)) {
            return;
        }

        ImageQueueItem& image = m_images[index];
        image.status = status;

        if (status == ItemStatus::Processing) {
            image.startTime = QDateTime::currentDateTime();
            image.endTime = QDateTime();
        } else if (status == ItemStatus::Completed || status == ItemStatus::Error) {
            finishTiming(image);
        }
    }

    emit statusChanged(index, status);
}

void ImageQueue::setResult(int index, const OptimizedImage& result, const QString& warning)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!isValid(index)) {
            return;
        }

        ImageQueueItem& image = m_images[index];
        image.result = result;
        image.hasResult = true;
        image.status = ItemStatus::Completed;
        image.errorMessage.clear();
        image.warning = warning;
        finishTiming(image);
    }

    emit statusChanged(index, ItemStatus::Completed);
}

void ImageQueue::setError(int index, const QString& errorMessage)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!isValid(index)) {
            return;
        }

        ImageQueueItem& image = m_images[index];
        image.status = ItemStatus::Error;
        image.errorMessage = errorMessage;
        finishTiming(image);
    }

    emit statusChanged(index, ItemStatus::Error);
}

void ImageQueue::setFormatOverride(int index, const QString& format)
{
    QMutexLocker locker(&m_mutex);
    if (isValid(index)) {
        m_images[index].formatOverride = format;
    }
}

bool ImageQueue::isProcessing() const
{
    QMutexLocker locker(&m_mutex);
    for (const auto& image : m_images) {
        if (image.status == ItemStatus::Processing) {
            return true;
        }
    }
    return false;
}

QString ImageQueue::getStatusString(ItemStatus status)
{
    switch (status) {
        case ItemStatus::Queued:
            return "Queued";
        case ItemStatus::Processing:
            return "Processing";
        case ItemStatus::Completed:
            return "Completed";
        case ItemStatus::Error:
            return "Error";
        default:
            return "Unknown";
    }
}

bool ImageQueue::isValid(int index) const
{
    return index >= 0 && index < static_cast<int>(m_images.size());
}

void ImageQueue::finishTiming(ImageQueueItem& image)
{
    image.endTime = QDateTime::currentDateTime();
    if (!image.startTime.isNull()) {
        image.processingTimeSeconds = image.startTime.msecsTo(image.endTime) / 1000.0;
    }
}
