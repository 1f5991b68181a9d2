#ifndef PLATFORMDETECTOR_H
#define PLATFORMDETECTOR_H

#include <QString>
#include <QtGlobal>

/**
 * What the host offers to the worker pool and the batch limiter
 */
struct HardwareProfile {
    QString osName;                 // QSysInfo::prettyProductName()
    QString kernelVersion;
    int logicalCores = 0;           // 0 if unknown
    quint64 totalMemoryBytes = 0;   // 0 if unknown
    quint64 freeMemoryBytes = 0;
};

/**
 * Hardware hints for sizing the worker pool and the batch limiter.
 *
 * Singleton; detection runs once on first access.
 */
class PlatformDetector {
public:
    static PlatformDetector& getInstance();

    const HardwareProfile& profile() const { return m_profile; }

    /**
     * Logical core count, 4 when it cannot be determined
     */
    int hardwareConcurrencyHint() const;

    /**
     * Physical memory in whole GB (at least 1), 4 when it cannot be determined
     */
    int memoryGBHint() const;

    /**
     * Devices under 4 GB get a dimension cap on every output
     */
    bool isLowMemoryDevice() const;

    QString summary() const;

    static constexpr int DEFAULT_HARDWARE_CONCURRENCY = 4;
    static constexpr int DEFAULT_MEMORY_GB = 4;
    static constexpr int LOW_MEMORY_THRESHOLD_GB = 4;

private:
    PlatformDetector();

    PlatformDetector(const PlatformDetector&) = delete;
    PlatformDetector& operator=(const PlatformDetector&) = delete;

    static void queryMemory(HardwareProfile& profile);

    HardwareProfile m_profile;
};

#endif // PLATFORMDETECTOR_H
