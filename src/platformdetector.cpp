#include "platformdetector.h"
#include <QDebug>
#include <QSysInfo>
#include <QThread>
#include <algorithm>

#ifdef _WIN32
    #include <windows.h>
#elif defined(__APPLE__)
    #include <sys/types.h>
    #include <sys/sysctl.h>
#elif defined(__linux__)
    #include <sys/sysinfo.h>
#endif

namespace {
constexpr quint64 BYTES_PER_GB = 1024ULL * 1024 * 1024;
}

PlatformDetector& PlatformDetector::getInstance()
{
    static PlatformDetector instance;
    return instance;
}

PlatformDetector::PlatformDetector()
{
    m_profile.osName = QSysInfo::prettyProductName();
    m_profile.kernelVersion = QSysInfo::kernelVersion();
    m_profile.logicalCores = std::max(0, QThread::idealThreadCount());
    queryMemory(m_profile);

    qDebug() << "PlatformDetector:" << summary();
}

void PlatformDetector::queryMemory(HardwareProfile& profile)
{
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status)) {
        profile.totalMemoryBytes = status.ullTotalPhys;
        profile.freeMemoryBytes = status.ullAvailPhys;
    }
#elif defined(__APPLE__)
    int64_t memSize = 0;
    size_t length = sizeof(memSize);
    if (sysctlbyname("hw.memsize", &memSize, &length, nullptr, 0) == 0) {
        profile.totalMemoryBytes = static_cast<quint64>(memSize);
    }
#elif defined(__linux__)
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        profile.totalMemoryBytes = static_cast<quint64>(info.totalram) * info.mem_unit;
        profile.freeMemoryBytes = static_cast<quint64>(info.freeram) * info.mem_unit;
    }
#else
    Q_UNUSED(profile);
    qWarning() << "PlatformDetector: Memory size unknown on this platform";
#endif
}

int PlatformDetector::hardwareConcurrencyHint() const
{
    return m_profile.logicalCores > 0 ? m_profile.logicalCores : DEFAULT_HARDWARE_CONCURRENCY;
}

int PlatformDetector::memoryGBHint() const
{
    if (m_profile.totalMemoryBytes == 0) {
        return DEFAULT_MEMORY_GB;
    }
    return std::max(1, static_cast<int>(m_profile.totalMemoryBytes / BYTES_PER_GB));
}

bool PlatformDetector::isLowMemoryDevice() const
{
    return memoryGBHint() < LOW_MEMORY_THRESHOLD_GB;
}

QString PlatformDetector::summary() const
{
    return QString("%1 (kernel %2), %3 logical cores, %4 GB RAM, %5 GB free")
        .arg(m_profile.osName, m_profile.kernelVersion)
        .arg(m_profile.logicalCores)
        .arg(m_profile.totalMemoryBytes / BYTES_PER_GB)
        .arg(m_profile.freeMemoryBytes / BYTES_PER_GB);
}
