#include "filelockregistry.h"
#include <QMutexLocker>

bool FileLockRegistry::acquire(int index)
{
    QMutexLocker locker(&m_mutex);
    return m_locked.insert(index).second;
}

void FileLockRegistry::release(int index)
{
    QMutexLocker locker(&m_mutex);
    m_locked.erase(index);
}

bool FileLockRegistry::isLocked(int index) const
{
    QMutexLocker locker(&m_mutex);
    return m_locked.count(index) > 0;
}

int FileLockRegistry::lockedCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_locked.size());
}
