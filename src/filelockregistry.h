#ifndef FILELOCKREGISTRY_H
#define FILELOCKREGISTRY_H

#include <QMutex>
#include <set>

/**
 * Per-item exclusive ownership set.
 *
 * Optimize, retry and remove all acquire the item's index first. A failed
 * acquire never blocks: the caller skips that item and carries on with the
 * rest of the batch.
 */
class FileLockRegistry
{
public:
    FileLockRegistry() = default;

    /**
     * Attempt to acquire the lock for an item
     * @param index Item index
     * @return true if the lock was free and is now held, false if already held
     */
    bool acquire(int index);

    /**
     * Release the lock for an item. Releasing a free index is a no-op.
     * @param index Item index
     */
    void release(int index);

    /**
     * Check if an item is currently locked
     * @param index Item index
     */
    bool isLocked(int index) const;

    int lockedCount() const;

private:
    mutable QMutex m_mutex;
    std::set<int> m_locked;
};

/**
 * RAII holder for one FileLockRegistry entry
 */
class FileLockGuard
{
public:
    FileLockGuard(FileLockRegistry& registry, int index)
        : m_registry(registry), m_index(index), m_owned(registry.acquire(index)) {}

    ~FileLockGuard()
    {
        if (m_owned) {
            m_registry.release(m_index);
        }
    }

    bool ownsLock() const { return m_owned; }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

private:
    FileLockRegistry& m_registry;
    int m_index;
    bool m_owned;
};

#endif // FILELOCKREGISTRY_H
