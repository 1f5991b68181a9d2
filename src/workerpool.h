#ifndef WORKERPOOL_H
#define WORKERPOOL_H

#include <QMutex>
#include <future>
#include <map>
#include <memory>
#include <vector>
#include "workerunit.h"

/**
 * Sizing and recovery settings for a WorkerPool
 */
struct PoolOptions {
    int minWorkers = 0;             // Requested minimum, 0 = automatic
    int hardwareConcurrency = 4;    // Logical core hint
    int memoryGB = 4;               // Device memory hint
    int maxRestartsPerSlot = 3;     // Consecutive idle faults before a slot is given up
    bool warmupEnabled = true;

    /**
     * Options with hints taken from PlatformDetector
     */
    static PoolOptions fromPlatform();
};

/**
 * Snapshot of one pool slot
 */
struct UnitInfo {
    int slot = 0;
    quint64 unitId = 0;             // 0 while the slot is given up
    bool alive = false;
    bool warmedUp = false;
    int restarts = 0;
    int pendingCalls = 0;
};

/**
 * Fixed set of execution units with correlation-id based dispatch.
 *
 * Calls are spread round-robin over live units. Each call gets a
 * monotonically increasing id and a promise recorded before the message is
 * posted. When a unit faults, every call it owned is rejected with
 * WorkerFault and a fresh unit takes its slot. A slot whose units keep
 * faulting with no work is given up, and revived by the next dispatch or
 * ensureCapacity. The pool grows on demand and never shrinks.
 */
class WorkerPool : public UnitListener
{
public:
    explicit WorkerPool(TaskHandlerFactory factory, const PoolOptions& options = PoolOptions::fromPlatform());
    ~WorkerPool() override;

    /**
     * Number of units for a workload:
     * max(2, minCount, min(itemCount, hardwareConcurrency, memoryGB)),
     * capped at min(hardwareConcurrency, 16)
     */
    static int computePoolSize(int minCount, int itemCount, int hardwareConcurrency, int memoryGB);

    /**
     * Grow the pool to the size computed for a workload
     * @return Pool size afterwards
     */
    int ensureCapacity(int minCount, int itemCount);

    /**
     * Grow for the expected workload and send the one-time warmup request to the first unit
     * @param itemCount Expected number of items
     */
    void warmup(int itemCount = 0);

    /**
     * Send a task to the next live unit
     * @param type OptimizeWithSettings or OptimizeToTargetSize
     * @param file Encoded source bytes, moved into the message
     * @param settings Task settings
     * @return Future that yields the result, or throws TaskError / WorkerFault
     */
    std::future<OptimizedImage> dispatch(TaskType type, std::vector<uchar> file, const TaskSettings& settings);

    /**
     * Stop and join every unit, rejecting outstanding calls with WorkerFault
     */
    void shutdown();

    int size() const;
    int liveUnitCount() const;
    int pendingCount() const;

    /**
     * @throws std::out_of_range for an invalid slot
     */
    UnitInfo unitInfo(int slot) const;

    // UnitListener
    void onReply(quint64 unitId, ReplyMessage reply) override;
    void onFault(quint64 unitId, const QString& error) override;

    static constexpr int HARD_CAP = 16;

private:
    struct PendingCall {
        quint64 id = 0;
        std::promise<OptimizedImage> promise;
        quint64 ownerUnit = 0;
    };

    struct Slot {
        std::unique_ptr<WorkerUnit> unit;
        int restarts = 0;
    };

    // The following helpers expect m_mutex to be held
    std::unique_ptr<WorkerUnit> startUnit();
    void growTo(int target);
    void reviveGivenUpSlots();
    WorkerUnit* nextLiveUnit();
    int slotOfUnit(quint64 unitId) const;
    void reapRetired();

    TaskHandlerFactory m_factory;
    PoolOptions m_options;

    mutable QMutex m_mutex;
    std::vector<Slot> m_slots;
    std::vector<std::unique_ptr<WorkerUnit>> m_retired;     // Faulted units not yet joined
    std::map<quint64, PendingCall> m_pending;
    quint64 m_nextCallId;
    quint64 m_nextUnitId;
    size_t m_roundRobin;
    bool m_warmupSent;
    bool m_shutdown;
};

#endif // WORKERPOOL_H
