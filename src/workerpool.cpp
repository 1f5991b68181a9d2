#include "workerpool.h"
#include "platformdetector.h"
#include <QDebug>
#include <QMutexLocker>
#include <algorithm>
#include <stdexcept>

PoolOptions PoolOptions::fromPlatform()
{
    const PlatformDetector& platform = PlatformDetector::getInstance();
    PoolOptions options;
    options.hardwareConcurrency = platform.hardwareConcurrencyHint();
    options.memoryGB = platform.memoryGBHint();
    return options;
}

WorkerPool::WorkerPool(TaskHandlerFactory factory, const PoolOptions& options)
    : m_factory(std::move(factory)),
      m_options(options),
      m_nextCallId(1),
      m_nextUnitId(1),
      m_roundRobin(0),
      m_warmupSent(false),
      m_shutdown(false)
{
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

int WorkerPool::computePoolSize(int minCount, int itemCount, int hardwareConcurrency, int memoryGB)
{
    const int hardware = std::max(1, hardwareConcurrency);
    const int memory = std::max(1, memoryGB);

    int target = std::max(2, minCount);
    if (itemCount > 0) {
        target = std::max(target, std::min({ itemCount, hardware, memory }));
    }

    // Never more units than cores, never more than the hard cap
    target = std::min(target, std::min(hardware, HARD_CAP));
    return std::max(1, target);
}

int WorkerPool::ensureCapacity(int minCount, int itemCount)
{
    QMutexLocker locker(&m_mutex);
    if (m_shutdown) {
        return static_cast<int>(m_slots.size());
    }
    reapRetired();
    reviveGivenUpSlots();
    growTo(computePoolSize(minCount, itemCount, m_options.hardwareConcurrency, m_options.memoryGB));
    return static_cast<int>(m_slots.size());
}

void WorkerPool::warmup(int itemCount)
{
    ensureCapacity(m_options.minWorkers, itemCount);

    QMutexLocker locker(&m_mutex);
    if (m_shutdown || !m_options.warmupEnabled || m_warmupSent || m_slots.empty()) {
        return;
    }

    WorkerUnit* first = m_slots.front().unit.get();
    TaskMessage message;
    message.type = TaskType::Warmup;
    if (first && first->post(std::move(message))) {
        m_warmupSent = true;
        qDebug() << "WorkerPool: Warmup sent to unit" << first->unitId();
    } else {
        qWarning() << "WorkerPool: First unit unavailable, codecs will load on demand";
    }
}

std::future<OptimizedImage> WorkerPool::dispatch(TaskType type, std::vector<uchar> file, const TaskSettings& settings)
{
    if (type == TaskType::Warmup) {
        throw std::invalid_argument("Warmup is sent through WorkerPool::warmup()");
    }

    std::promise<OptimizedImage> promise;
    std::future<OptimizedImage> future = promise.get_future();

    QMutexLocker locker(&m_mutex);
    if (m_shutdown) {
        promise.set_exception(std::make_exception_ptr(WorkerFault("Worker pool is shut down")));
        return future;
    }

    reapRetired();
    reviveGivenUpSlots();
    // Size for every call in flight, this one included
    growTo(computePoolSize(m_options.minWorkers, static_cast<int>(m_pending.size()) + 1,
                           m_options.hardwareConcurrency, m_options.memoryGB));

    WorkerUnit* unit = nextLiveUnit();
    if (!unit) {
        qCritical() << "WorkerPool: No live execution units";
        promise.set_exception(std::make_exception_ptr(WorkerFault("No live execution units")));
        return future;
    }

    const quint64 id = m_nextCallId++;
    PendingCall call;
    call.id = id;
    call.promise = std::move(promise);
    call.ownerUnit = unit->unitId();
    m_pending.emplace(id, std::move(call));

    TaskMessage message;
    message.id = id;
    message.type = type;
    message.file = std::move(file);
    message.settings = settings;

    if (!unit->post(std::move(message))) {
        // The unit faulted between selection and posting
        auto it = m_pending.find(id);
        if (it != m_pending.end()) {
            it->second.promise.set_exception(
                std::make_exception_ptr(WorkerFault("Execution unit stopped before accepting the task")));
            m_pending.erase(it);
        }
    }
    return future;
}

void WorkerPool::shutdown()
{
    std::map<quint64, PendingCall> pending;
    std::vector<std::unique_ptr<WorkerUnit>> units;
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        pending.swap(m_pending);
        for (Slot& slot : m_slots) {
            if (slot.unit) {
                units.push_back(std::move(slot.unit));
            }
        }
        for (std::unique_ptr<WorkerUnit>& unit : m_retired) {
            units.push_back(std::move(unit));
        }
        m_retired.clear();
    }

    for (auto& entry : pending) {
        entry.second.promise.set_exception(std::make_exception_ptr(WorkerFault("Worker pool shut down")));
    }

    // Units may still be delivering a reply, so join without holding the lock
    for (std::unique_ptr<WorkerUnit>& unit : units) {
        unit->stop();
    }
    for (std::unique_ptr<WorkerUnit>& unit : units) {
        unit->wait();
    }

    qDebug() << "WorkerPool: Shut down" << units.size() << "units," << pending.size() << "calls rejected";
}

int WorkerPool::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_slots.size());
}

int WorkerPool::liveUnitCount() const
{
    QMutexLocker locker(&m_mutex);
    int live = 0;
    for (const Slot& slot : m_slots) {
        if (slot.unit && slot.unit->isAlive()) {
            live++;
        }
    }
    return live;
}

int WorkerPool::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pending.size());
}

UnitInfo WorkerPool::unitInfo(int slot) const
{
    QMutexLocker locker(&m_mutex);
    if (slot < 0 || slot >= static_cast<int>(m_slots.size())) {
        throw std::out_of_range("WorkerPool: invalid slot " + std::to_string(slot));
    }

    const Slot& entry = m_slots[static_cast<size_t>(slot)];
    UnitInfo info;
    info.slot = slot;
    info.restarts = entry.restarts;
    if (entry.unit) {
        info.unitId = entry.unit->unitId();
        info.alive = entry.unit->isAlive();
        info.warmedUp = entry.unit->isWarmedUp();
        for (const auto& call : m_pending) {
            if (call.second.ownerUnit == info.unitId) {
                info.pendingCalls++;
            }
        }
    }
    return info;
}

void WorkerPool::onReply(quint64 unitId, ReplyMessage reply)
{
    if (reply.warmupComplete) {
        if (reply.success) {
            qInfo() << "WorkerPool: Unit" << unitId << "warmup complete";
        } else {
            qWarning() << "WorkerPool: Unit" << unitId << "warmup failed:" << QString::fromStdString(reply.error);
        }
        return;
    }

    std::promise<OptimizedImage> promise;
    {
        QMutexLocker locker(&m_mutex);
        const int slot = slotOfUnit(unitId);
        if (slot >= 0) {
            m_slots[static_cast<size_t>(slot)].restarts = 0;
        }

        auto it = m_pending.find(reply.id);
        if (it == m_pending.end()) {
            qDebug() << "WorkerPool: Ignoring reply for unknown call" << reply.id;
            return;
        }
        promise = std::move(it->second.promise);
        m_pending.erase(it);
    }

    if (reply.success) {
        promise.set_value(std::move(reply.result));
    } else {
        promise.set_exception(std::make_exception_ptr(TaskError(reply.error)));
    }
}

void WorkerPool::onFault(quint64 unitId, const QString& error)
{
    std::vector<std::promise<OptimizedImage>> rejected;
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            return;
        }

        for (auto it = m_pending.begin(); it != m_pending.end();) {
            if (it->second.ownerUnit == unitId) {
                rejected.push_back(std::move(it->second.promise));
                it = m_pending.erase(it);
            } else {
                ++it;
            }
        }

        if (rejected.empty()) {
            qWarning() << "WorkerPool: Unit" << unitId << "faulted with no pending work:" << error;
        } else {
            qCritical() << "WorkerPool: Unit" << unitId << "faulted," << rejected.size()
                        << "calls rejected:" << error;
        }

        const int slotIndex = slotOfUnit(unitId);
        if (slotIndex >= 0) {
            Slot& slot = m_slots[static_cast<size_t>(slotIndex)];
            // The unit's thread is still inside this call; join it later
            m_retired.push_back(std::move(slot.unit));

            // Only repeated faults with no calls in flight give up the slot
            if (rejected.empty() && slot.restarts >= m_options.maxRestartsPerSlot) {
                qCritical() << "WorkerPool: Slot" << slotIndex << "faulted" << slot.restarts + 1
                            << "times in a row, giving up on it until the next dispatch";
            } else {
                slot.restarts++;
                slot.unit = startUnit();
                qInfo() << "WorkerPool: Replaced unit" << unitId << "in slot" << slotIndex
                        << "with unit" << slot.unit->unitId();
            }
        }
    }

    const std::string message = "Execution unit crashed: " + error.toStdString();
    for (std::promise<OptimizedImage>& promise : rejected) {
        promise.set_exception(std::make_exception_ptr(WorkerFault(message)));
    }
}

std::unique_ptr<WorkerUnit> WorkerPool::startUnit()
{
    std::unique_ptr<WorkerUnit> unit(new WorkerUnit(m_nextUnitId++, m_factory, this));
    unit->start();
    return unit;
}

void WorkerPool::growTo(int target)
{
    const size_t before = m_slots.size();
    while (static_cast<int>(m_slots.size()) < target) {
        Slot slot;
        slot.unit = startUnit();
        m_slots.push_back(std::move(slot));
    }
    if (m_slots.size() != before) {
        qInfo() << "WorkerPool: Grew from" << before << "to" << m_slots.size() << "units";
    }
}

void WorkerPool::reviveGivenUpSlots()
{
    for (size_t i = 0; i < m_slots.size(); ++i) {
        Slot& slot = m_slots[i];
        if (!slot.unit) {
            slot.restarts = 0;
            slot.unit = startUnit();
            qInfo() << "WorkerPool: Revived slot" << i << "with unit" << slot.unit->unitId();
        }
    }
}

WorkerUnit* WorkerPool::nextLiveUnit()
{
    const size_t count = m_slots.size();
    for (size_t i = 0; i < count; ++i) {
        const size_t index = (m_roundRobin + i) % count;
        WorkerUnit* unit = m_slots[index].unit.get();
        if (unit && unit->isAlive()) {
            m_roundRobin = (index + 1) % count;
            return unit;
        }
    }
    return nullptr;
}

int WorkerPool::slotOfUnit(quint64 unitId) const
{
    for (size_t i = 0; i < m_slots.size(); ++i) {
        if (m_slots[i].unit && m_slots[i].unit->unitId() == unitId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void WorkerPool::reapRetired()
{
    for (auto it = m_retired.begin(); it != m_retired.end();) {
        if ((*it)->isFinished()) {
            it = m_retired.erase(it);
        } else {
            ++it;
        }
    }
}
