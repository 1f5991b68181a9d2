#ifndef WORKERUNIT_H
#define WORKERUNIT_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QString>
#include <atomic>
#include <deque>
#include "taskprocessor.h"
#include "workermessages.h"

/**
 * Receives replies and faults from execution units.
 * Called on the unit's own thread.
 */
class UnitListener {
public:
    virtual ~UnitListener() = default;
    virtual void onReply(quint64 unitId, ReplyMessage reply) = 0;
    virtual void onFault(quint64 unitId, const QString& error) = 0;
};

/**
 * One isolated execution unit.
 *
 * The unit runs its own thread with a private inbox and creates its own
 * TaskHandler on that thread, so nothing mutable is shared with the
 * orchestrator. Messages are processed strictly in arrival order.
 */
class WorkerUnit : public QThread
{
public:
    WorkerUnit(quint64 unitId, TaskHandlerFactory factory, UnitListener* listener, QObject *parent = nullptr);
    ~WorkerUnit();

    /**
     * Queue a message for this unit
     * @return false if the unit has faulted or is stopping
     */
    bool post(TaskMessage message);

    /**
     * Ask the loop to exit after the current message. Queued messages are dropped.
     */
    void stop();

    quint64 unitId() const { return m_unitId; }
    bool isAlive() const { return m_alive.load(); }
    bool isWarmedUp() const { return m_warmedUp.load(); }

protected:
    void run() override;

private:
    /**
     * Handle one message
     * @return false if the unit faulted and must exit
     */
    bool handle(TaskHandler& handler, TaskMessage& message);
    void fault(const QString& error);
    void reply(ReplyMessage reply);

    const quint64 m_unitId;
    TaskHandlerFactory m_factory;
    UnitListener* m_listener;

    QMutex m_mutex;
    QWaitCondition m_condition;
    std::deque<TaskMessage> m_inbox;
    bool m_shouldStop;

    std::atomic<bool> m_alive;
    std::atomic<bool> m_warmedUp;
};

#endif // WORKERUNIT_H
