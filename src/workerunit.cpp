#include "workerunit.h"
#include <QDebug>
#include <QMutexLocker>
#include <new>

WorkerUnit::WorkerUnit(quint64 unitId, TaskHandlerFactory factory, UnitListener* listener, QObject *parent)
    : QThread(parent),
      m_unitId(unitId),
      m_factory(std::move(factory)),
      m_listener(listener),
      m_shouldStop(false),
      m_alive(true),
      m_warmedUp(false)
{
}

WorkerUnit::~WorkerUnit()
{
    stop();
    wait();
}

bool WorkerUnit::post(TaskMessage message)
{
    QMutexLocker locker(&m_mutex);
    if (!m_alive.load() || m_shouldStop) {
        return false;
    }
    m_inbox.push_back(std::move(message));
    m_condition.wakeOne();
    return true;
}

void WorkerUnit::stop()
{
    QMutexLocker locker(&m_mutex);
    m_shouldStop = true;
    m_condition.wakeAll();
}

void WorkerUnit::run()
{
    std::unique_ptr<TaskHandler> handler;
    try {
        handler = m_factory();
    } catch (const std::exception& e) {
        fault(QString("Handler construction failed: %1").arg(QString::fromUtf8(e.what())));
        return;
    }
    if (!handler) {
        fault("Handler factory returned nothing");
        return;
    }

    qDebug() << "WorkerUnit: Unit" << m_unitId << "started";

    forever {
        TaskMessage message;
        {
            QMutexLocker locker(&m_mutex);
            while (m_inbox.empty() && !m_shouldStop) {
                m_condition.wait(&m_mutex);
            }
            if (m_shouldStop) {
                break;
            }
            message = std::move(m_inbox.front());
            m_inbox.pop_front();
        }

        if (!handle(*handler, message)) {
            return;
        }
    }

    qDebug() << "WorkerUnit: Unit" << m_unitId << "stopped";
}

bool WorkerUnit::handle(TaskHandler& handler, TaskMessage& message)
{
    if (message.type == TaskType::Warmup) {
        ReplyMessage warmupReply;
        warmupReply.warmupComplete = true;
        try {
            handler.warmup();
            m_warmedUp = true;
            warmupReply.success = true;
        } catch (const FatalUnitError& e) {
            fault(QString::fromUtf8(e.what()));
            return false;
        } catch (const std::bad_alloc&) {
            fault("Out of memory during warmup");
            return false;
        } catch (const std::exception& e) {
            // Codecs will be loaded on first use instead
            qWarning() << "WorkerUnit: Unit" << m_unitId << "warmup failed:" << e.what();
            warmupReply.error = e.what();
        }
        reply(std::move(warmupReply));
        return true;
    }

    ReplyMessage taskReply;
    taskReply.id = message.id;
    try {
        taskReply.result = handler.process(message);
        taskReply.success = true;
    } catch (const FatalUnitError& e) {
        fault(QString::fromUtf8(e.what()));
        return false;
    } catch (const std::bad_alloc&) {
        fault("Out of memory");
        return false;
    } catch (const std::exception& e) {
        taskReply.success = false;
        taskReply.error = e.what();
    }
    reply(std::move(taskReply));
    return true;
}

void WorkerUnit::fault(const QString& error)
{
    {
        QMutexLocker locker(&m_mutex);
        m_alive = false;
        m_inbox.clear();
    }
    qWarning() << "WorkerUnit: Unit" << m_unitId << "faulted:" << error;
    if (m_listener) {
        m_listener->onFault(m_unitId, error);
    }
}

void WorkerUnit::reply(ReplyMessage reply)
{
    if (m_listener) {
        m_listener->onReply(m_unitId, std::move(reply));
    }
}
