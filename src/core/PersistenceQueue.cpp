#include "agenda/core/PersistenceQueue.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/EventRepository.hpp"

#include <QTimer>

namespace agenda {
namespace core {

PersistenceQueue::PersistenceQueue(data::EventRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
{
}

PersistenceQueue::~PersistenceQueue()
{
    if (!m_pending.isEmpty()) {
        qCWarning(agendaPersistence, "Dropping %d unwritten changes", m_pending.size());
    }
}

void PersistenceQueue::enqueueInsert(const data::CalendarEvent &event)
{
    enqueue({Operation::Insert, event});
}

void PersistenceQueue::enqueueUpdate(const data::CalendarEvent &event)
{
    enqueue({Operation::Update, event});
}

void PersistenceQueue::enqueueRemove(const QString &id)
{
    data::CalendarEvent event;
    event.id = id;
    enqueue({Operation::Remove, std::move(event)});
}

void PersistenceQueue::flush()
{
    m_flushScheduled = false;
    while (!m_pending.isEmpty()) {
        const PendingWrite write = m_pending.dequeue();
        if (!apply(write)) {
            ++m_failed;
            const QString reason = m_repository.lastError();
            qCWarning(agendaPersistence, "Durable write for event %s failed, snapshot kept: %s",
                      qPrintable(write.event.id), qPrintable(reason));
            emit writeFailed(write.event.id, reason);
        }
    }
}

int PersistenceQueue::pendingCount() const
{
    return m_pending.size();
}

int PersistenceQueue::failedCount() const
{
    return m_failed;
}

void PersistenceQueue::enqueue(PendingWrite write)
{
    m_pending.enqueue(std::move(write));
    if (m_flushScheduled) {
        return;
    }
    m_flushScheduled = true;
    QTimer::singleShot(0, this, &PersistenceQueue::flush);
}

bool PersistenceQueue::apply(const PendingWrite &write)
{
    switch (write.operation) {
    case Operation::Insert:
        return m_repository.insertEvent(write.event);
    case Operation::Update:
        return m_repository.updateEvent(write.event);
    case Operation::Remove:
        return m_repository.removeEvent(write.event.id);
    }
    return false;
}

} // namespace core
} // namespace agenda
