#pragma once

#include <QObject>
#include <QQueue>

#include "agenda/data/Event.hpp"

namespace agenda {
namespace data {
class EventRepository;
}

namespace core {

// Best-effort durable writes, drained in order on the next event-loop turn.
class PersistenceQueue : public QObject
{
    Q_OBJECT

public:
    explicit PersistenceQueue(data::EventRepository &repository, QObject *parent = nullptr);
    ~PersistenceQueue() override;

    void enqueueInsert(const data::CalendarEvent &event);
    void enqueueUpdate(const data::CalendarEvent &event);
    void enqueueRemove(const QString &id);

    void flush();
    int pendingCount() const;
    int failedCount() const;

signals:
    void writeFailed(const QString &eventId, const QString &reason);

private:
    enum class Operation
    {
        Insert,
        Update,
        Remove,
    };

    struct PendingWrite
    {
        Operation operation;
        data::CalendarEvent event;
    };

    void enqueue(PendingWrite write);
    bool apply(const PendingWrite &write);

    data::EventRepository &m_repository;
    QQueue<PendingWrite> m_pending;
    bool m_flushScheduled = false;
    int m_failed = 0;
};

} // namespace core
} // namespace agenda
