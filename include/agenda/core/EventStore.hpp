#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <QDate>
#include <QString>

#include "agenda/data/Event.hpp"

namespace agenda {
namespace data {
class EventRepository;
}

namespace core {

class PersistenceQueue;

class EventStore
{
public:
    enum class State
    {
        Uninitialized,
        Loading,
        Ready,
        Failed,
    };

    using Listener = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    explicit EventStore(data::EventRepository &repository);
    ~EventStore();

    EventStore(const EventStore &) = delete;
    EventStore &operator=(const EventStore &) = delete;

    // Opens the backend, creates the schema and replaces the snapshot with
    // the persisted events. Throws StorageUnavailable on failure.
    void initialize();
    State state() const;

    std::vector<data::CalendarEvent> getAll() const;
    std::vector<data::CalendarEvent> getForDate(const QDate &date) const;
    std::vector<data::CalendarEvent> findByTitleSubstring(const QString &query) const;
    std::optional<data::CalendarEvent> getById(const QString &id) const;

    std::optional<data::CalendarEvent> create(const QString &title,
                                              const QDateTime &startTime,
                                              const QDateTime &endTime,
                                              const QString &description = QString());
    std::optional<data::CalendarEvent> updateById(const QString &id, const data::EventPatch &patch);
    std::optional<data::CalendarEvent> updateFirstByTitleSubstring(const QString &query,
                                                                   const data::EventPatch &patch);
    bool deleteById(const QString &id);
    bool deleteFirstByTitleSubstring(const QString &query);

    // Each call registers a new subscription, so the same callable added
    // twice is invoked twice per change.
    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);
    int subscriberCount() const;

    void flushPendingWrites();
    int pendingWriteCount() const;
    int failedWriteCount() const;

private:
    bool acceptsMutations(const char *operation) const;
    std::vector<data::CalendarEvent>::iterator findById(const QString &id);
    std::vector<data::CalendarEvent>::iterator findFirstByTitle(const QString &query);
    QString nextId();
    void notify();

    struct Subscription
    {
        SubscriptionId id;
        Listener listener;
    };

    data::EventRepository &m_repository;
    std::unique_ptr<PersistenceQueue> m_persistence;
    std::vector<data::CalendarEvent> m_events;
    std::vector<Subscription> m_subscriptions;
    SubscriptionId m_nextSubscriptionId = 1;
    qint64 m_lastIssuedId = 0;
    State m_state = State::Uninitialized;
};

} // namespace core
} // namespace agenda
