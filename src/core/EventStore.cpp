#include "agenda/core/EventStore.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/PersistenceQueue.hpp"
#include "agenda/core/StorageUnavailable.hpp"
#include "agenda/data/EventRepository.hpp"

#include <algorithm>
#include <exception>

namespace agenda {
namespace core {

namespace {
const char *stateName(EventStore::State state)
{
    switch (state) {
    case EventStore::State::Uninitialized:
        return "uninitialized";
    case EventStore::State::Loading:
        return "loading";
    case EventStore::State::Ready:
        return "ready";
    case EventStore::State::Failed:
        return "failed";
    }
    return "unknown";
}
} // namespace

EventStore::EventStore(data::EventRepository &repository)
    : m_repository(repository)
    , m_persistence(std::make_unique<PersistenceQueue>(repository))
{
}

EventStore::~EventStore()
{
    if (m_state == State::Ready) {
        m_persistence->flush();
    }
}

void EventStore::initialize()
{
    if (m_state == State::Ready) {
        m_persistence->flush();
    }
    m_state = State::Loading;
    m_events.clear();

    if (!m_repository.open()) {
        m_state = State::Failed;
        const QString reason = m_repository.lastError();
        qCCritical(agendaStore, "Event storage unavailable: %s", qPrintable(reason));
        throw StorageUnavailable(reason);
    }

    auto loaded = m_repository.loadAll();
    if (!loaded) {
        m_state = State::Failed;
        const QString reason = m_repository.lastError();
        qCCritical(agendaStore, "Loading persisted events failed: %s", qPrintable(reason));
        throw StorageUnavailable(reason);
    }

    m_events = std::move(*loaded);
    for (const auto &event : m_events) {
        bool ok = false;
        const qint64 numericId = event.id.toLongLong(&ok);
        if (ok) {
            m_lastIssuedId = std::max(m_lastIssuedId, numericId);
        }
    }
    m_state = State::Ready;
    qCInfo(agendaStore, "Loaded %d events", static_cast<int>(m_events.size()));
    notify();
}

EventStore::State EventStore::state() const
{
    return m_state;
}

std::vector<data::CalendarEvent> EventStore::getAll() const
{
    return m_events;
}

std::vector<data::CalendarEvent> EventStore::getForDate(const QDate &date) const
{
    std::vector<data::CalendarEvent> result;
    for (const auto &event : m_events) {
        if (event.startTime.toLocalTime().date() == date) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<data::CalendarEvent> EventStore::findByTitleSubstring(const QString &query) const
{
    std::vector<data::CalendarEvent> result;
    for (const auto &event : m_events) {
        if (event.title.contains(query, Qt::CaseInsensitive)) {
            result.push_back(event);
        }
    }
    return result;
}

std::optional<data::CalendarEvent> EventStore::getById(const QString &id) const
{
    const auto it = std::find_if(m_events.cbegin(), m_events.cend(), [&id](const data::CalendarEvent &event) {
        return event.id == id;
    });
    if (it == m_events.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<data::CalendarEvent> EventStore::create(const QString &title,
                                                      const QDateTime &startTime,
                                                      const QDateTime &endTime,
                                                      const QString &description)
{
    if (!acceptsMutations("create")) {
        return std::nullopt;
    }

    data::CalendarEvent event;
    event.id = nextId();
    event.title = title;
    event.startTime = startTime;
    event.endTime = endTime;
    event.description = description;

    m_events.push_back(event);
    qCDebug(agendaStore, "Created event %s \"%s\"", qPrintable(event.id), qPrintable(event.title));
    // Queued before notify() so writes made by listeners land after this one.
    m_persistence->enqueueInsert(event);
    notify();
    return event;
}

std::optional<data::CalendarEvent> EventStore::updateById(const QString &id, const data::EventPatch &patch)
{
    if (!acceptsMutations("update")) {
        return std::nullopt;
    }
    auto it = findById(id);
    if (it == m_events.end()) {
        return std::nullopt;
    }

    patch.applyTo(*it);
    const data::CalendarEvent updated = *it;
    qCDebug(agendaStore, "Updated event %s", qPrintable(updated.id));
    m_persistence->enqueueUpdate(updated);
    notify();
    return updated;
}

std::optional<data::CalendarEvent> EventStore::updateFirstByTitleSubstring(const QString &query,
                                                                           const data::EventPatch &patch)
{
    if (!acceptsMutations("update")) {
        return std::nullopt;
    }
    const auto it = findFirstByTitle(query);
    if (it == m_events.end()) {
        return std::nullopt;
    }
    return updateById(it->id, patch);
}

bool EventStore::deleteById(const QString &id)
{
    if (!acceptsMutations("delete")) {
        return false;
    }
    const auto it = findById(id);
    if (it == m_events.end()) {
        return false;
    }

    const QString removedId = it->id;
    m_events.erase(it);
    qCDebug(agendaStore, "Deleted event %s", qPrintable(removedId));
    m_persistence->enqueueRemove(removedId);
    notify();
    return true;
}

bool EventStore::deleteFirstByTitleSubstring(const QString &query)
{
    if (!acceptsMutations("delete")) {
        return false;
    }
    const auto it = findFirstByTitle(query);
    if (it == m_events.end()) {
        return false;
    }
    return deleteById(it->id);
}

EventStore::SubscriptionId EventStore::subscribe(Listener listener)
{
    const SubscriptionId id = m_nextSubscriptionId++;
    m_subscriptions.push_back({id, std::move(listener)});
    return id;
}

bool EventStore::unsubscribe(SubscriptionId id)
{
    const auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(), [id](const Subscription &sub) {
        return sub.id == id;
    });
    if (it == m_subscriptions.end()) {
        return false;
    }
    m_subscriptions.erase(it);
    return true;
}

int EventStore::subscriberCount() const
{
    return static_cast<int>(m_subscriptions.size());
}

void EventStore::flushPendingWrites()
{
    m_persistence->flush();
}

int EventStore::pendingWriteCount() const
{
    return m_persistence->pendingCount();
}

int EventStore::failedWriteCount() const
{
    return m_persistence->failedCount();
}

bool EventStore::acceptsMutations(const char *operation) const
{
    if (m_state == State::Ready) {
        return true;
    }
    qCCritical(agendaStore, "Refusing %s: store is %s", operation, stateName(m_state));
    return false;
}

std::vector<data::CalendarEvent>::iterator EventStore::findById(const QString &id)
{
    return std::find_if(m_events.begin(), m_events.end(), [&id](const data::CalendarEvent &event) {
        return event.id == id;
    });
}

std::vector<data::CalendarEvent>::iterator EventStore::findFirstByTitle(const QString &query)
{
    return std::find_if(m_events.begin(), m_events.end(), [&query](const data::CalendarEvent &event) {
        return event.title.contains(query, Qt::CaseInsensitive);
    });
}

QString EventStore::nextId()
{
    qint64 candidate = std::max(QDateTime::currentMSecsSinceEpoch(), m_lastIssuedId + 1);
    while (findById(QString::number(candidate)) != m_events.end()) {
        ++candidate;
    }
    m_lastIssuedId = candidate;
    return QString::number(candidate);
}

void EventStore::notify()
{
    // Listeners may subscribe or unsubscribe while being notified.
    const std::vector<Subscription> subscriptions = m_subscriptions;
    for (const auto &subscription : subscriptions) {
        if (!subscription.listener) {
            continue;
        }
        try {
            subscription.listener();
        } catch (const std::exception &e) {
            qCWarning(agendaStore, "Listener %llu threw: %s",
                      static_cast<unsigned long long>(subscription.id), e.what());
        } catch (...) {
            qCWarning(agendaStore, "Listener %llu threw a non-standard exception",
                      static_cast<unsigned long long>(subscription.id));
        }
    }
}

} // namespace core
} // namespace agenda
