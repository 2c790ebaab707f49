#include <QtTest/QtTest>

#include <set>
#include <stdexcept>
#include <vector>

#include "agenda/core/EventStore.hpp"
#include "agenda/core/StorageUnavailable.hpp"
#include "agenda/data/InMemoryEventRepository.hpp"

using namespace agenda;

namespace {
QDateTime at(int day, int hour)
{
    return QDateTime(QDate(2025, 1, day), QTime(hour, 0));
}
} // namespace

class EventStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void createThenGetById();
    void findByTitleIsCaseInsensitive();
    void getForDateMatchesLocalDay();
    void updateByIdKeepsOtherFields();
    void updateFirstByTitleTargetsFirstMatch();
    void deleteByIdRemovesEvent();
    void deleteFirstByTitle();
    void initializeLoadsPersistedEvents();
    void initializeNotifiesListeners();
    void failedOpenThrowsAndRefusesMutations();
    void mutationsRefusedBeforeInitialize();
    void listenersRunInRegistrationOrder();
    void duplicateRegistrationIsInvokedTwice();
    void unsubscribeStopsNotifications();
    void throwingListenerDoesNotBlockOthers();
    void writesArePersistedOnNextTurn();
    void failedWriteKeepsSnapshot();
    void listenerDeleteDuringCreateIsPersistedLast();
    void listenerUpdateDuringUpdateIsPersistedLast();
    void idsNeverCollide();
};

void EventStoreTest::createThenGetById()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    const auto created = store.create(QStringLiteral("Lunch"), at(1, 12), at(1, 13), QStringLiteral("Canteen"));
    QVERIFY(created.has_value());
    QVERIFY(!created->id.isEmpty());

    const auto fetched = store.getById(created->id);
    QVERIFY(fetched.has_value());
    QVERIFY(*fetched == *created);
    QCOMPARE(fetched->description, QStringLiteral("Canteen"));
    QVERIFY(!store.getById(QStringLiteral("missing")).has_value());
}

void EventStoreTest::findByTitleIsCaseInsensitive()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    store.create(QStringLiteral("Weekly Team Sync Call"), at(1, 9), at(1, 10));
    store.create(QStringLiteral("Lunch"), at(1, 12), at(1, 13));
    store.create(QStringLiteral("team dinner"), at(2, 19), at(2, 21));

    const auto matches = store.findByTitleSubstring(QStringLiteral("TEAM"));
    QCOMPARE(matches.size(), static_cast<size_t>(2));
    QCOMPARE(matches[0].title, QStringLiteral("Weekly Team Sync Call"));
    QCOMPARE(matches[1].title, QStringLiteral("team dinner"));

    QCOMPARE(store.findByTitleSubstring(QString()).size(), static_cast<size_t>(3));
    QVERIFY(store.findByTitleSubstring(QStringLiteral("breakfast")).empty());
}

void EventStoreTest::getForDateMatchesLocalDay()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    store.create(QStringLiteral("Early"), QDateTime(QDate(2025, 1, 1), QTime(0, 5)), at(1, 1));
    store.create(QStringLiteral("Late"), QDateTime(QDate(2025, 1, 1), QTime(23, 55)), at(2, 1));
    store.create(QStringLiteral("Next day"), at(2, 9), at(2, 10));

    const auto events = store.getForDate(QDate(2025, 1, 1));
    QCOMPARE(events.size(), static_cast<size_t>(2));
    QCOMPARE(events[0].title, QStringLiteral("Early"));
    QCOMPARE(events[1].title, QStringLiteral("Late"));
    QVERIFY(store.getForDate(QDate(2025, 1, 3)).empty());
}

void EventStoreTest::updateByIdKeepsOtherFields()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    const auto created = store.create(QStringLiteral("Lunch"), at(1, 12), at(1, 13), QStringLiteral("Canteen"));
    data::EventPatch patch;
    patch.title = QStringLiteral("Lunch with Bob");

    const auto updated = store.updateById(created->id, patch);
    QVERIFY(updated.has_value());

    const auto fetched = store.getById(created->id);
    QCOMPARE(fetched->title, QStringLiteral("Lunch with Bob"));
    QCOMPARE(fetched->id, created->id);
    QCOMPARE(fetched->startTime, created->startTime);
    QCOMPARE(fetched->endTime, created->endTime);
    QCOMPARE(fetched->description, created->description);

    QVERIFY(!store.updateById(QStringLiteral("missing"), patch).has_value());
}

void EventStoreTest::updateFirstByTitleTargetsFirstMatch()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    const auto first = store.create(QStringLiteral("Standup A"), at(1, 9), at(1, 10));
    const auto second = store.create(QStringLiteral("Standup B"), at(2, 9), at(2, 10));

    data::EventPatch patch;
    patch.startTime = at(1, 8);
    const auto updated = store.updateFirstByTitleSubstring(QStringLiteral("standup"), patch);
    QVERIFY(updated.has_value());
    QCOMPARE(updated->id, first->id);
    QCOMPARE(store.getById(first->id)->startTime, at(1, 8));
    QCOMPARE(store.getById(second->id)->startTime, at(2, 9));

    QVERIFY(!store.updateFirstByTitleSubstring(QStringLiteral("retro"), patch).has_value());
}

void EventStoreTest::deleteByIdRemovesEvent()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    const auto created = store.create(QStringLiteral("Dentist"), at(3, 15), at(3, 16));
    QVERIFY(store.deleteById(created->id));
    QVERIFY(!store.getById(created->id).has_value());
    QVERIFY(store.getAll().empty());
    QVERIFY(!store.deleteById(created->id));
}

void EventStoreTest::deleteFirstByTitle()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    store.create(QStringLiteral("Gym"), at(1, 7), at(1, 8));
    store.create(QStringLiteral("Gym class"), at(2, 7), at(2, 8));

    QVERIFY(store.deleteFirstByTitleSubstring(QStringLiteral("gym")));
    const auto remaining = store.getAll();
    QCOMPARE(remaining.size(), static_cast<size_t>(1));
    QCOMPARE(remaining.front().title, QStringLiteral("Gym class"));
    QVERIFY(!store.deleteFirstByTitleSubstring(QStringLiteral("yoga")));
}

void EventStoreTest::initializeLoadsPersistedEvents()
{
    data::InMemoryEventRepository repo;
    QVERIFY(repo.open());
    data::CalendarEvent persisted;
    persisted.id = QStringLiteral("1700000000000");
    persisted.title = QStringLiteral("Persisted");
    persisted.startTime = at(5, 10);
    persisted.endTime = at(5, 11);
    QVERIFY(repo.insertEvent(persisted));

    core::EventStore store(repo);
    QCOMPARE(store.state(), core::EventStore::State::Uninitialized);
    store.initialize();
    QCOMPARE(store.state(), core::EventStore::State::Ready);

    const auto all = store.getAll();
    QCOMPARE(all.size(), static_cast<size_t>(1));
    QVERIFY(all.front() == persisted);
}

void EventStoreTest::initializeNotifiesListeners()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    int calls = 0;
    store.subscribe([&calls]() { ++calls; });
    store.initialize();
    QCOMPARE(calls, 1);
}

void EventStoreTest::failedOpenThrowsAndRefusesMutations()
{
    data::InMemoryEventRepository repo;
    repo.setOpenFails(true);
    core::EventStore store(repo);
    int calls = 0;
    store.subscribe([&calls]() { ++calls; });

    QVERIFY_EXCEPTION_THROWN(store.initialize(), core::StorageUnavailable);
    QCOMPARE(store.state(), core::EventStore::State::Failed);
    QVERIFY(!store.create(QStringLiteral("Lost"), at(1, 9), at(1, 10)).has_value());
    QVERIFY(store.getAll().empty());
    QCOMPARE(calls, 0);
    QCOMPARE(repo.writeCount(), 0);
}

void EventStoreTest::mutationsRefusedBeforeInitialize()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);

    QVERIFY(store.getAll().empty());
    QVERIFY(!store.create(QStringLiteral("Too early"), at(1, 9), at(1, 10)).has_value());
    QVERIFY(!store.deleteFirstByTitleSubstring(QStringLiteral("Too")));
    QCOMPARE(store.pendingWriteCount(), 0);
}

void EventStoreTest::listenersRunInRegistrationOrder()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    std::vector<int> order;
    store.subscribe([&order]() { order.push_back(1); });
    store.subscribe([&order]() { order.push_back(2); });
    store.subscribe([&order]() { order.push_back(3); });

    store.create(QStringLiteral("Call"), at(1, 9), at(1, 10));
    QVERIFY(order == std::vector<int>({1, 2, 3}));
}

void EventStoreTest::duplicateRegistrationIsInvokedTwice()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    int calls = 0;
    const core::EventStore::Listener listener = [&calls]() { ++calls; };
    const auto first = store.subscribe(listener);
    const auto second = store.subscribe(listener);
    QVERIFY(first != second);

    store.create(QStringLiteral("Call"), at(1, 9), at(1, 10));
    QCOMPARE(calls, 2);

    QVERIFY(store.unsubscribe(first));
    store.create(QStringLiteral("Call again"), at(1, 11), at(1, 12));
    QCOMPARE(calls, 3);
}

void EventStoreTest::unsubscribeStopsNotifications()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    int calls = 0;
    const auto id = store.subscribe([&calls]() { ++calls; });
    QVERIFY(store.unsubscribe(id));
    QVERIFY(!store.unsubscribe(id));
    QCOMPARE(store.subscriberCount(), 0);

    store.create(QStringLiteral("Quiet"), at(1, 9), at(1, 10));
    QCOMPARE(calls, 0);
}

void EventStoreTest::throwingListenerDoesNotBlockOthers()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    int calls = 0;
    store.subscribe([]() { throw std::runtime_error("listener failure"); });
    store.subscribe([&calls]() { ++calls; });

    const auto created = store.create(QStringLiteral("Still there"), at(1, 9), at(1, 10));
    QVERIFY(created.has_value());
    QCOMPARE(calls, 1);
    QCOMPARE(store.getAll().size(), static_cast<size_t>(1));
}

void EventStoreTest::writesArePersistedOnNextTurn()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    const auto created = store.create(QStringLiteral("Review"), at(1, 9), at(1, 10));
    QVERIFY(repo.events().empty());
    QCOMPARE(store.pendingWriteCount(), 1);

    QTRY_COMPARE(static_cast<int>(repo.events().size()), 1);
    QCOMPARE(repo.events().front().id, created->id);

    data::EventPatch patch;
    patch.description = QStringLiteral("Bring notes");
    store.updateById(created->id, patch);
    store.deleteById(created->id);
    store.flushPendingWrites();
    QVERIFY(repo.events().empty());
    QCOMPARE(store.failedWriteCount(), 0);
}

void EventStoreTest::failedWriteKeepsSnapshot()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();
    repo.setWritesFail(true);

    const auto created = store.create(QStringLiteral("Unsaved"), at(1, 9), at(1, 10));
    QVERIFY(created.has_value());
    store.flushPendingWrites();

    QCOMPARE(store.failedWriteCount(), 1);
    QVERIFY(store.getById(created->id).has_value());
    QVERIFY(repo.events().empty());
}

void EventStoreTest::listenerDeleteDuringCreateIsPersistedLast()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    store.subscribe([&store]() {
        for (const auto &event : store.findByTitleSubstring(QStringLiteral("Spam"))) {
            store.deleteById(event.id);
        }
    });

    store.create(QStringLiteral("Spam"), at(1, 9), at(1, 10));
    QVERIFY(store.getAll().empty());

    store.flushPendingWrites();
    QVERIFY(repo.events().empty());
    QCOMPARE(store.failedWriteCount(), 0);
}

void EventStoreTest::listenerUpdateDuringUpdateIsPersistedLast()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();
    const auto created = store.create(QStringLiteral("Standup"), at(1, 9), at(1, 10));
    store.flushPendingWrites();

    const QString id = created->id;
    store.subscribe([&store, id]() {
        const auto current = store.getById(id);
        if (current && current->description != QStringLiteral("Tagged")) {
            data::EventPatch tag;
            tag.description = QStringLiteral("Tagged");
            store.updateById(id, tag);
        }
    });

    data::EventPatch patch;
    patch.title = QStringLiteral("Daily standup");
    store.updateById(id, patch);
    store.flushPendingWrites();

    QCOMPARE(repo.events().size(), static_cast<size_t>(1));
    QCOMPARE(store.getAll().size(), static_cast<size_t>(1));
    QVERIFY(repo.events().front() == store.getAll().front());
    QCOMPARE(repo.events().front().title, QStringLiteral("Daily standup"));
    QCOMPARE(repo.events().front().description, QStringLiteral("Tagged"));
}

void EventStoreTest::idsNeverCollide()
{
    data::InMemoryEventRepository repo;
    core::EventStore store(repo);
    store.initialize();

    std::set<QString> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(store.create(QStringLiteral("Burst %1").arg(i), at(1, 9), at(1, 10))->id);
    }
    QCOMPARE(ids.size(), static_cast<size_t>(50));
}

QTEST_GUILESS_MAIN(EventStoreTest)
#include "EventStoreTest.moc"
