#include "agenda/data/SqlEventRepository.hpp"

#include "agenda/core/Logging.hpp"

#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

namespace agenda {
namespace data {

namespace {
const char *const CREATE_EVENTS_TABLE =
    "CREATE TABLE IF NOT EXISTS events ("
    "id TEXT PRIMARY KEY NOT NULL, "
    "title TEXT NOT NULL, "
    "startTime INTEGER NOT NULL, "
    "endTime INTEGER NOT NULL, "
    "description TEXT)";

QVariant nullableText(const QString &value)
{
    if (value.isNull()) {
        return QVariant(QVariant::String);
    }
    return value;
}
} // namespace

SqlEventRepository::SqlEventRepository(QString databasePath)
    : m_connection(std::move(databasePath))
{
}

SqlEventRepository::~SqlEventRepository() = default;

bool SqlEventRepository::open()
{
    if (!m_connection.open() || !m_connection.execute(QString::fromLatin1(CREATE_EVENTS_TABLE))) {
        m_lastError = m_connection.lastError();
        return false;
    }
    return true;
}

QString SqlEventRepository::lastError() const
{
    return m_lastError;
}

std::optional<std::vector<CalendarEvent>> SqlEventRepository::loadAll()
{
    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral("SELECT id, title, startTime, endTime, description FROM events ORDER BY rowid"))) {
        m_lastError = query.lastError().text();
        qCCritical(agendaSql, "Loading events failed: %s", qPrintable(m_lastError));
        return std::nullopt;
    }

    std::vector<CalendarEvent> events;
    while (query.next()) {
        CalendarEvent event;
        event.id = query.value(0).toString();
        event.title = query.value(1).toString();
        event.startTime = QDateTime::fromMSecsSinceEpoch(query.value(2).toLongLong());
        event.endTime = QDateTime::fromMSecsSinceEpoch(query.value(3).toLongLong());
        const QVariant description = query.value(4);
        if (!description.isNull()) {
            event.description = description.toString();
        }
        events.push_back(std::move(event));
    }
    return events;
}

bool SqlEventRepository::insertEvent(const CalendarEvent &event)
{
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral(
        "INSERT INTO events (id, title, startTime, endTime, description) VALUES (?, ?, ?, ?, ?)"));
    query.addBindValue(event.id);
    query.addBindValue(event.title);
    query.addBindValue(event.startTime.toMSecsSinceEpoch());
    query.addBindValue(event.endTime.toMSecsSinceEpoch());
    query.addBindValue(nullableText(event.description));
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        return false;
    }
    return true;
}

bool SqlEventRepository::updateEvent(const CalendarEvent &event)
{
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral(
        "UPDATE events SET title = ?, startTime = ?, endTime = ?, description = ? WHERE id = ?"));
    query.addBindValue(event.title);
    query.addBindValue(event.startTime.toMSecsSinceEpoch());
    query.addBindValue(event.endTime.toMSecsSinceEpoch());
    query.addBindValue(nullableText(event.description));
    query.addBindValue(event.id);
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        return false;
    }
    if (query.numRowsAffected() == 0) {
        m_lastError = QStringLiteral("no row with id %1").arg(event.id);
        return false;
    }
    return true;
}

bool SqlEventRepository::removeEvent(const QString &id)
{
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("DELETE FROM events WHERE id = ?"));
    query.addBindValue(id);
    if (!query.exec()) {
        m_lastError = query.lastError().text();
        return false;
    }
    return true;
}

} // namespace data
} // namespace agenda
