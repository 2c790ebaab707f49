#include "agenda/data/ChatLog.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/StorageUnavailable.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

namespace agenda {
namespace data {

namespace {
const char *const CREATE_MESSAGES_TABLE =
    "CREATE TABLE IF NOT EXISTS messages ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "role TEXT NOT NULL, "
    "content TEXT NOT NULL, "
    "timestamp INTEGER NOT NULL)";

QString roleToString(ChatMessage::Role role)
{
    return role == ChatMessage::Role::Assistant ? QStringLiteral("assistant") : QStringLiteral("user");
}

ChatMessage::Role roleFromString(const QString &value)
{
    return value == QLatin1String("assistant") ? ChatMessage::Role::Assistant : ChatMessage::Role::User;
}

QJsonObject eventToJson(const CalendarEvent &event)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), event.id);
    object.insert(QStringLiteral("title"), event.title);
    object.insert(QStringLiteral("startTime"), event.startTime.toUTC().toString(Qt::ISODateWithMs));
    object.insert(QStringLiteral("endTime"), event.endTime.toUTC().toString(Qt::ISODateWithMs));
    if (!event.description.isNull()) {
        object.insert(QStringLiteral("description"), event.description);
    }
    return object;
}

CalendarEvent eventFromJson(const QJsonObject &object)
{
    CalendarEvent event;
    event.id = object.value(QStringLiteral("id")).toString();
    event.title = object.value(QStringLiteral("title")).toString();
    event.startTime = QDateTime::fromString(object.value(QStringLiteral("startTime")).toString(), Qt::ISODateWithMs)
                          .toLocalTime();
    event.endTime = QDateTime::fromString(object.value(QStringLiteral("endTime")).toString(), Qt::ISODateWithMs)
                        .toLocalTime();
    const QJsonValue description = object.value(QStringLiteral("description"));
    if (description.isString()) {
        event.description = description.toString();
    }
    return event;
}

ChatMessage decodeContent(ChatMessage::Role role, const QString &content)
{
    ChatMessage message;
    message.role = role;

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(content.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError) {
        message.text = content;
        return message;
    }
    if (document.isArray()) {
        std::vector<CalendarEvent> events;
        for (const QJsonValue &value : document.array()) {
            events.push_back(eventFromJson(value.toObject()));
        }
        message.events = std::move(events);
        return message;
    }
    const QJsonObject object = document.object();
    if (object.contains(QStringLiteral("text"))) {
        message.text = object.value(QStringLiteral("text")).toString();
    } else {
        message.text = content;
    }
    return message;
}
} // namespace

ChatLog::ChatLog(QString databasePath)
    : m_connection(std::move(databasePath))
{
}

ChatLog::~ChatLog() = default;

void ChatLog::initialize()
{
    if (!m_connection.open() || !m_connection.execute(QString::fromLatin1(CREATE_MESSAGES_TABLE))) {
        qCCritical(agendaChat, "Chat history unavailable: %s", qPrintable(m_connection.lastError()));
        throw core::StorageUnavailable(m_connection.lastError());
    }
}

bool ChatLog::append(ChatMessage::Role role, const QString &text)
{
    QJsonObject object;
    object.insert(QStringLiteral("text"), text);
    return insert(role, QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)));
}

bool ChatLog::append(ChatMessage::Role role, const std::vector<CalendarEvent> &events)
{
    QJsonArray array;
    for (const auto &event : events) {
        array.append(eventToJson(event));
    }
    return insert(role, QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact)));
}

std::vector<ChatMessage> ChatLog::messages() const
{
    std::vector<ChatMessage> result;
    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral("SELECT role, content FROM messages ORDER BY timestamp ASC, id ASC"))) {
        qCWarning(agendaChat, "Reading chat history failed: %s", qPrintable(query.lastError().text()));
        return result;
    }
    while (query.next()) {
        result.push_back(decodeContent(roleFromString(query.value(0).toString()), query.value(1).toString()));
    }
    return result;
}

bool ChatLog::clear()
{
    QSqlQuery query(m_connection.database());
    if (!query.exec(QStringLiteral("DELETE FROM messages"))) {
        qCWarning(agendaChat, "Clearing chat history failed: %s", qPrintable(query.lastError().text()));
        return false;
    }
    return true;
}

bool ChatLog::insert(ChatMessage::Role role, const QString &content)
{
    QSqlQuery query(m_connection.database());
    query.prepare(QStringLiteral("INSERT INTO messages (role, content, timestamp) VALUES (?, ?, ?)"));
    query.addBindValue(roleToString(role));
    query.addBindValue(content);
    query.addBindValue(QDateTime::currentMSecsSinceEpoch());
    if (!query.exec()) {
        qCWarning(agendaChat, "Saving chat message failed: %s", qPrintable(query.lastError().text()));
        return false;
    }
    return true;
}

} // namespace data
} // namespace agenda
