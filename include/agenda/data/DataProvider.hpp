#pragma once

#include <memory>
#include <QString>

namespace agenda {
namespace data {

class EventRepository;
class ChatLog;

class DataProvider
{
public:
    // An empty path selects the configured or default database location.
    explicit DataProvider(const QString &databasePath = QString());
    ~DataProvider();

    EventRepository &eventRepository();
    ChatLog &chatLog();
    const QString &databasePath() const;

    static QString configuredDatabasePath();
    static QString defaultDatabasePath();

private:
    QString m_databasePath;
    std::unique_ptr<EventRepository> m_eventRepository;
    std::unique_ptr<ChatLog> m_chatLog;
};

} // namespace data
} // namespace agenda
