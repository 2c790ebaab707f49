#pragma once

#include <memory>

#include <QString>

namespace agenda {
namespace data {
class DataProvider;
class ChatLog;
}

namespace command {
class CommandDispatcher;
}

namespace core {

class EventStore;

// Owns the long-lived services and hands them out by reference.
class AppContext
{
public:
    explicit AppContext(const QString &databasePath = QString());
    ~AppContext();

    // Throws StorageUnavailable when the event or chat storage cannot be opened.
    void initialize();

    EventStore &eventStore();
    command::CommandDispatcher &commandDispatcher();
    data::ChatLog &chatLog();
    QString databasePath() const;

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<EventStore> m_eventStore;
    std::unique_ptr<command::CommandDispatcher> m_commandDispatcher;
};

} // namespace core
} // namespace agenda
