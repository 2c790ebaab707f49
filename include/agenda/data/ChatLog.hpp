#pragma once

#include <optional>
#include <vector>

#include <QString>

#include "agenda/data/Event.hpp"
#include "agenda/data/SqliteConnection.hpp"

namespace agenda {
namespace data {

struct ChatMessage
{
    enum class Role
    {
        User,
        Assistant,
    };

    Role role = Role::User;
    QString text;
    std::optional<std::vector<CalendarEvent>> events;

    bool isEventList() const { return events.has_value(); }
};

// Append-only chat transcript kept next to the events table.
class ChatLog
{
public:
    explicit ChatLog(QString databasePath);
    ~ChatLog();

    // Throws core::StorageUnavailable when the database cannot be opened.
    void initialize();

    bool append(ChatMessage::Role role, const QString &text);
    bool append(ChatMessage::Role role, const std::vector<CalendarEvent> &events);
    std::vector<ChatMessage> messages() const;
    bool clear();

private:
    bool insert(ChatMessage::Role role, const QString &content);

    SqliteConnection m_connection;
};

} // namespace data
} // namespace agenda
