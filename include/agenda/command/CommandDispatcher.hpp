#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>

#include "agenda/command/Command.hpp"
#include "agenda/data/Event.hpp"

namespace agenda {
namespace core {
class EventStore;
}

namespace command {

// Outcome of one dispatch: either a message or an event list.
struct CommandResult
{
    enum class Status
    {
        Success,
        ValidationFailure,
        NotFound,
        UnknownCommand,
        StorageUnavailable,
    };

    Status status = Status::Success;
    QString message;
    std::optional<std::vector<data::CalendarEvent>> events;

    bool isEventList() const { return events.has_value(); }
    bool succeeded() const { return status == Status::Success; }

    static CommandResult text(Status status, QString message);
    static CommandResult eventList(std::vector<data::CalendarEvent> events);
};

class CommandDispatcher
{
public:
    explicit CommandDispatcher(core::EventStore &store);

    CommandResult dispatch(const Command &command);

    // Accepts ISO 8601 date-times; text without an offset is local time.
    static QDateTime parseTimestamp(const QString &value);

private:
    CommandResult createEvent(const Command &command);
    CommandResult readEvents(const Command &command);
    CommandResult updateEvent(const Command &command);
    CommandResult deleteEvent(const Command &command);

    core::EventStore &m_store;
};

} // namespace command
} // namespace agenda
