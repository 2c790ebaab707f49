#pragma once

#include <optional>
#include <vector>

#include <QString>

#include "agenda/data/Event.hpp"

namespace agenda {
namespace data {

// Durable backend of the event store.
class EventRepository
{
public:
    virtual ~EventRepository() = default;

    // Opens the backend and creates its schema if absent.
    virtual bool open() = 0;
    virtual QString lastError() const = 0;

    // All persisted events in insertion order, or nothing if the read failed.
    virtual std::optional<std::vector<CalendarEvent>> loadAll() = 0;
    virtual bool insertEvent(const CalendarEvent &event) = 0;
    virtual bool updateEvent(const CalendarEvent &event) = 0;
    virtual bool removeEvent(const QString &id) = 0;
};

} // namespace data
} // namespace agenda
