#pragma once

#include <optional>

#include <QDateTime>
#include <QString>

namespace agenda {
namespace data {

struct CalendarEvent
{
    QString id;
    QString title;
    QDateTime startTime;
    QDateTime endTime;
    QString description; // null when absent
};

inline bool operator==(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.startTime == rhs.startTime
        && lhs.endTime == rhs.endTime && lhs.description.isNull() == rhs.description.isNull()
        && lhs.description == rhs.description;
}

inline bool operator!=(const CalendarEvent &lhs, const CalendarEvent &rhs)
{
    return !(lhs == rhs);
}

// Partial update. The id is not part of it and can never change.
struct EventPatch
{
    std::optional<QString> title;
    std::optional<QDateTime> startTime;
    std::optional<QDateTime> endTime;
    std::optional<QString> description;

    bool isEmpty() const
    {
        return !title && !startTime && !endTime && !description;
    }

    void applyTo(CalendarEvent &event) const
    {
        if (title) {
            event.title = *title;
        }
        if (startTime) {
            event.startTime = *startTime;
        }
        if (endTime) {
            event.endTime = *endTime;
        }
        if (description) {
            event.description = *description;
        }
    }
};

} // namespace data
} // namespace agenda
