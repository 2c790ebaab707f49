#include "agenda/ui/viewmodels/CalendarViewModel.hpp"

namespace agenda {
namespace ui {

CalendarViewModel::CalendarViewModel(core::EventStore &store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
    m_subscription = m_store.subscribe([this]() { refresh(); });
    refresh();
}

CalendarViewModel::~CalendarViewModel()
{
    m_store.unsubscribe(m_subscription);
}

void CalendarViewModel::setSelectedDate(const QDate &date)
{
    if (!date.isValid() || date == m_selectedDate) {
        return;
    }
    m_selectedDate = date;
    refresh();
}

QDate CalendarViewModel::selectedDate() const
{
    return m_selectedDate;
}

void CalendarViewModel::refresh()
{
    m_markedDates.clear();
    for (const auto &event : m_store.getAll()) {
        m_markedDates.insert(event.startTime.toLocalTime().date());
    }
    if (m_selectedDate.isValid()) {
        m_events = m_store.getForDate(m_selectedDate);
    } else {
        m_events.clear();
    }
    emit eventsChanged();
}

const std::vector<data::CalendarEvent> &CalendarViewModel::events() const
{
    return m_events;
}

const QSet<QDate> &CalendarViewModel::markedDates() const
{
    return m_markedDates;
}

bool CalendarViewModel::isMarked(const QDate &date) const
{
    return m_markedDates.contains(date);
}

} // namespace ui
} // namespace agenda
