#pragma once

#include <QDate>
#include <QObject>
#include <QSet>
#include <vector>

#include "agenda/core/EventStore.hpp"
#include "agenda/data/Event.hpp"

namespace agenda {
namespace ui {

// Keeps the month markers and the selected day's events in sync with the store.
class CalendarViewModel : public QObject
{
    Q_OBJECT

public:
    explicit CalendarViewModel(core::EventStore &store, QObject *parent = nullptr);
    ~CalendarViewModel() override;

    void setSelectedDate(const QDate &date);
    QDate selectedDate() const;

    void refresh();
    const std::vector<data::CalendarEvent> &events() const;
    const QSet<QDate> &markedDates() const;
    bool isMarked(const QDate &date) const;

signals:
    void eventsChanged();

private:
    core::EventStore &m_store;
    core::EventStore::SubscriptionId m_subscription = 0;
    QDate m_selectedDate;
    std::vector<data::CalendarEvent> m_events;
    QSet<QDate> m_markedDates;
};

} // namespace ui
} // namespace agenda
