#pragma once

#include <vector>

#include "agenda/data/EventRepository.hpp"

namespace agenda {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    bool open() override;
    QString lastError() const override;
    std::optional<std::vector<CalendarEvent>> loadAll() override;
    bool insertEvent(const CalendarEvent &event) override;
    bool updateEvent(const CalendarEvent &event) override;
    bool removeEvent(const QString &id) override;

    void setOpenFails(bool fails);
    void setWritesFail(bool fail);
    bool isOpen() const;
    int writeCount() const;
    const std::vector<CalendarEvent> &events() const;

private:
    std::vector<CalendarEvent>::iterator find(const QString &id);

    std::vector<CalendarEvent> m_events;
    QString m_lastError;
    bool m_open = false;
    bool m_openFails = false;
    bool m_writesFail = false;
    int m_writeCount = 0;
};

} // namespace data
} // namespace agenda
