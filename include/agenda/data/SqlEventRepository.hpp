#pragma once

#include "agenda/data/EventRepository.hpp"
#include "agenda/data/SqliteConnection.hpp"

namespace agenda {
namespace data {

class SqlEventRepository : public EventRepository
{
public:
    explicit SqlEventRepository(QString databasePath);
    ~SqlEventRepository() override;

    bool open() override;
    QString lastError() const override;
    std::optional<std::vector<CalendarEvent>> loadAll() override;
    bool insertEvent(const CalendarEvent &event) override;
    bool updateEvent(const CalendarEvent &event) override;
    bool removeEvent(const QString &id) override;

private:
    SqliteConnection m_connection;
    QString m_lastError;
};

} // namespace data
} // namespace agenda
