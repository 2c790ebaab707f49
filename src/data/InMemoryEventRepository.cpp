#include "agenda/data/InMemoryEventRepository.hpp"

#include <algorithm>

namespace agenda {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

bool InMemoryEventRepository::open()
{
    if (m_openFails) {
        m_lastError = QStringLiteral("in-memory backend configured to fail");
        return false;
    }
    m_open = true;
    m_lastError.clear();
    return true;
}

QString InMemoryEventRepository::lastError() const
{
    return m_lastError;
}

std::optional<std::vector<CalendarEvent>> InMemoryEventRepository::loadAll()
{
    if (!m_open) {
        m_lastError = QStringLiteral("backend not open");
        return std::nullopt;
    }
    return m_events;
}

bool InMemoryEventRepository::insertEvent(const CalendarEvent &event)
{
    ++m_writeCount;
    if (m_writesFail) {
        m_lastError = QStringLiteral("write rejected");
        return false;
    }
    if (find(event.id) != m_events.end()) {
        m_lastError = QStringLiteral("duplicate id %1").arg(event.id);
        return false;
    }
    m_events.push_back(event);
    return true;
}

bool InMemoryEventRepository::updateEvent(const CalendarEvent &event)
{
    ++m_writeCount;
    if (m_writesFail) {
        m_lastError = QStringLiteral("write rejected");
        return false;
    }
    auto it = find(event.id);
    if (it == m_events.end()) {
        m_lastError = QStringLiteral("unknown id %1").arg(event.id);
        return false;
    }
    *it = event;
    return true;
}

bool InMemoryEventRepository::removeEvent(const QString &id)
{
    ++m_writeCount;
    if (m_writesFail) {
        m_lastError = QStringLiteral("write rejected");
        return false;
    }
    auto it = find(id);
    if (it == m_events.end()) {
        return false;
    }
    m_events.erase(it);
    return true;
}

void InMemoryEventRepository::setOpenFails(bool fails)
{
    m_openFails = fails;
}

void InMemoryEventRepository::setWritesFail(bool fail)
{
    m_writesFail = fail;
}

bool InMemoryEventRepository::isOpen() const
{
    return m_open;
}

int InMemoryEventRepository::writeCount() const
{
    return m_writeCount;
}

const std::vector<CalendarEvent> &InMemoryEventRepository::events() const
{
    return m_events;
}

std::vector<CalendarEvent>::iterator InMemoryEventRepository::find(const QString &id)
{
    return std::find_if(m_events.begin(), m_events.end(), [&id](const CalendarEvent &event) {
        return event.id == id;
    });
}

} // namespace data
} // namespace agenda
