#include "agenda/core/AppContext.hpp"

#include "agenda/command/CommandDispatcher.hpp"
#include "agenda/core/EventStore.hpp"
#include "agenda/data/ChatLog.hpp"
#include "agenda/data/DataProvider.hpp"

namespace agenda {
namespace core {

AppContext::AppContext(const QString &databasePath)
    : m_dataProvider(std::make_unique<data::DataProvider>(databasePath))
    , m_eventStore(std::make_unique<EventStore>(m_dataProvider->eventRepository()))
    , m_commandDispatcher(std::make_unique<command::CommandDispatcher>(*m_eventStore))
{
}

AppContext::~AppContext() = default;

void AppContext::initialize()
{
    m_eventStore->initialize();
    m_dataProvider->chatLog().initialize();
}

EventStore &AppContext::eventStore()
{
    return *m_eventStore;
}

command::CommandDispatcher &AppContext::commandDispatcher()
{
    return *m_commandDispatcher;
}

data::ChatLog &AppContext::chatLog()
{
    return m_dataProvider->chatLog();
}

QString AppContext::databasePath() const
{
    return m_dataProvider->databasePath();
}

} // namespace core
} // namespace agenda
