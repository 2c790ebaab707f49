#include "agenda/core/Logging.hpp"

Q_LOGGING_CATEGORY(agendaStore, "agenda.store")
Q_LOGGING_CATEGORY(agendaPersistence, "agenda.persistence")
Q_LOGGING_CATEGORY(agendaSql, "agenda.sql")
Q_LOGGING_CATEGORY(agendaCommand, "agenda.command")
Q_LOGGING_CATEGORY(agendaChat, "agenda.chat")
Q_LOGGING_CATEGORY(agendaApp, "agenda.app")
