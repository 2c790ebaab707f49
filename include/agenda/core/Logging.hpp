#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(agendaStore)
Q_DECLARE_LOGGING_CATEGORY(agendaPersistence)
Q_DECLARE_LOGGING_CATEGORY(agendaSql)
Q_DECLARE_LOGGING_CATEGORY(agendaCommand)
Q_DECLARE_LOGGING_CATEGORY(agendaChat)
Q_DECLARE_LOGGING_CATEGORY(agendaApp)
