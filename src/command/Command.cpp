#include "agenda/command/Command.hpp"

namespace agenda {
namespace command {

CommandKind Command::kind() const
{
    return commandKindFromName(name);
}

CommandKind commandKindFromName(const QString &name)
{
    if (name == QLatin1String("CREATE_EVENT")) {
        return CommandKind::CreateEvent;
    }
    if (name == QLatin1String("READ_EVENTS")) {
        return CommandKind::ReadEvents;
    }
    if (name == QLatin1String("UPDATE_EVENT")) {
        return CommandKind::UpdateEvent;
    }
    if (name == QLatin1String("DELETE_EVENT")) {
        return CommandKind::DeleteEvent;
    }
    return CommandKind::Unknown;
}

QString commandName(CommandKind kind)
{
    switch (kind) {
    case CommandKind::CreateEvent:
        return QStringLiteral("CREATE_EVENT");
    case CommandKind::ReadEvents:
        return QStringLiteral("READ_EVENTS");
    case CommandKind::UpdateEvent:
        return QStringLiteral("UPDATE_EVENT");
    case CommandKind::DeleteEvent:
        return QStringLiteral("DELETE_EVENT");
    case CommandKind::Unknown:
        break;
    }
    return QString();
}

} // namespace command
} // namespace agenda
