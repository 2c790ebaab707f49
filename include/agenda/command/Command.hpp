#pragma once

#include <QHash>
#include <QString>

namespace agenda {
namespace command {

enum class CommandKind
{
    CreateEvent,
    ReadEvents,
    UpdateEvent,
    DeleteEvent,
    Unknown,
};

// A command as extracted from model output. The name is kept verbatim even
// when it is not one the dispatcher knows.
struct Command
{
    QString name;
    QHash<QString, QString> params;

    CommandKind kind() const;
    QString param(const QString &key) const { return params.value(key); }
};

CommandKind commandKindFromName(const QString &name);
QString commandName(CommandKind kind);

} // namespace command
} // namespace agenda
