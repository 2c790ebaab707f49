#include "agenda/command/CommandDispatcher.hpp"

#include "agenda/core/EventStore.hpp"
#include "agenda/core/Logging.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>

namespace agenda {
namespace command {

namespace {
const QString TITLE = QStringLiteral("title");
const QString START_TIME = QStringLiteral("startTime");
const QString END_TIME = QStringLiteral("endTime");
const QString DESCRIPTION = QStringLiteral("description");
const QString UPDATES = QStringLiteral("updates");

bool isStoreReady(const core::EventStore &store)
{
    return store.state() == core::EventStore::State::Ready;
}

CommandResult storageUnavailable(const QString &action)
{
    return CommandResult::text(CommandResult::Status::StorageUnavailable,
                               QStringLiteral("%1 failed: the calendar storage is unavailable.").arg(action));
}

// Converts the JSON `updates` payload into a patch. Unknown keys are ignored.
std::optional<data::EventPatch> patchFromJson(const QString &json)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(json.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(agendaCommand, "Malformed updates payload: %s", qPrintable(error.errorString()));
        return std::nullopt;
    }

    data::EventPatch patch;
    const QJsonObject object = document.object();
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        const QString &key = it.key();
        const QJsonValue value = it.value();
        if (key == TITLE) {
            if (!value.isString()) {
                return std::nullopt;
            }
            patch.title = value.toString();
        } else if (key == DESCRIPTION) {
            if (value.isNull()) {
                patch.description = QString();
            } else if (value.isString()) {
                patch.description = value.toString();
            } else {
                return std::nullopt;
            }
        } else if (key == START_TIME || key == END_TIME) {
            const QDateTime timestamp = CommandDispatcher::parseTimestamp(value.toString());
            if (!value.isString() || !timestamp.isValid()) {
                return std::nullopt;
            }
            if (key == START_TIME) {
                patch.startTime = timestamp;
            } else {
                patch.endTime = timestamp;
            }
        } else {
            qCDebug(agendaCommand, "Ignoring update field %s", qPrintable(key));
        }
    }
    return patch;
}
} // namespace

CommandResult CommandResult::text(Status status, QString message)
{
    CommandResult result;
    result.status = status;
    result.message = std::move(message);
    return result;
}

CommandResult CommandResult::eventList(std::vector<data::CalendarEvent> events)
{
    CommandResult result;
    result.events = std::move(events);
    return result;
}

CommandDispatcher::CommandDispatcher(core::EventStore &store)
    : m_store(store)
{
}

CommandResult CommandDispatcher::dispatch(const Command &command)
{
    qCDebug(agendaCommand, "Dispatching %s", qPrintable(command.name));

    CommandResult result;
    switch (command.kind()) {
    case CommandKind::CreateEvent:
        result = createEvent(command);
        break;
    case CommandKind::ReadEvents:
        result = readEvents(command);
        break;
    case CommandKind::UpdateEvent:
        result = updateEvent(command);
        break;
    case CommandKind::DeleteEvent:
        result = deleteEvent(command);
        break;
    case CommandKind::Unknown:
        qCWarning(agendaCommand, "Unknown command %s", qPrintable(command.name));
        return CommandResult::text(CommandResult::Status::UnknownCommand,
                                   QStringLiteral("Unknown command: %1").arg(command.name));
    }

    if (result.succeeded()) {
        qCInfo(agendaCommand, "%s succeeded", qPrintable(command.name));
    } else {
        qCInfo(agendaCommand, "%s failed: %s", qPrintable(command.name), qPrintable(result.message));
    }
    return result;
}

QDateTime CommandDispatcher::parseTimestamp(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return QDateTime();
    }
    QDateTime timestamp = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!timestamp.isValid()) {
        timestamp = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    return timestamp;
}

CommandResult CommandDispatcher::createEvent(const Command &command)
{
    const QString title = command.param(TITLE);
    const QString start = command.param(START_TIME);
    const QString end = command.param(END_TIME);

    QStringList missing;
    if (title.isEmpty()) {
        missing << TITLE;
    }
    if (start.isEmpty()) {
        missing << START_TIME;
    }
    if (end.isEmpty()) {
        missing << END_TIME;
    }
    if (!missing.isEmpty()) {
        return CommandResult::text(CommandResult::Status::ValidationFailure,
                                   QStringLiteral("Create event failed: Missing required parameters: %1.")
                                       .arg(missing.join(QStringLiteral(", "))));
    }

    const QDateTime startTime = parseTimestamp(start);
    const QDateTime endTime = parseTimestamp(end);
    QStringList invalid;
    if (!startTime.isValid()) {
        invalid << START_TIME;
    }
    if (!endTime.isValid()) {
        invalid << END_TIME;
    }
    if (!invalid.isEmpty()) {
        return CommandResult::text(CommandResult::Status::ValidationFailure,
                                   QStringLiteral("Create event failed: %1 must be formatted as YYYY-MM-DDTHH:mm:ss.")
                                       .arg(invalid.join(QStringLiteral(", "))));
    }

    if (!isStoreReady(m_store)) {
        return storageUnavailable(QStringLiteral("Create event"));
    }

    QString description = command.param(DESCRIPTION);
    if (description.isNull()) {
        description = QStringLiteral("");
    }
    if (!m_store.create(title, startTime, endTime, description)) {
        return storageUnavailable(QStringLiteral("Create event"));
    }
    return CommandResult::text(CommandResult::Status::Success, QStringLiteral("Event created successfully."));
}

CommandResult CommandDispatcher::readEvents(const Command &command)
{
    const QString title = command.param(TITLE);
    if (title.isEmpty()) {
        return CommandResult::eventList(m_store.getAll());
    }
    return CommandResult::eventList(m_store.findByTitleSubstring(title));
}

CommandResult CommandDispatcher::updateEvent(const Command &command)
{
    const QString title = command.param(TITLE);
    const QString updates = command.param(UPDATES);
    if (title.isEmpty() || updates.isEmpty()) {
        return CommandResult::text(CommandResult::Status::ValidationFailure,
                                   QStringLiteral("Update failed: Missing title or update information."));
    }

    const std::optional<data::EventPatch> patch = patchFromJson(updates);
    if (!patch) {
        return CommandResult::text(CommandResult::Status::ValidationFailure,
                                   QStringLiteral("There was an error updating the event. "
                                                  "The update details were not formatted correctly."));
    }

    if (!isStoreReady(m_store)) {
        return storageUnavailable(QStringLiteral("Update"));
    }

    if (!m_store.updateFirstByTitleSubstring(title, *patch)) {
        return CommandResult::text(CommandResult::Status::NotFound,
                                   QStringLiteral("Could not find an event with the title '%1'.").arg(title));
    }
    return CommandResult::text(CommandResult::Status::Success,
                               QStringLiteral("Event '%1' updated successfully.").arg(title));
}

CommandResult CommandDispatcher::deleteEvent(const Command &command)
{
    const QString title = command.param(TITLE);
    if (title.isEmpty()) {
        return CommandResult::text(CommandResult::Status::ValidationFailure,
                                   QStringLiteral("Delete failed: Missing title information."));
    }

    if (!isStoreReady(m_store)) {
        return storageUnavailable(QStringLiteral("Delete"));
    }

    if (!m_store.deleteFirstByTitleSubstring(title)) {
        return CommandResult::text(CommandResult::Status::NotFound,
                                   QStringLiteral("Could not find an event with the title '%1'.").arg(title));
    }
    return CommandResult::text(CommandResult::Status::Success,
                               QStringLiteral("Event '%1' deleted successfully.").arg(title));
}

} // namespace command
} // namespace agenda
