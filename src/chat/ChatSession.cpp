#include "agenda/chat/ChatSession.hpp"

#include "agenda/chat/ResponseSource.hpp"
#include "agenda/command/CommandParser.hpp"
#include "agenda/core/Logging.hpp"

#include <QLocale>
#include <QStringList>

namespace agenda {
namespace chat {

ChatSession::ChatSession(ResponseSource &source, command::CommandDispatcher &dispatcher, data::ChatLog *log)
    : m_source(source)
    , m_dispatcher(dispatcher)
    , m_log(log)
{
}

data::ChatMessage ChatSession::send(const QString &userText)
{
    if (m_log && !m_log->append(data::ChatMessage::Role::User, userText)) {
        qCWarning(agendaChat, "User message was not added to the transcript");
    }

    const QString answer = m_source.respond(userText);

    data::ChatMessage reply;
    reply.role = data::ChatMessage::Role::Assistant;

    const auto parsed = command::CommandParser::parse(answer);
    if (!parsed) {
        qCDebug(agendaChat, "Answer carries no command");
        reply.text = answer;
    } else {
        command::CommandResult result = m_dispatcher.dispatch(*parsed);
        if (result.isEventList()) {
            reply.events = std::move(result.events);
        } else {
            reply.text = result.message;
        }
    }

    if (m_log) {
        const bool recorded = reply.isEventList() ? m_log->append(reply.role, *reply.events)
                                                  : m_log->append(reply.role, reply.text);
        if (!recorded) {
            qCWarning(agendaChat, "Reply was not added to the transcript");
        }
    }
    return reply;
}

QString ChatSession::formatReply(const data::ChatMessage &reply)
{
    if (!reply.isEventList()) {
        return reply.text;
    }
    if (reply.events->empty()) {
        return QStringLiteral("No events found.");
    }
    QStringList lines;
    for (const auto &event : *reply.events) {
        lines << formatEvent(event);
    }
    return lines.join(QLatin1Char('\n'));
}

QString ChatSession::formatTranscript(const std::vector<data::ChatMessage> &messages)
{
    QStringList blocks;
    for (const auto &message : messages) {
        if (message.role == data::ChatMessage::Role::User) {
            blocks << QStringLiteral("> ") + message.text;
        } else {
            blocks << formatReply(message);
        }
    }
    return blocks.join(QLatin1Char('\n'));
}

QString ChatSession::formatEvent(const data::CalendarEvent &event)
{
    const QLocale locale;
    QString line = QStringLiteral("- %1 (%2 - %3)")
                       .arg(event.title,
                            locale.toString(event.startTime.toLocalTime(), QLocale::ShortFormat),
                            locale.toString(event.endTime.toLocalTime(), QLocale::ShortFormat));
    if (!event.description.isEmpty()) {
        line += QStringLiteral(": ") + event.description;
    }
    return line;
}

} // namespace chat
} // namespace agenda
