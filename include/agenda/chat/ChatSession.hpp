#pragma once

#include "agenda/command/CommandDispatcher.hpp"
#include "agenda/data/ChatLog.hpp"

namespace agenda {
namespace chat {

class ResponseSource;

// One conversational turn: model answer -> optional command -> reply.
class ChatSession
{
public:
    // The log is optional; without it nothing is recorded.
    ChatSession(ResponseSource &source, command::CommandDispatcher &dispatcher, data::ChatLog *log = nullptr);

    data::ChatMessage send(const QString &userText);

    static QString formatReply(const data::ChatMessage &reply);
    // User lines are prefixed with "> ", replies are rendered by formatReply().
    static QString formatTranscript(const std::vector<data::ChatMessage> &messages);
    static QString formatEvent(const data::CalendarEvent &event);

private:
    ResponseSource &m_source;
    command::CommandDispatcher &m_dispatcher;
    data::ChatLog *m_log = nullptr;
};

} // namespace chat
} // namespace agenda
