#pragma once

#include <QStringList>

#include "agenda/chat/ResponseSource.hpp"

namespace agenda {
namespace chat {

class ProcessResponseSource : public ResponseSource
{
public:
    ProcessResponseSource(QString program, QStringList arguments, int timeoutMs = 60000);

    QString respond(const QString &message) override;

    static QString emptyAnswerText();
    static QString failureText();

private:
    QString m_program;
    QStringList m_arguments;
    int m_timeoutMs;
};

} // namespace chat
} // namespace agenda
