#include "agenda/chat/ProcessResponseSource.hpp"

#include "agenda/command/CommandPrompt.hpp"
#include "agenda/core/Logging.hpp"

#include <QDate>
#include <QProcess>

namespace agenda {
namespace chat {

ProcessResponseSource::ProcessResponseSource(QString program, QStringList arguments, int timeoutMs)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_timeoutMs(timeoutMs)
{
}

QString ProcessResponseSource::respond(const QString &message)
{
    QProcess process;
    process.start(m_program, m_arguments);
    if (!process.waitForStarted(m_timeoutMs)) {
        qCWarning(agendaChat, "Model command %s did not start: %s", qPrintable(m_program),
                  qPrintable(process.errorString()));
        return failureText();
    }

    const QString input = command::CommandPrompt::systemPrompt(QDate::currentDate()) + QStringLiteral("\n\n")
        + message + QLatin1Char('\n');
    process.write(input.toUtf8());
    process.closeWriteChannel();

    if (!process.waitForFinished(m_timeoutMs)) {
        qCWarning(agendaChat, "Model command timed out after %d ms", m_timeoutMs);
        process.kill();
        process.waitForFinished();
        return failureText();
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qCWarning(agendaChat, "Model command failed with exit code %d: %s", process.exitCode(),
                  process.readAllStandardError().constData());
        return failureText();
    }

    const QString answer = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    return answer.isEmpty() ? emptyAnswerText() : answer;
}

QString ProcessResponseSource::emptyAnswerText()
{
    return QStringLiteral("Sorry, I did not understand.");
}

QString ProcessResponseSource::failureText()
{
    return QStringLiteral("Error: Could not generate a response from the model.");
}

} // namespace chat
} // namespace agenda
