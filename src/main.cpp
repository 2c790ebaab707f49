#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QProcess>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <memory>

#include "version.h"

#include "agenda/chat/ChatSession.hpp"
#include "agenda/chat/ProcessResponseSource.hpp"
#include "agenda/chat/ResponseSource.hpp"
#include "agenda/command/CommandDispatcher.hpp"
#include "agenda/core/AppContext.hpp"
#include "agenda/core/EventStore.hpp"
#include "agenda/core/Logging.hpp"
#include "agenda/core/StorageUnavailable.hpp"
#include "agenda/data/ChatLog.hpp"

namespace {

std::unique_ptr<agenda::chat::ResponseSource> createResponseSource(const QString &commandLine, int timeoutMs)
{
    QStringList parts = QProcess::splitCommand(commandLine);
    if (parts.isEmpty()) {
        return std::make_unique<agenda::chat::PassthroughResponseSource>();
    }
    const QString program = parts.takeFirst();
    qCInfo(agendaApp, "Using model command %s", qPrintable(program));
    return std::make_unique<agenda::chat::ProcessResponseSource>(program, parts, timeoutMs);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Agenda"));
    QCoreApplication::setApplicationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kAgendaVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Manage a personal calendar through ACTION commands."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption databaseOption(QStringList{QStringLiteral("d"), QStringLiteral("database")},
                                           QObject::tr("SQLite database file."), QObject::tr("path"));
    const QCommandLineOption modelOption(QStringList{QStringLiteral("m"), QStringLiteral("model-command")},
                                        QObject::tr("Program that answers as the language model."),
                                        QObject::tr("command"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                          QObject::tr("Enable debug logging."));
    const QCommandLineOption listOption(QStringLiteral("list"), QObject::tr("Print all events and exit."));
    const QCommandLineOption historyOption(QStringLiteral("history"),
                                           QObject::tr("Print the chat history and exit."));
    const QCommandLineOption clearHistoryOption(QStringLiteral("clear-history"),
                                                QObject::tr("Delete the chat history and exit."));
    parser.addOption(databaseOption);
    parser.addOption(modelOption);
    parser.addOption(verboseOption);
    parser.addOption(listOption);
    parser.addOption(historyOption);
    parser.addOption(clearHistoryOption);
    parser.process(app);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("agenda.*.debug=true"));
    }

    QSettings settings;
    const QString modelCommand = parser.isSet(modelOption)
        ? parser.value(modelOption)
        : settings.value(QStringLiteral("model/command")).toString();
    const int modelTimeoutMs = settings.value(QStringLiteral("model/timeoutMs"), 60000).toInt();

    QTextStream out(stdout);
    QTextStream err(stderr);

    agenda::core::AppContext context(parser.value(databaseOption));
    try {
        context.initialize();
    } catch (const agenda::core::StorageUnavailable &e) {
        err << QObject::tr("Calendar storage at %1 is unavailable: %2")
                   .arg(context.databasePath(), e.reason())
            << Qt::endl;
        return 2;
    }

    if (parser.isSet(clearHistoryOption)) {
        return context.chatLog().clear() ? 0 : 1;
    }

    if (parser.isSet(historyOption)) {
        const auto history = context.chatLog().messages();
        if (!history.empty()) {
            out << agenda::chat::ChatSession::formatTranscript(history) << Qt::endl;
        }
        return 0;
    }

    if (parser.isSet(listOption)) {
        agenda::data::ChatMessage all;
        all.events = context.eventStore().getAll();
        out << agenda::chat::ChatSession::formatReply(all) << Qt::endl;
        return 0;
    }

    auto source = createResponseSource(modelCommand, modelTimeoutMs);
    agenda::chat::ChatSession session(*source, context.commandDispatcher(), &context.chatLog());

    QTextStream in(stdin);
    out << QObject::tr("agenda %1, one request per line, Ctrl-D to quit.").arg(QString::fromLatin1(kAgendaVersion))
        << Qt::endl;
    QString line;
    while (in.readLineInto(&line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const auto reply = session.send(line);
        out << agenda::chat::ChatSession::formatReply(reply) << Qt::endl;
        // Let queued durable writes run before blocking on the next line.
        QCoreApplication::processEvents();
    }

    context.eventStore().flushPendingWrites();
    return context.eventStore().failedWriteCount() == 0 ? 0 : 1;
}
