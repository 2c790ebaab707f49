#include <QtTest/QtTest>

#include "agenda/command/CommandParser.hpp"

using namespace agenda::command;

class CommandParserTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesCreateEvent();
    void plainTextIsNoCommand_data();
    void plainTextIsNoCommand();
    void unescapesQuotesInValues();
    void emptyArgumentsKeepName();
    void lastDuplicateKeyWins();
    void unknownNamesAreStillExtracted();
    void argumentsMaySpanLines();
    void surroundingTextIsIgnored();
    void unterminatedQuoteTerminates();
};

void CommandParserTest::parsesCreateEvent()
{
    const auto command = CommandParser::parse(QStringLiteral(
        "ACTION:CREATE_EVENT(title=\"Lunch\", startTime=\"2025-01-01T12:00:00\", endTime=\"2025-01-01T13:00:00\")"));
    QVERIFY(command.has_value());
    QCOMPARE(command->name, QStringLiteral("CREATE_EVENT"));
    QCOMPARE(command->kind(), CommandKind::CreateEvent);
    QCOMPARE(command->params.size(), 3);
    QCOMPARE(command->param(QStringLiteral("title")), QStringLiteral("Lunch"));
    QCOMPARE(command->param(QStringLiteral("startTime")), QStringLiteral("2025-01-01T12:00:00"));
    QCOMPARE(command->param(QStringLiteral("endTime")), QStringLiteral("2025-01-01T13:00:00"));
}

void CommandParserTest::plainTextIsNoCommand_data()
{
    QTest::addColumn<QString>("text");
    QTest::newRow("greeting") << QStringLiteral("Hello there, how can I help?");
    QTest::newRow("empty") << QString();
    QTest::newRow("missing parentheses") << QStringLiteral("ACTION:CREATE_EVENT title=\"Lunch\"");
    QTest::newRow("unclosed parenthesis") << QStringLiteral("ACTION:DELETE_EVENT(title=\"Lunch\"");
    QTest::newRow("lower case marker") << QStringLiteral("action:READ_EVENTS()");
}

void CommandParserTest::plainTextIsNoCommand()
{
    QFETCH(QString, text);
    QVERIFY(!CommandParser::parse(text).has_value());
}

void CommandParserTest::unescapesQuotesInValues()
{
    const auto command = CommandParser::parse(QStringLiteral(
        "ACTION:UPDATE_EVENT(title=\"lunch\", updates=\"{\\\"title\\\":\\\"Lunch with Bob\\\"}\")"));
    QVERIFY(command.has_value());
    QCOMPARE(command->param(QStringLiteral("title")), QStringLiteral("lunch"));
    QCOMPARE(command->param(QStringLiteral("updates")), QStringLiteral("{\"title\":\"Lunch with Bob\"}"));
}

void CommandParserTest::emptyArgumentsKeepName()
{
    const auto command = CommandParser::parse(QStringLiteral("ACTION:READ_EVENTS()"));
    QVERIFY(command.has_value());
    QCOMPARE(command->name, QStringLiteral("READ_EVENTS"));
    QVERIFY(command->params.isEmpty());
}

void CommandParserTest::lastDuplicateKeyWins()
{
    const auto command = CommandParser::parse(QStringLiteral("ACTION:DELETE_EVENT(title=\"first\", title=\"second\")"));
    QVERIFY(command.has_value());
    QCOMPARE(command->params.size(), 1);
    QCOMPARE(command->param(QStringLiteral("title")), QStringLiteral("second"));
}

void CommandParserTest::unknownNamesAreStillExtracted()
{
    const auto command = CommandParser::parse(QStringLiteral("ACTION:FROBNICATE(x=\"1\")"));
    QVERIFY(command.has_value());
    QCOMPARE(command->name, QStringLiteral("FROBNICATE"));
    QCOMPARE(command->kind(), CommandKind::Unknown);
    QCOMPARE(command->param(QStringLiteral("x")), QStringLiteral("1"));
}

void CommandParserTest::argumentsMaySpanLines()
{
    const auto command = CommandParser::parse(QStringLiteral(
        "ACTION:CREATE_EVENT(\n  title=\"Review\",\n  startTime=\"2025-02-03T09:00:00\",\n"
        "  endTime=\"2025-02-03T10:00:00\",\n  description=\"line one\nline two\"\n)"));
    QVERIFY(command.has_value());
    QCOMPARE(command->params.size(), 4);
    QCOMPARE(command->param(QStringLiteral("description")), QStringLiteral("line one\nline two"));
}

void CommandParserTest::surroundingTextIsIgnored()
{
    const auto command = CommandParser::parse(
        QStringLiteral("Sure! ACTION:DELETE_EVENT(title=\"Team sync\") Done."));
    QVERIFY(command.has_value());
    QCOMPARE(command->name, QStringLiteral("DELETE_EVENT"));
    QCOMPARE(command->param(QStringLiteral("title")), QStringLiteral("Team sync"));
}

void CommandParserTest::unterminatedQuoteTerminates()
{
    QString text = QStringLiteral("ACTION:CREATE_EVENT(title=\"");
    text += QString(2000, QLatin1Char('a'));
    text += QStringLiteral(")");
    const auto command = CommandParser::parse(text);
    QVERIFY(command.has_value());
    QCOMPARE(command->name, QStringLiteral("CREATE_EVENT"));
    QVERIFY(!command->params.contains(QStringLiteral("title")));
}

QTEST_GUILESS_MAIN(CommandParserTest)
#include "CommandParserTest.moc"
