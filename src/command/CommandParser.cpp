#include "agenda/command/CommandParser.hpp"

#include "agenda/core/Logging.hpp"

#include <QRegularExpression>

namespace agenda {
namespace command {

namespace {
const QRegularExpression &actionPattern()
{
    // Greedy: ARGS runs up to the last closing parenthesis in the text.
    static const QRegularExpression pattern(QStringLiteral("ACTION:(\\w+)\\((.*)\\)"),
                                            QRegularExpression::DotMatchesEverythingOption);
    return pattern;
}

const QRegularExpression &parameterPattern()
{
    static const QRegularExpression pattern(QStringLiteral("(\\w+)=\"((?:\\\\\"|[^\"])*)\""));
    return pattern;
}
} // namespace

std::optional<Command> CommandParser::parse(const QString &text)
{
    const QRegularExpressionMatch match = actionPattern().match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    Command command;
    command.name = match.captured(1);

    const QString arguments = match.captured(2);
    QRegularExpressionMatchIterator it = parameterPattern().globalMatch(arguments);
    while (it.hasNext()) {
        const QRegularExpressionMatch parameter = it.next();
        QString value = parameter.captured(2);
        value.replace(QStringLiteral("\\\""), QStringLiteral("\""));
        command.params.insert(parameter.captured(1), value);
    }

    qCDebug(agendaCommand, "Parsed %s with %d parameters", qPrintable(command.name), command.params.size());
    return command;
}

} // namespace command
} // namespace agenda
