#pragma once

#include <QDate>
#include <QString>

namespace agenda {
namespace command {

// Instructions that teach a language model the ACTION grammar.
class CommandPrompt
{
public:
    static QString systemPrompt(const QDate &today);
};

} // namespace command
} // namespace agenda
