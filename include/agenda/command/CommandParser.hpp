#pragma once

#include <optional>

#include <QString>

#include "agenda/command/Command.hpp"

namespace agenda {
namespace command {

// Finds ACTION:NAME(key="value", ...) in free text.
class CommandParser
{
public:
    static std::optional<Command> parse(const QString &text);
};

} // namespace command
} // namespace agenda
