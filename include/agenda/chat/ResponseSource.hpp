#pragma once

#include <QString>

namespace agenda {
namespace chat {

// Produces the raw language-model answer for a user message.
class ResponseSource
{
public:
    virtual ~ResponseSource() = default;
    virtual QString respond(const QString &message) = 0;
};

// Treats the user's text as the model answer, so ACTION lines can be typed directly.
class PassthroughResponseSource : public ResponseSource
{
public:
    QString respond(const QString &message) override { return message; }
};

} // namespace chat
} // namespace agenda
