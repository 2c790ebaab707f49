#pragma once

#include <stdexcept>

#include <QString>

namespace agenda {
namespace core {

// Thrown when a durable backend cannot be opened or migrated.
class StorageUnavailable : public std::runtime_error
{
public:
    explicit StorageUnavailable(const QString &reason)
        : std::runtime_error(reason.toStdString())
        , m_reason(reason)
    {
    }

    const QString &reason() const { return m_reason; }

private:
    QString m_reason;
};

} // namespace core
} // namespace agenda
