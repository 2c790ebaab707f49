#pragma once

#include <QSqlDatabase>
#include <QString>

namespace agenda {
namespace data {

// Owns one named QSQLITE connection and removes it on destruction.
class SqliteConnection
{
public:
    explicit SqliteConnection(QString databasePath);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection &) = delete;
    SqliteConnection &operator=(const SqliteConnection &) = delete;

    bool open();
    bool isOpen() const;
    QSqlDatabase database() const;
    const QString &databasePath() const;
    QString lastError() const;

    bool execute(const QString &statement);

private:
    QString m_databasePath;
    QString m_connectionName;
    QString m_lastError;
};

} // namespace data
} // namespace agenda
