#include "agenda/data/SqliteConnection.hpp"

#include "agenda/core/Logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>

namespace agenda {
namespace data {

SqliteConnection::SqliteConnection(QString databasePath)
    : m_databasePath(std::move(databasePath))
    , m_connectionName(QStringLiteral("agenda-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)))
{
}

SqliteConnection::~SqliteConnection()
{
    if (!QSqlDatabase::contains(m_connectionName)) {
        return;
    }
    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        db.close();
    }
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool SqliteConnection::open()
{
    if (isOpen()) {
        return true;
    }
    if (!QSqlDatabase::isDriverAvailable(QStringLiteral("QSQLITE"))) {
        m_lastError = QStringLiteral("QSQLITE driver is not available");
        qCCritical(agendaSql, "%s", qPrintable(m_lastError));
        return false;
    }

    if (m_databasePath != QLatin1String(":memory:")) {
        const QFileInfo info(m_databasePath);
        if (!info.dir().exists()) {
            m_lastError = QStringLiteral("directory %1 does not exist").arg(info.dir().path());
            qCCritical(agendaSql, "Cannot open %s: %s", qPrintable(m_databasePath), qPrintable(m_lastError));
            return false;
        }
    }

    QSqlDatabase db = QSqlDatabase::contains(m_connectionName)
        ? QSqlDatabase::database(m_connectionName, false)
        : QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    db.setDatabaseName(m_databasePath);
    if (!db.open()) {
        m_lastError = db.lastError().text();
        qCCritical(agendaSql, "Failed to open %s: %s", qPrintable(m_databasePath), qPrintable(m_lastError));
        return false;
    }

    qCDebug(agendaSql, "Opened connection %s to %s", qPrintable(m_connectionName), qPrintable(m_databasePath));
    return true;
}

bool SqliteConnection::isOpen() const
{
    return QSqlDatabase::contains(m_connectionName) && QSqlDatabase::database(m_connectionName, false).isOpen();
}

QSqlDatabase SqliteConnection::database() const
{
    return QSqlDatabase::database(m_connectionName, false);
}

const QString &SqliteConnection::databasePath() const
{
    return m_databasePath;
}

QString SqliteConnection::lastError() const
{
    return m_lastError;
}

bool SqliteConnection::execute(const QString &statement)
{
    QSqlQuery query(database());
    if (!query.exec(statement)) {
        m_lastError = query.lastError().text();
        qCCritical(agendaSql, "Statement failed: %s (%s)", qPrintable(m_lastError), qPrintable(statement));
        return false;
    }
    return true;
}

} // namespace data
} // namespace agenda
