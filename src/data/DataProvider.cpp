#include "agenda/data/DataProvider.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/data/ChatLog.hpp"
#include "agenda/data/SqlEventRepository.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace agenda {
namespace data {

namespace {
const QString DATABASE_PATH_KEY = QStringLiteral("storage/databasePath");
}

DataProvider::DataProvider(const QString &databasePath)
    : m_databasePath(databasePath.isEmpty() ? configuredDatabasePath() : databasePath)
{
    const QDir dir = QFileInfo(m_databasePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(agendaApp, "Could not create %s", qPrintable(dir.path()));
    }
    qCInfo(agendaApp, "Using database %s", qPrintable(m_databasePath));

    m_eventRepository = std::make_unique<SqlEventRepository>(m_databasePath);
    m_chatLog = std::make_unique<ChatLog>(m_databasePath);
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

ChatLog &DataProvider::chatLog()
{
    return *m_chatLog;
}

const QString &DataProvider::databasePath() const
{
    return m_databasePath;
}

QString DataProvider::configuredDatabasePath()
{
    QSettings settings;
    const QString stored = settings.value(DATABASE_PATH_KEY).toString();
    if (!stored.isEmpty()) {
        return stored;
    }
    return defaultDatabasePath();
}

QString DataProvider::defaultDatabasePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/agenda");
    }
    return QDir(storageFolder).filePath(QStringLiteral("calendar.db"));
}

} // namespace data
} // namespace agenda
