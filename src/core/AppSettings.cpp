#include "chorewheel/core/AppSettings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace chorewheel {
namespace core {

namespace {
const auto DATA_DIR_KEY = QStringLiteral("paths/dataDir");
const auto TICK_INTERVAL_KEY = QStringLiteral("scheduler/tickIntervalMs");
const auto TRIGGER_WINDOW_KEY = QStringLiteral("scheduler/triggerWindowSeconds");
const auto EXPIRY_KEY = QStringLiteral("scheduler/expiryMinutes");

int positiveOr(const QVariant &value, int fallback)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    return ok && parsed > 0 ? parsed : fallback;
}
} // namespace

QString AppSettings::schedulePath() const
{
    return QDir(dataDir).filePath(QStringLiteral("schedule.csv"));
}

QString AppSettings::rotationStatePath() const
{
    return QDir(dataDir).filePath(QStringLiteral("rotation_state.csv"));
}

QString AppSettings::taskLogPath() const
{
    return QDir(dataDir).filePath(QStringLiteral("task_log.csv"));
}

QString AppSettings::contentDir() const
{
    return dataDir;
}

QString AppSettings::defaultDataDir()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.local/share/chorewheel");
    }
    return folder;
}

AppSettings AppSettings::load(QSettings &settings)
{
    AppSettings result;
    result.dataDir = settings.value(DATA_DIR_KEY).toString();
    if (result.dataDir.isEmpty()) {
        result.dataDir = defaultDataDir();
    }
    result.tickIntervalMs = positiveOr(settings.value(TICK_INTERVAL_KEY), result.tickIntervalMs);
    result.triggerWindowSeconds = positiveOr(settings.value(TRIGGER_WINDOW_KEY), result.triggerWindowSeconds);
    result.expiryMinutes = positiveOr(settings.value(EXPIRY_KEY), result.expiryMinutes);
    return result;
}

} // namespace core
} // namespace chorewheel
