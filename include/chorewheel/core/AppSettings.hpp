#pragma once

#include <QString>

class QSettings;

namespace chorewheel {
namespace core {

struct AppSettings
{
    QString dataDir;
    int tickIntervalMs = 1000;
    int triggerWindowSeconds = 20;
    int expiryMinutes = 60;

    QString schedulePath() const;
    QString rotationStatePath() const;
    QString taskLogPath() const;
    QString contentDir() const;

    static QString defaultDataDir();
    static AppSettings load(QSettings &settings);
};

} // namespace core
} // namespace chorewheel
