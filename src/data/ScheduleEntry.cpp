#include "chorewheel/data/ScheduleEntry.hpp"

namespace chorewheel {
namespace data {

namespace {
constexpr auto KEY_TIME_FORMAT = "HH:mm";
const QChar KEY_SEPARATOR('|');
} // namespace

RotationKey RotationKey::fromEntry(const ScheduleEntry &entry)
{
    return make(entry.time, entry.days, entry.action);
}

RotationKey RotationKey::make(const QTime &time, const QString &days, const QString &action)
{
    RotationKey key;
    key.time = QTime(time.hour(), time.minute());
    key.days = days.trimmed();
    key.action = action.trimmed();
    return key;
}

QString RotationKey::toString() const
{
    return time.toString(QLatin1String(KEY_TIME_FORMAT)) + KEY_SEPARATOR + days + KEY_SEPARATOR + action;
}

bool RotationKey::fromString(const QString &value, RotationKey *key)
{
    const int first = value.indexOf(KEY_SEPARATOR);
    const int second = first < 0 ? -1 : value.indexOf(KEY_SEPARATOR, first + 1);
    if (second < 0) {
        return false;
    }
    const QTime time = QTime::fromString(value.left(first).trimmed(), QLatin1String(KEY_TIME_FORMAT));
    if (!time.isValid()) {
        return false;
    }
    const QString days = value.mid(first + 1, second - first - 1);
    const QString action = value.mid(second + 1);
    if (days.trimmed().isEmpty() || action.trimmed().isEmpty()) {
        return false;
    }
    if (key) {
        *key = make(time, days, action);
    }
    return true;
}

TaskKey TaskKey::fromEntry(const ScheduleEntry &entry)
{
    return { entry.time, entry.participantSpec, entry.action };
}

QStringList splitParticipants(const QString &spec)
{
    const QStringList parts = spec.split(':', Qt::SkipEmptyParts);
    QStringList cleaned;
    cleaned.reserve(parts.size());
    for (const QString &part : parts) {
        const QString name = part.trimmed();
        if (!name.isEmpty()) {
            cleaned << name;
        }
    }
    return cleaned;
}

} // namespace data
} // namespace chorewheel
