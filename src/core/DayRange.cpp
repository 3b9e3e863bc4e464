#include "chorewheel/core/DayRange.hpp"

#include "chorewheel/core/Logging.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace chorewheel {
namespace core {

namespace {
constexpr int DAYS_PER_WEEK = 7;

const QStringList &canonicalDays()
{
    static const QStringList days = {
        QStringLiteral("Sunday"),
        QStringLiteral("Monday"),
        QStringLiteral("Tuesday"),
        QStringLiteral("Wednesday"),
        QStringLiteral("Thursday"),
        QStringLiteral("Friday"),
        QStringLiteral("Saturday"),
    };
    return days;
}

bool isEveryDay(const QString &spec)
{
    return spec == QLatin1String("Sunday-Saturday") || spec == QLatin1String("All")
        || spec == QLatin1String("*");
}

const QRegularExpression &rangePattern()
{
    static const QRegularExpression pattern(QStringLiteral("^\\s*(\\w+)\\s*-\\s*(\\w+)\\s*$"));
    return pattern;
}
} // namespace

QString dayName(int dayIndex)
{
    if (dayIndex < 0 || dayIndex >= DAYS_PER_WEEK) {
        return {};
    }
    return canonicalDays().at(dayIndex);
}

QString dayName(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    // QDate uses Monday = 1 .. Sunday = 7.
    return dayName(date.dayOfWeek() % DAYS_PER_WEEK);
}

int dayIndex(const QString &name)
{
    return canonicalDays().indexOf(name.trimmed());
}

bool matchesDayRange(const QString &currentDayName, const QString &rangeSpec)
{
    const QString spec = rangeSpec.trimmed();
    if (spec.isEmpty()) {
        qCWarning(lcSchedule) << "Empty day range spec";
        return false;
    }
    if (isEveryDay(spec)) {
        return true;
    }

    const QString current = currentDayName.trimmed();

    if (spec.contains(',')) {
        const QStringList members = spec.split(',');
        for (const QString &member : members) {
            if (member.trimmed() == current) {
                return true;
            }
        }
        return false;
    }

    const auto match = rangePattern().match(spec);
    if (match.hasMatch()) {
        const int start = dayIndex(match.captured(1));
        int end = dayIndex(match.captured(2));
        int index = dayIndex(current);
        if (start < 0 || end < 0) {
            qCWarning(lcSchedule) << "Unknown day name in range" << spec;
            return false;
        }
        if (index < 0) {
            qCWarning(lcSchedule) << "Unknown current day name" << current;
            return false;
        }
        if (start > end) {
            end += DAYS_PER_WEEK;
        }
        if (index < start) {
            index += DAYS_PER_WEEK;
        }
        return index >= start && index <= end;
    }

    return spec == current;
}

bool matchesDayRange(const QDate &date, const QString &rangeSpec)
{
    return matchesDayRange(dayName(date), rangeSpec);
}

bool isValidDayRange(const QString &rangeSpec)
{
    const QString spec = rangeSpec.trimmed();
    if (spec.isEmpty()) {
        return false;
    }
    if (isEveryDay(spec)) {
        return true;
    }
    if (spec.contains(',')) {
        const QStringList members = spec.split(',');
        for (const QString &member : members) {
            if (dayIndex(member) < 0) {
                return false;
            }
        }
        return true;
    }
    const auto match = rangePattern().match(spec);
    if (match.hasMatch()) {
        return dayIndex(match.captured(1)) >= 0 && dayIndex(match.captured(2)) >= 0;
    }
    return dayIndex(spec) >= 0;
}

} // namespace core
} // namespace chorewheel
