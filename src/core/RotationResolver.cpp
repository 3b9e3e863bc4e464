#include "chorewheel/core/RotationResolver.hpp"

#include "chorewheel/core/DayRange.hpp"
#include "chorewheel/core/Logging.hpp"

namespace chorewheel {
namespace core {

namespace {
constexpr int DAYS_PER_WEEK = 7;

// Matching days in the half-open range (from, to], from <= to.
qint64 countMatchingDays(const QString &days, const QDate &from, const QDate &to)
{
    const qint64 span = from.daysTo(to);
    if (span <= 0) {
        return 0;
    }

    int perWeek = 0;
    for (int i = 0; i < DAYS_PER_WEEK; ++i) {
        if (matchesDayRange(dayName(i), days)) {
            ++perWeek;
        }
    }

    const qint64 fullWeeks = span / DAYS_PER_WEEK;
    qint64 count = fullWeeks * perWeek;
    QDate day = from.addDays(fullWeeks * DAYS_PER_WEEK);
    while (day < to) {
        day = day.addDays(1);
        if (matchesDayRange(day, days)) {
            ++count;
        }
    }
    return count;
}
} // namespace

RotationResolver::RotationResolver(const data::RotationTable &table)
    : m_table(table)
{
}

std::optional<QString> RotationResolver::assignedPerson(const data::RotationKey &key, const QDate &targetDate) const
{
    const auto it = m_table.find(key);
    if (it == m_table.end()) {
        return std::nullopt;
    }
    return assignedPerson(it->second, targetDate);
}

QString RotationResolver::assignedPersonOrFirst(const data::ScheduleEntry &entry, const QDate &targetDate) const
{
    if (!entry.isRotating()) {
        return entry.firstParticipant();
    }
    const auto key = data::RotationKey::fromEntry(entry);
    const auto it = m_table.find(key);
    if (it == m_table.end()) {
        qCWarning(lcRotation) << "No rotation for" << key.toString() << "falling back to" << entry.firstParticipant();
        return entry.firstParticipant();
    }
    // Rows sharing a key with another participant list are not part of that rotation.
    if (it->second.participants != entry.participants) {
        qCWarning(lcRotation) << "Rotation" << key.toString() << "belongs to" << it->second.participants.join(':')
                              << "not" << entry.participantSpec << "falling back to" << entry.firstParticipant();
        return entry.firstParticipant();
    }
    if (const auto person = assignedPerson(it->second, targetDate)) {
        return *person;
    }
    return entry.firstParticipant();
}

std::optional<QString> RotationResolver::assignedPerson(const data::RotationDefinition &definition,
                                                        const QDate &targetDate)
{
    const int count = definition.participants.size();
    if (count == 0 || !definition.anchorDate.isValid() || !targetDate.isValid()) {
        return std::nullopt;
    }
    const qint64 occurrences = occurrencesBetween(definition.key.days, definition.anchorDate, targetDate);
    qint64 index = occurrences % count;
    if (index < 0) {
        index += count;
    }
    return definition.participants.at(static_cast<int>(index));
}

qint64 RotationResolver::occurrencesBetween(const QString &days, const QDate &anchor, const QDate &target)
{
    if (target > anchor) {
        return countMatchingDays(days, anchor, target);
    }
    if (target < anchor) {
        return -countMatchingDays(days, target, anchor);
    }
    return 0;
}

} // namespace core
} // namespace chorewheel
