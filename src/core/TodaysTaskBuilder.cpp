#include "chorewheel/core/TodaysTaskBuilder.hpp"

#include "chorewheel/core/DayRange.hpp"
#include "chorewheel/core/Logging.hpp"
#include "chorewheel/core/RotationResolver.hpp"

namespace chorewheel {
namespace core {

TaskInstanceMap TodaysTaskBuilder::build(const std::vector<data::ScheduleEntry> &entries,
                                         const QDate &today,
                                         const RotationResolver &resolver,
                                         const TaskInstanceMap &existing)
{
    TaskInstanceMap result;
    const QString todayName = dayName(today);

    for (const data::ScheduleEntry &entry : entries) {
        if (!matchesDayRange(todayName, entry.days)) {
            continue;
        }
        TaskInstance instance = makeInstance(entry, today, resolver);
        const data::TaskKey key = instance.key();

        const auto previous = existing.find(key);
        if (previous != existing.end() && previous->second.scheduledAt.date() == today) {
            instance.called = previous->second.called;
            instance.completed = previous->second.completed;
            if (previous->second.called) {
                instance.assignedPerson = previous->second.assignedPerson;
            }
        }

        if (!result.emplace(key, std::move(instance)).second) {
            qCWarning(lcSchedule) << "Duplicate task" << entry.time.toString(QStringLiteral("HH:mm"))
                                  << entry.participantSpec << entry.action << "ignored";
        }
    }

    for (const auto &item : existing) {
        // Pending instances of removed or edited rows are dropped.
        if (item.second.scheduledAt.date() != today || !(item.second.adHoc || item.second.called)) {
            continue;
        }
        if (result.find(item.first) == result.end()) {
            result.emplace(item.first, item.second);
        }
    }

    return result;
}

TaskInstance TodaysTaskBuilder::makeInstance(const data::ScheduleEntry &entry,
                                             const QDate &today,
                                             const RotationResolver &resolver)
{
    TaskInstance instance;
    instance.entry = entry;
    instance.scheduledAt = QDateTime(today, entry.time);
    instance.assignedPerson = resolver.assignedPersonOrFirst(entry, today);
    return instance;
}

} // namespace core
} // namespace chorewheel
