#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <map>

#include "chorewheel/data/ScheduleEntry.hpp"

namespace chorewheel {
namespace core {

struct TaskInstance
{
    data::ScheduleEntry entry;
    QDateTime scheduledAt;
    QString assignedPerson;
    bool called = false;
    bool completed = false;
    bool adHoc = false;

    data::TaskKey key() const { return data::TaskKey::fromEntry(entry); }
    bool isPending() const { return !called && !completed; }
};

using TaskInstanceMap = std::map<data::TaskKey, TaskInstance>;

} // namespace core
} // namespace chorewheel

Q_DECLARE_METATYPE(chorewheel::core::TaskInstance)
