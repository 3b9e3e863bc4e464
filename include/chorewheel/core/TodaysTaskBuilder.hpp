#pragma once

#include <QDate>
#include <vector>

#include "chorewheel/core/TaskInstance.hpp"

namespace chorewheel {
namespace core {

class RotationResolver;

class TodaysTaskBuilder
{
public:
    // Expands the entries matching today. Existing instances for the same day
    // keep their called/completed state; fired ones also keep their assignee.
    // Existing instances without a matching entry (injected tasks, rows
    // removed mid-day) are carried over unchanged.
    static TaskInstanceMap build(const std::vector<data::ScheduleEntry> &entries,
                                 const QDate &today,
                                 const RotationResolver &resolver,
                                 const TaskInstanceMap &existing = {});

    static TaskInstance makeInstance(const data::ScheduleEntry &entry,
                                     const QDate &today,
                                     const RotationResolver &resolver);
};

} // namespace core
} // namespace chorewheel
