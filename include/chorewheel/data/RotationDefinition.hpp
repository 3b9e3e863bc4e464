#pragma once

#include <QDate>
#include <QStringList>
#include <map>

#include "chorewheel/data/ScheduleEntry.hpp"

namespace chorewheel {
namespace data {

struct RotationDefinition
{
    RotationKey key;
    QDate anchorDate;
    QStringList participants;
};

using RotationTable = std::map<RotationKey, RotationDefinition>;

inline bool operator==(const RotationDefinition &lhs, const RotationDefinition &rhs)
{
    return lhs.key == rhs.key && lhs.anchorDate == rhs.anchorDate && lhs.participants == rhs.participants;
}

} // namespace data
} // namespace chorewheel
