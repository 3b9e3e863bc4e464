#pragma once

#include <QDate>
#include <QString>
#include <optional>

#include "chorewheel/data/RotationDefinition.hpp"

namespace chorewheel {
namespace core {

class RotationResolver
{
public:
    explicit RotationResolver(const data::RotationTable &table);

    std::optional<QString> assignedPerson(const data::RotationKey &key, const QDate &targetDate) const;

    // Falls back to the first listed participant when the rotation cannot be
    // resolved.
    QString assignedPersonOrFirst(const data::ScheduleEntry &entry, const QDate &targetDate) const;

    static std::optional<QString> assignedPerson(const data::RotationDefinition &definition, const QDate &targetDate);

    // Matching days in (anchor, target] when target is after the anchor, the
    // negated count of matching days in (target, anchor] when it is before.
    static qint64 occurrencesBetween(const QString &days, const QDate &anchor, const QDate &target);

private:
    const data::RotationTable &m_table;
};

} // namespace core
} // namespace chorewheel
