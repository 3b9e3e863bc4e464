#pragma once

#include <QDate>
#include <QString>
#include <vector>

#include "chorewheel/data/RotationDefinition.hpp"

namespace chorewheel {
namespace data {
class RotationStateRepository;
}

namespace core {

class RotationStateStore
{
public:
    explicit RotationStateStore(data::RotationStateRepository &repository);

    const data::RotationTable &table() const;

    // Replaces the table with the persisted one. Returns false when nothing
    // usable is stored; the current table is left as it was.
    bool reload(QString *errorMessage = nullptr);

    // Anchors every rotating entry at the given day and persists the result.
    // The in-memory table is replaced even if persisting fails.
    bool rebuild(const std::vector<data::ScheduleEntry> &entries, const QDate &today);

    // Moves each anchor back to the nearest earlier matching day, shifting
    // every resolution forward by one slot, and persists.
    bool advanceAll();

    // True when the table holds exactly the schedule's rotating keys with
    // the same participant order.
    bool coversSchedule(const std::vector<data::ScheduleEntry> &entries) const;

    bool persist();

    static data::RotationTable buildTable(const std::vector<data::ScheduleEntry> &entries, const QDate &today);
    static bool advanceAnchor(data::RotationDefinition &definition);

private:
    data::RotationStateRepository &m_repository;
    data::RotationTable m_table;
};

} // namespace core
} // namespace chorewheel
