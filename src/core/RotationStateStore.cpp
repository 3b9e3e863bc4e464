#include "chorewheel/core/RotationStateStore.hpp"

#include "chorewheel/core/DayRange.hpp"
#include "chorewheel/core/Logging.hpp"
#include "chorewheel/data/RotationStateRepository.hpp"

#include <set>

namespace chorewheel {
namespace core {

namespace {
constexpr int DAYS_PER_WEEK = 7;

QDate previousMatchingDay(const QDate &from, const QString &days)
{
    QDate candidate = from;
    for (int i = 0; i < DAYS_PER_WEEK; ++i) {
        candidate = candidate.addDays(-1);
        if (matchesDayRange(candidate, days)) {
            return candidate;
        }
    }
    return {};
}
} // namespace

RotationStateStore::RotationStateStore(data::RotationStateRepository &repository)
    : m_repository(repository)
{
}

const data::RotationTable &RotationStateStore::table() const
{
    return m_table;
}

bool RotationStateStore::reload(QString *errorMessage)
{
    QString error;
    auto loaded = m_repository.load(&error);
    if (!loaded) {
        qCInfo(lcRotation) << "Rotation state unavailable:" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        return false;
    }
    m_table = std::move(*loaded);
    qCInfo(lcRotation) << "Loaded" << m_table.size() << "rotation definitions";
    return true;
}

bool RotationStateStore::rebuild(const std::vector<data::ScheduleEntry> &entries, const QDate &today)
{
    m_table = buildTable(entries, today);
    qCInfo(lcRotation) << "Rebuilt" << m_table.size() << "rotation definitions anchored at"
                       << today.toString(Qt::ISODate);
    return persist();
}

bool RotationStateStore::advanceAll()
{
    for (auto &item : m_table) {
        if (!advanceAnchor(item.second)) {
            qCWarning(lcRotation) << "Cannot advance" << item.first.toString() << "no matching day in the last week";
        }
    }
    return persist();
}

bool RotationStateStore::coversSchedule(const std::vector<data::ScheduleEntry> &entries) const
{
    std::set<data::RotationKey> keys;
    for (const data::ScheduleEntry &entry : entries) {
        if (!entry.isRotating()) {
            continue;
        }
        const auto key = data::RotationKey::fromEntry(entry);
        if (!keys.insert(key).second) {
            continue;
        }
        const auto it = m_table.find(key);
        if (it == m_table.end() || it->second.participants != entry.participants) {
            return false;
        }
    }
    return keys.size() == m_table.size();
}

bool RotationStateStore::persist()
{
    QString error;
    if (!m_repository.save(m_table, &error)) {
        qCCritical(lcRotation) << "Failed to persist rotation state:" << error;
        return false;
    }
    return true;
}

data::RotationTable RotationStateStore::buildTable(const std::vector<data::ScheduleEntry> &entries, const QDate &today)
{
    data::RotationTable table;
    for (const data::ScheduleEntry &entry : entries) {
        if (!entry.isRotating()) {
            continue;
        }
        data::RotationDefinition definition;
        definition.key = data::RotationKey::fromEntry(entry);
        definition.anchorDate = today;
        definition.participants = entry.participants;
        if (!table.emplace(definition.key, definition).second) {
            qCWarning(lcRotation) << "Duplicate rotation key" << definition.key.toString() << "ignoring"
                                  << entry.participantSpec;
        }
    }
    return table;
}

bool RotationStateStore::advanceAnchor(data::RotationDefinition &definition)
{
    QDate anchor = definition.anchorDate;
    // An anchor on a non-matching day contributes no occurrence, so one step
    // back would not move the rotation.
    if (!matchesDayRange(anchor, definition.key.days)) {
        anchor = previousMatchingDay(anchor, definition.key.days);
        if (!anchor.isValid()) {
            return false;
        }
    }
    anchor = previousMatchingDay(anchor, definition.key.days);
    if (!anchor.isValid()) {
        return false;
    }
    definition.anchorDate = anchor;
    return true;
}

} // namespace core
} // namespace chorewheel
