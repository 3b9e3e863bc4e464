#pragma once

#include <QString>
#include <QStringList>
#include <QTime>
#include <tuple>

namespace chorewheel {
namespace data {

// One row of the schedule file. Participants are listed in rotation order.
struct ScheduleEntry
{
    QTime time;
    QStringList participants;
    QString participantSpec; // as written, e.g. "Frank:Alice:Tom"
    QString days;
    QString action;
    QString label;

    bool isRotating() const { return participants.size() > 1; }
    QString firstParticipant() const { return participants.isEmpty() ? QString() : participants.first(); }
};

// Identifies one rotating responsibility. All components are trimmed.
struct RotationKey
{
    QTime time;
    QString days;
    QString action;

    static RotationKey fromEntry(const ScheduleEntry &entry);
    static RotationKey make(const QTime &time, const QString &days, const QString &action);

    // "HH:mm|days|action" as stored in the rotation state file.
    QString toString() const;
    static bool fromString(const QString &value, RotationKey *key);
};

inline bool operator<(const RotationKey &lhs, const RotationKey &rhs)
{
    return std::tie(lhs.time, lhs.days, lhs.action) < std::tie(rhs.time, rhs.days, rhs.action);
}

inline bool operator==(const RotationKey &lhs, const RotationKey &rhs)
{
    return lhs.time == rhs.time && lhs.days == rhs.days && lhs.action == rhs.action;
}

// Identifies one task instance of the day. Uses the participant spec as
// written so entries sharing a rotation key stay distinct.
struct TaskKey
{
    QTime time;
    QString participantSpec;
    QString action;

    static TaskKey fromEntry(const ScheduleEntry &entry);
};

inline bool operator<(const TaskKey &lhs, const TaskKey &rhs)
{
    return std::tie(lhs.time, lhs.participantSpec, lhs.action)
        < std::tie(rhs.time, rhs.participantSpec, rhs.action);
}

inline bool operator==(const TaskKey &lhs, const TaskKey &rhs)
{
    return lhs.time == rhs.time && lhs.participantSpec == rhs.participantSpec && lhs.action == rhs.action;
}

QStringList splitParticipants(const QString &spec);

} // namespace data
} // namespace chorewheel
