#pragma once

#include <QDate>
#include <QObject>
#include <QString>
#include <QTime>
#include <QTimer>
#include <vector>

#include "chorewheel/core/AppSettings.hpp"
#include "chorewheel/core/RotationStateStore.hpp"
#include "chorewheel/core/TaskInstance.hpp"
#include "chorewheel/data/ContentLibrary.hpp"
#include "chorewheel/data/ScheduleStore.hpp"
#include "chorewheel/data/TaskLog.hpp"

namespace chorewheel {
namespace data {
class RotationStateRepository;
}

namespace core {

class Clock;
class TaskTriggerEngine;

struct AssignmentPreview
{
    QDate date;
    QTime time;
    QString person;
    QString action;
    QString label;
};

// Owns all scheduling state and drives it from a single periodic tick.
class TaskScheduler : public QObject
{
    Q_OBJECT

public:
    enum class State
    {
        Idle,
        Busy,
    };

    TaskScheduler(const AppSettings &settings,
                  Clock &clock,
                  data::RotationStateRepository &rotationRepository,
                  QObject *parent = nullptr);
    ~TaskScheduler() override;

    // Loads the schedule and rotation state and builds today's instances.
    bool initialize();
    void start();
    void stop();
    bool isRunning() const;

    void tick();
    State state() const;
    int skippedTicks() const;

    bool advanceAllRotations();
    // Adds a one-off task for a participant or a content category
    // ("story", "quote", "joke") the given number of seconds from now.
    bool injectTask(int secondsFromNow, const QString &participantOrCategory);
    std::vector<AssignmentPreview> upcomingAssignments(int days) const;

    const TaskInstanceMap &instances() const;
    const data::ScheduleStore &schedule() const;
    const RotationStateStore &rotations() const;
    data::ContentLibrary &content();
    TaskTriggerEngine &engine();
    QDate today() const;

signals:
    void instancesRebuilt();

private:
    bool rotationStateIsCurrent();
    void rebuildInstances();

    AppSettings m_settings;
    Clock &m_clock;
    data::RotationStateRepository &m_rotationRepository;
    data::ScheduleStore m_schedule;
    RotationStateStore m_rotations;
    data::ContentLibrary m_content;
    data::TaskLog m_log;
    TaskTriggerEngine *m_engine = nullptr;
    QTimer m_timer;
    TaskInstanceMap m_instances;
    QDate m_today;
    State m_state = State::Idle;
    int m_skippedTicks = 0;
};

} // namespace core
} // namespace chorewheel
