#include "chorewheel/core/TaskScheduler.hpp"

#include "chorewheel/core/Clock.hpp"
#include "chorewheel/core/DayRange.hpp"
#include "chorewheel/core/Logging.hpp"
#include "chorewheel/core/RotationResolver.hpp"
#include "chorewheel/core/TaskTriggerEngine.hpp"
#include "chorewheel/core/TodaysTaskBuilder.hpp"
#include "chorewheel/data/RotationStateRepository.hpp"

#include <algorithm>

namespace chorewheel {
namespace core {

namespace {
class BusyGuard
{
public:
    explicit BusyGuard(TaskScheduler::State &state)
        : m_state(state)
    {
        m_state = TaskScheduler::State::Busy;
    }
    ~BusyGuard() { m_state = TaskScheduler::State::Idle; }

private:
    TaskScheduler::State &m_state;
};
} // namespace

TaskScheduler::TaskScheduler(const AppSettings &settings,
                             Clock &clock,
                             data::RotationStateRepository &rotationRepository,
                             QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_clock(clock)
    , m_rotationRepository(rotationRepository)
    , m_schedule(settings.schedulePath())
    , m_rotations(rotationRepository)
    , m_content(settings.contentDir())
    , m_log(settings.taskLogPath())
    , m_engine(new TaskTriggerEngine(&m_content, &m_log, this))
{
    m_engine->setTriggerWindowSeconds(settings.triggerWindowSeconds);
    m_engine->setExpiryMinutes(settings.expiryMinutes);

    m_timer.setInterval(settings.tickIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &TaskScheduler::tick);
}

TaskScheduler::~TaskScheduler()
{
    stop();
}

bool TaskScheduler::initialize()
{
    m_today = m_clock.now().date();

    if (!m_schedule.ensureExists()) {
        qCWarning(lcSchedule) << "Running without a schedule file at" << m_schedule.filePath();
    }
    QString error;
    if (!m_schedule.reload(&error)) {
        qCWarning(lcSchedule) << "Schedule not loaded:" << error;
    }

    bool persisted = true;
    if (!rotationStateIsCurrent()) {
        persisted = m_rotations.rebuild(m_schedule.entries(), m_today);
    }

    m_instances.clear();
    rebuildInstances();
    m_engine->updateSummaries(m_instances, m_clock.now());
    return persisted;
}

void TaskScheduler::start()
{
    if (m_timer.isActive()) {
        return;
    }
    qCInfo(lcApp) << "Starting scheduler, tick every" << m_timer.interval() << "ms";
    m_timer.start();
    tick();
}

void TaskScheduler::stop()
{
    if (m_timer.isActive()) {
        m_timer.stop();
        qCInfo(lcApp) << "Scheduler stopped";
    }
}

bool TaskScheduler::isRunning() const
{
    return m_timer.isActive();
}

void TaskScheduler::tick()
{
    if (m_state == State::Busy) {
        ++m_skippedTicks;
        qCDebug(lcApp) << "Tick skipped, previous tick still running";
        return;
    }
    BusyGuard guard(m_state);

    const QDateTime now = m_clock.now();
    bool rebuild = false;

    if (now.date() != m_today) {
        qCInfo(lcApp) << "Day rollover to" << now.date().toString(Qt::ISODate);
        m_today = now.date();
        m_instances.clear();
        rebuild = true;
    }

    if (m_schedule.hasChanged()) {
        qCInfo(lcSchedule) << "Schedule file changed, reloading";
        QString error;
        if (m_schedule.reload(&error)) {
            m_rotations.rebuild(m_schedule.entries(), m_today);
            rebuild = true;
        } else {
            qCWarning(lcSchedule) << "Keeping previous schedule:" << error;
        }
    }

    if (rebuild) {
        rebuildInstances();
    }

    const RotationResolver resolver(m_rotations.table());
    m_engine->poll(m_instances, now, resolver);
    m_engine->updateSummaries(m_instances, now);
}

TaskScheduler::State TaskScheduler::state() const
{
    return m_state;
}

int TaskScheduler::skippedTicks() const
{
    return m_skippedTicks;
}

bool TaskScheduler::advanceAllRotations()
{
    const bool persisted = m_rotations.advanceAll();
    qCInfo(lcRotation) << "Advanced" << m_rotations.table().size() << "rotations";
    rebuildInstances();
    m_engine->updateSummaries(m_instances, m_clock.now());
    return persisted;
}

bool TaskScheduler::injectTask(int secondsFromNow, const QString &participantOrCategory)
{
    const QString who = participantOrCategory.trimmed();
    if (who.isEmpty()) {
        qCWarning(lcApp) << "Cannot inject a task without a participant or category";
        return false;
    }
    const QDateTime now = m_clock.now();
    const QDateTime when = now.addSecs(qMax(0, secondsFromNow));
    if (when.date() != m_today) {
        qCWarning(lcApp) << "Injected task at" << when.toString(Qt::ISODate) << "is not today, ignored";
        return false;
    }

    data::ScheduleEntry entry;
    entry.time = when.time();
    entry.days = dayName(m_today);
    if (const auto category = data::categoryFromName(who)) {
        entry.participantSpec = QStringLiteral("All");
        entry.action = data::categoryName(*category);
        entry.label = QStringLiteral("Test %1").arg(entry.action);
    } else {
        entry.participantSpec = who;
        entry.action = QStringLiteral("test task");
        entry.label = QStringLiteral("Test");
    }
    entry.participants = data::splitParticipants(entry.participantSpec);

    TaskInstance instance;
    instance.entry = entry;
    instance.scheduledAt = QDateTime(m_today, entry.time);
    instance.assignedPerson = entry.firstParticipant();
    instance.adHoc = true;

    const data::TaskKey key = instance.key();
    m_instances[key] = std::move(instance);
    qCInfo(lcApp) << "Injected" << entry.action << "for" << entry.participantSpec << "at"
                  << entry.time.toString(QStringLiteral("HH:mm:ss"));
    m_engine->updateSummaries(m_instances, now);
    return true;
}

std::vector<AssignmentPreview> TaskScheduler::upcomingAssignments(int days) const
{
    std::vector<data::ScheduleEntry> entries = m_schedule.entries();
    std::stable_sort(entries.begin(), entries.end(), [](const data::ScheduleEntry &lhs, const data::ScheduleEntry &rhs) {
        return lhs.time < rhs.time;
    });

    const RotationResolver resolver(m_rotations.table());
    std::vector<AssignmentPreview> result;
    for (int offset = 0; offset < days; ++offset) {
        const QDate date = m_today.addDays(offset);
        const QString name = dayName(date);
        for (const data::ScheduleEntry &entry : entries) {
            if (!matchesDayRange(name, entry.days)) {
                continue;
            }
            result.push_back({ date, entry.time, resolver.assignedPersonOrFirst(entry, date), entry.action,
                               entry.label });
        }
    }
    return result;
}

const TaskInstanceMap &TaskScheduler::instances() const
{
    return m_instances;
}

const data::ScheduleStore &TaskScheduler::schedule() const
{
    return m_schedule;
}

const RotationStateStore &TaskScheduler::rotations() const
{
    return m_rotations;
}

data::ContentLibrary &TaskScheduler::content()
{
    return m_content;
}

TaskTriggerEngine &TaskScheduler::engine()
{
    return *m_engine;
}

QDate TaskScheduler::today() const
{
    return m_today;
}

bool TaskScheduler::rotationStateIsCurrent()
{
    QString error;
    if (!m_rotations.reload(&error)) {
        qCInfo(lcRotation) << "Rebuilding rotation state:" << error;
        return false;
    }
    if (!m_rotations.coversSchedule(m_schedule.entries())) {
        qCInfo(lcRotation) << "Rotation state does not match the schedule, rebuilding";
        return false;
    }
    const QDateTime saved = m_rotationRepository.lastSaved();
    const QDateTime scheduleModified = m_schedule.loadedModificationTime();
    if (saved.isValid() && scheduleModified.isValid() && scheduleModified > saved) {
        qCInfo(lcRotation) << "Schedule modified after rotation state was saved, rebuilding";
        return false;
    }
    return true;
}

void TaskScheduler::rebuildInstances()
{
    const RotationResolver resolver(m_rotations.table());
    m_instances = TodaysTaskBuilder::build(m_schedule.entries(), m_today, resolver, m_instances);
    qCInfo(lcSchedule) << m_instances.size() << "tasks today";
    emit instancesRebuilt();
}

} // namespace core
} // namespace chorewheel
