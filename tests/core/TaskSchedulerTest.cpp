#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>

#include "chorewheel/core/Clock.hpp"
#include "chorewheel/core/TaskScheduler.hpp"
#include "chorewheel/core/TaskTriggerEngine.hpp"
#include "chorewheel/data/FileRotationStateRepository.hpp"
#include "chorewheel/data/InMemoryRotationStateRepository.hpp"

using namespace chorewheel;

namespace {

class ManualClock : public core::Clock
{
public:
    explicit ManualClock(const QDateTime &now)
        : m_now(now)
    {
    }

    QDateTime now() const override { return m_now; }
    void set(const QDateTime &now) { m_now = now; }
    void advance(int seconds) { m_now = m_now.addSecs(seconds); }

private:
    QDateTime m_now;
};

// Wednesday
const QDate TODAY(2024, 5, 8);

bool writeFile(const QString &path, const QByteArray &contents)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

bool writeSchedule(const QString &path, const QByteArray &rows)
{
    return writeFile(path, QByteArrayLiteral("Time,Name,Days,Action,Label\n") + rows);
}

} // namespace

class TaskSchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void initializeWritesSampleSchedule();
    void firesDueTaskOnce();
    void reentrantTickIsSkipped();
    void scheduleChangeRebuildsRotations();
    void editedRowFiresOnlyAtNewTime();
    void dayRolloverRebuildsInstances();
    void injectsParticipantTask();
    void injectsContentTask();
    void rejectsInvalidInjection();
    void advanceMovesTodaysAssignee();
    void upcomingAssignmentsSortedByTime();
    void restartReusesSavedRotations();
    void corruptRotationStateIsRebuilt();
    void startAndStop();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    core::AppSettings m_settings;
};

void TaskSchedulerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_settings = core::AppSettings();
    m_settings.dataDir = m_dir->path();
}

void TaskSchedulerTest::cleanup()
{
    m_dir.reset();
}

void TaskSchedulerTest::initializeWritesSampleSchedule()
{
    ManualClock clock(QDateTime(TODAY, QTime(6, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);

    QVERIFY(scheduler.initialize());
    QVERIFY(QFile::exists(m_settings.schedulePath()));
    QCOMPARE(scheduler.schedule().entries().size(), static_cast<size_t>(5));
    QCOMPARE(scheduler.rotations().table().size(), static_cast<size_t>(3));
    QCOMPARE(repository.saveCount(), 1);

    // Cat, table and shower run on Wednesdays; trash and story do not.
    QCOMPARE(scheduler.instances().size(), static_cast<size_t>(3));
    for (const auto &item : scheduler.instances()) {
        QVERIFY(item.second.isPending());
        QCOMPARE(item.second.assignedPerson, item.second.entry.firstParticipant());
    }
    QCOMPARE(scheduler.engine().nextSummary(), QStringLiteral("07:15 Cat - Alice"));
}

void TaskSchedulerTest::firesDueTaskOnce()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(9, 59, 50)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    QSignalSpy fired(&scheduler.engine(), &core::TaskTriggerEngine::taskFired);
    scheduler.tick();
    QCOMPARE(fired.count(), 1);
    QCOMPARE(fired.first().at(1).toString(), QStringLiteral("10:00  Alice: dishes"));

    clock.advance(5);
    scheduler.tick();
    clock.advance(10);
    scheduler.tick();
    QCOMPARE(fired.count(), 1);
    QVERIFY(QFile::exists(m_settings.taskLogPath()));
    QCOMPARE(scheduler.engine().lastSummary(), QStringLiteral("10:00 Dishes - Alice"));
}

void TaskSchedulerTest::reentrantTickIsSkipped()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(10, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    core::TaskScheduler::State stateDuringFire = core::TaskScheduler::State::Idle;
    connect(&scheduler.engine(), &core::TaskTriggerEngine::taskFired, this, [&]() {
        stateDuringFire = scheduler.state();
        scheduler.tick();
    });

    scheduler.tick();
    QCOMPARE(stateDuringFire, core::TaskScheduler::State::Busy);
    QCOMPARE(scheduler.skippedTicks(), 1);
    QCOMPARE(scheduler.state(), core::TaskScheduler::State::Idle);
}

void TaskSchedulerTest::scheduleChangeRebuildsRotations()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,A:B,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(10, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    QSignalSpy fired(&scheduler.engine(), &core::TaskTriggerEngine::taskFired);
    scheduler.tick();
    QCOMPARE(fired.count(), 1);

    QVERIFY(writeSchedule(m_settings.schedulePath(),
                          "10:00,A:B,All,dishes,Dishes\n21:00,C:D,All,lights,Lights\n"));
    QSignalSpy rebuilt(&scheduler, &core::TaskScheduler::instancesRebuilt);
    clock.advance(30);
    scheduler.tick();

    QCOMPARE(rebuilt.count(), 1);
    QCOMPARE(fired.count(), 1);
    QCOMPARE(scheduler.rotations().table().size(), static_cast<size_t>(2));
    for (const auto &item : scheduler.rotations().table()) {
        QCOMPARE(item.second.anchorDate, TODAY);
    }

    QCOMPARE(scheduler.instances().size(), static_cast<size_t>(2));
    const auto &dishes = scheduler.instances().begin()->second;
    QCOMPARE(dishes.entry.action, QStringLiteral("dishes"));
    QVERIFY(dishes.called);
    QCOMPARE(dishes.assignedPerson, QStringLiteral("A"));
    const auto &lights = std::next(scheduler.instances().begin())->second;
    QVERIFY(lights.isPending());
    QCOMPARE(lights.assignedPerson, QStringLiteral("C"));
}

void TaskSchedulerTest::editedRowFiresOnlyAtNewTime()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "20:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(12, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    QVERIFY(writeSchedule(m_settings.schedulePath(), "20:30,Alice,All,dishes,Evening dishes\n"));
    clock.advance(30);
    scheduler.tick();
    QCOMPARE(scheduler.instances().size(), static_cast<size_t>(1));
    QCOMPARE(scheduler.instances().begin()->second.scheduledAt, QDateTime(TODAY, QTime(20, 30)));

    QSignalSpy fired(&scheduler.engine(), &core::TaskTriggerEngine::taskFired);
    clock.set(QDateTime(TODAY, QTime(20, 0)));
    scheduler.tick();
    QCOMPARE(fired.count(), 0);
    clock.set(QDateTime(TODAY, QTime(20, 30)));
    scheduler.tick();
    QCOMPARE(fired.count(), 1);
}

void TaskSchedulerTest::dayRolloverRebuildsInstances()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(10, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());
    scheduler.tick();
    QVERIFY(scheduler.instances().begin()->second.called);

    clock.set(QDateTime(TODAY.addDays(1), QTime(0, 0, 5)));
    scheduler.tick();
    QCOMPARE(scheduler.today(), TODAY.addDays(1));
    QCOMPARE(scheduler.instances().size(), static_cast<size_t>(1));
    const auto &instance = scheduler.instances().begin()->second;
    QVERIFY(instance.isPending());
    QCOMPARE(instance.scheduledAt, QDateTime(TODAY.addDays(1), QTime(10, 0)));
}

void TaskSchedulerTest::injectsParticipantTask()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(12, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    QVERIFY(scheduler.injectTask(5, QStringLiteral("Tom")));
    QCOMPARE(scheduler.instances().size(), static_cast<size_t>(2));

    QSignalSpy fired(&scheduler.engine(), &core::TaskTriggerEngine::taskFired);
    clock.advance(5);
    scheduler.tick();

    QCOMPARE(fired.count(), 1);
    const auto instance = fired.first().at(0).value<core::TaskInstance>();
    QVERIFY(instance.adHoc);
    QCOMPARE(instance.assignedPerson, QStringLiteral("Tom"));
    QCOMPARE(fired.first().at(1).toString(), QStringLiteral("12:00:05  Tom: test task"));

    // The morning task was missed by more than an hour and expired silently.
    for (const auto &item : scheduler.instances()) {
        QVERIFY(item.second.completed);
    }
}

void TaskSchedulerTest::injectsContentTask()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    QVERIFY(writeFile(QDir(m_settings.contentDir()).filePath(QStringLiteral("jokes.txt")),
                      "Knock knock.\n"));
    ManualClock clock(QDateTime(TODAY, QTime(9, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    QVERIFY(scheduler.injectTask(0, QStringLiteral("Joke")));
    QSignalSpy fired(&scheduler.engine(), &core::TaskTriggerEngine::taskFired);
    scheduler.tick();

    QCOMPARE(fired.count(), 1);
    QCOMPARE(fired.first().at(1).toString(), QStringLiteral("Test jokes: Knock knock."));
    QCOMPARE(scheduler.content().consumed(data::ContentCategory::Joke), QSet<int>({ 0 }));
}

void TaskSchedulerTest::rejectsInvalidInjection()
{
    ManualClock clock(QDateTime(TODAY, QTime(23, 59, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());
    const auto before = scheduler.instances().size();

    QVERIFY(!scheduler.injectTask(5, QStringLiteral("  ")));
    QVERIFY(!scheduler.injectTask(120, QStringLiteral("Tom")));
    QCOMPARE(scheduler.instances().size(), before);
}

void TaskSchedulerTest::advanceMovesTodaysAssignee()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "20:00,A:B:C,All,shower,Shower\n"));
    ManualClock clock(QDateTime(TODAY, QTime(8, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());
    QCOMPARE(scheduler.instances().begin()->second.assignedPerson, QStringLiteral("A"));

    QVERIFY(scheduler.advanceAllRotations());
    QCOMPARE(repository.saveCount(), 2);
    QCOMPARE(scheduler.instances().begin()->second.assignedPerson, QStringLiteral("B"));
    QCOMPARE(scheduler.engine().nextSummary(), QStringLiteral("20:00 Shower - B"));

    const auto upcoming = scheduler.upcomingAssignments(3);
    QCOMPARE(upcoming.size(), static_cast<size_t>(3));
    QCOMPARE(upcoming.at(0).person, QStringLiteral("B"));
    QCOMPARE(upcoming.at(1).person, QStringLiteral("C"));
    QCOMPARE(upcoming.at(2).person, QStringLiteral("A"));
    QCOMPARE(upcoming.at(2).date, TODAY.addDays(2));
}

void TaskSchedulerTest::upcomingAssignmentsSortedByTime()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(),
                          "20:00,Frank,Wednesday,shower,Shower\n"
                          "07:15,Alice,Monday-Friday,feed the cat,Cat\n"
                          "09:00,Tom,Thursday,mow,Lawn\n"));
    ManualClock clock(QDateTime(TODAY, QTime(8, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    const auto upcoming = scheduler.upcomingAssignments(2);
    QCOMPARE(upcoming.size(), static_cast<size_t>(4));
    QCOMPARE(upcoming.at(0).label, QStringLiteral("Cat"));
    QCOMPARE(upcoming.at(1).label, QStringLiteral("Shower"));
    QCOMPARE(upcoming.at(2).label, QStringLiteral("Cat"));
    QCOMPARE(upcoming.at(2).date, TODAY.addDays(1));
    QCOMPARE(upcoming.at(3).label, QStringLiteral("Lawn"));
    QCOMPARE(upcoming.at(3).time, QTime(9, 0));
}

void TaskSchedulerTest::restartReusesSavedRotations()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "20:00,A:B:C,All,shower,Shower\n"));
    ManualClock clock(QDateTime(TODAY, QTime(8, 0)));
    {
        data::FileRotationStateRepository repository(m_settings.rotationStatePath());
        core::TaskScheduler scheduler(m_settings, clock, repository);
        QVERIFY(scheduler.initialize());
        QVERIFY(scheduler.advanceAllRotations());
    }

    clock.set(QDateTime(TODAY.addDays(1), QTime(8, 0)));
    data::FileRotationStateRepository repository(m_settings.rotationStatePath());
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());

    const auto &definition = scheduler.rotations().table().begin()->second;
    QCOMPARE(definition.anchorDate, TODAY.addDays(-1));
    QCOMPARE(scheduler.instances().begin()->second.assignedPerson, QStringLiteral("C"));
}

void TaskSchedulerTest::corruptRotationStateIsRebuilt()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "20:00,A:B:C,All,shower,Shower\n"));
    QVERIFY(writeFile(m_settings.rotationStatePath(),
                      "RotationKey,AnchorDate,Position,Name,Rotating\n"
                      "20:00|All|shower,not a date,1,A,true\n"));
    ManualClock clock(QDateTime(TODAY, QTime(8, 0)));
    data::FileRotationStateRepository repository(m_settings.rotationStatePath());
    core::TaskScheduler scheduler(m_settings, clock, repository);

    QVERIFY(scheduler.initialize());
    QCOMPARE(scheduler.rotations().table().size(), static_cast<size_t>(1));
    QCOMPARE(scheduler.rotations().table().begin()->second.anchorDate, TODAY);
    QVERIFY(repository.load().has_value());
}

void TaskSchedulerTest::startAndStop()
{
    QVERIFY(writeSchedule(m_settings.schedulePath(), "10:00,Alice,All,dishes,Dishes\n"));
    ManualClock clock(QDateTime(TODAY, QTime(9, 0)));
    data::InMemoryRotationStateRepository repository;
    core::TaskScheduler scheduler(m_settings, clock, repository);
    QVERIFY(scheduler.initialize());
    QVERIFY(!scheduler.isRunning());

    scheduler.start();
    QVERIFY(scheduler.isRunning());

    scheduler.start();
    QVERIFY(scheduler.isRunning());
    scheduler.stop();
    QVERIFY(!scheduler.isRunning());
}

QTEST_GUILESS_MAIN(TaskSchedulerTest)
#include "TaskSchedulerTest.moc"
