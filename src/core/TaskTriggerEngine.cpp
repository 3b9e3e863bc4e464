#include "chorewheel/core/TaskTriggerEngine.hpp"

#include "chorewheel/core/Logging.hpp"
#include "chorewheel/core/RotationResolver.hpp"
#include "chorewheel/data/ContentLibrary.hpp"
#include "chorewheel/data/TaskLog.hpp"

#include <QtGlobal>

namespace chorewheel {
namespace core {

namespace {
const auto NO_NEXT_TASK = QStringLiteral("No more tasks today");
const auto NO_LAST_TASK = QStringLiteral("Nothing yet today");

QString formatTime(const QTime &time)
{
    return time.second() != 0 ? time.toString(QStringLiteral("HH:mm:ss")) : time.toString(QStringLiteral("HH:mm"));
}
} // namespace

TaskTriggerEngine::TaskTriggerEngine(data::ContentLibrary *content, data::TaskLog *log, QObject *parent)
    : QObject(parent)
    , m_content(content)
    , m_log(log)
{
    qRegisterMetaType<chorewheel::core::TaskInstance>();
}

void TaskTriggerEngine::setTriggerWindowSeconds(int seconds)
{
    m_triggerWindowSeconds = qMax(0, seconds);
}

int TaskTriggerEngine::triggerWindowSeconds() const
{
    return m_triggerWindowSeconds;
}

void TaskTriggerEngine::setExpiryMinutes(int minutes)
{
    m_expiryMinutes = qMax(1, minutes);
}

int TaskTriggerEngine::expiryMinutes() const
{
    return m_expiryMinutes;
}

std::optional<data::TaskKey> TaskTriggerEngine::poll(TaskInstanceMap &instances,
                                                     const QDateTime &now,
                                                     const RotationResolver &resolver)
{
    const QDateTime expiryCutoff = now.addSecs(-60LL * m_expiryMinutes);
    for (auto &item : instances) {
        TaskInstance &instance = item.second;
        if (instance.isPending() && instance.scheduledAt < expiryCutoff) {
            instance.completed = true;
            qCInfo(lcTrigger) << "Expired without firing:" << summaryText(instance);
        }
    }

    for (auto &item : instances) {
        TaskInstance &instance = item.second;
        if (!instance.isPending()) {
            continue;
        }
        const qint64 distance = qAbs(now.secsTo(instance.scheduledAt));
        if (distance <= m_triggerWindowSeconds) {
            fire(instance, now, resolver);
            return item.first;
        }
    }
    return std::nullopt;
}

void TaskTriggerEngine::fire(TaskInstance &instance, const QDateTime &now, const RotationResolver &resolver)
{
    if (instance.assignedPerson.isEmpty()) {
        instance.assignedPerson = resolver.assignedPersonOrFirst(instance.entry, instance.scheduledAt.date());
    }

    QString display = displayText(instance);
    QString speech = speechText(instance);
    if (const auto category = data::contentCategoryForAction(instance.entry.action)) {
        if (m_content) {
            if (const auto item = m_content->draw(*category)) {
                display = QStringLiteral("%1: %2").arg(instance.entry.label, *item);
                speech = *item;
            }
        }
    }

    if (m_log) {
        data::TaskLogRecord record;
        record.firedAt = now;
        record.scheduledTime = instance.entry.time;
        record.days = instance.entry.days;
        record.person = instance.assignedPerson;
        record.action = instance.entry.action;
        if (!m_log->append(record)) {
            qCWarning(lcTrigger) << "Task log append failed for" << instance.entry.action;
        }
    }

    instance.called = true;
    instance.completed = true;
    qCInfo(lcTrigger).noquote() << "Fired" << display;
    emit taskFired(instance, display, speech);
}

void TaskTriggerEngine::updateSummaries(const TaskInstanceMap &instances, const QDateTime &now)
{
    const TaskInstance *next = nextTask(instances, now);
    const QString nextText = next ? summaryText(*next) : NO_NEXT_TASK;
    if (nextText != m_nextSummary) {
        m_nextSummary = nextText;
        emit nextTaskChanged(m_nextSummary);
    }

    const TaskInstance *last = lastTask(instances);
    const QString lastText = last ? summaryText(*last) : NO_LAST_TASK;
    if (lastText != m_lastSummary) {
        m_lastSummary = lastText;
        emit lastTaskChanged(m_lastSummary);
    }
}

QString TaskTriggerEngine::nextSummary() const
{
    return m_nextSummary;
}

QString TaskTriggerEngine::lastSummary() const
{
    return m_lastSummary;
}

const TaskInstance *TaskTriggerEngine::nextTask(const TaskInstanceMap &instances, const QDateTime &now)
{
    const TaskInstance *best = nullptr;
    for (const auto &item : instances) {
        const TaskInstance &instance = item.second;
        if (!instance.isPending() || instance.scheduledAt < now) {
            continue;
        }
        if (!best || instance.scheduledAt < best->scheduledAt) {
            best = &instance;
        }
    }
    return best;
}

const TaskInstance *TaskTriggerEngine::lastTask(const TaskInstanceMap &instances)
{
    const TaskInstance *best = nullptr;
    for (const auto &item : instances) {
        const TaskInstance &instance = item.second;
        if (!instance.called) {
            continue;
        }
        if (!best || instance.scheduledAt > best->scheduledAt) {
            best = &instance;
        }
    }
    return best;
}

QString TaskTriggerEngine::summaryText(const TaskInstance &instance)
{
    const QString person = instance.assignedPerson.isEmpty() ? instance.entry.firstParticipant()
                                                             : instance.assignedPerson;
    return QStringLiteral("%1 %2 - %3").arg(formatTime(instance.entry.time), instance.entry.label, person);
}

QString TaskTriggerEngine::displayText(const TaskInstance &instance)
{
    return QStringLiteral("%1  %2: %3")
        .arg(formatTime(instance.entry.time), instance.assignedPerson, instance.entry.action);
}

QString TaskTriggerEngine::speechText(const TaskInstance &instance)
{
    return QStringLiteral("%1, it's time to %2.").arg(instance.assignedPerson, instance.entry.action);
}

} // namespace core
} // namespace chorewheel
