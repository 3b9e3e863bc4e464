#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <optional>

#include "chorewheel/core/TaskInstance.hpp"

namespace chorewheel {
namespace data {
class ContentLibrary;
class TaskLog;
}

namespace core {

class RotationResolver;

class TaskTriggerEngine : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultTriggerWindowSeconds = 20;
    static constexpr int DefaultExpiryMinutes = 60;

    explicit TaskTriggerEngine(data::ContentLibrary *content, data::TaskLog *log, QObject *parent = nullptr);

    void setTriggerWindowSeconds(int seconds);
    int triggerWindowSeconds() const;
    void setExpiryMinutes(int minutes);
    int expiryMinutes() const;

    // Expires stale instances, then fires at most one due instance.
    // Returns the key of the fired instance.
    std::optional<data::TaskKey> poll(TaskInstanceMap &instances,
                                      const QDateTime &now,
                                      const RotationResolver &resolver);

    // Recomputes the next/last summaries and emits the ones that changed.
    void updateSummaries(const TaskInstanceMap &instances, const QDateTime &now);

    QString nextSummary() const;
    QString lastSummary() const;

    static const TaskInstance *nextTask(const TaskInstanceMap &instances, const QDateTime &now);
    static const TaskInstance *lastTask(const TaskInstanceMap &instances);
    static QString summaryText(const TaskInstance &instance);
    static QString displayText(const TaskInstance &instance);
    static QString speechText(const TaskInstance &instance);

signals:
    void taskFired(const chorewheel::core::TaskInstance &instance, const QString &displayText, const QString &speechText);
    void nextTaskChanged(const QString &summary);
    void lastTaskChanged(const QString &summary);

private:
    void fire(TaskInstance &instance, const QDateTime &now, const RotationResolver &resolver);

    data::ContentLibrary *m_content = nullptr;
    data::TaskLog *m_log = nullptr;
    int m_triggerWindowSeconds = DefaultTriggerWindowSeconds;
    int m_expiryMinutes = DefaultExpiryMinutes;
    QString m_nextSummary;
    QString m_lastSummary;
};

} // namespace core
} // namespace chorewheel
