#pragma once

#include <QDateTime>
#include <QString>
#include <QTime>

namespace chorewheel {
namespace data {

struct TaskLogRecord
{
    QDateTime firedAt;
    QTime scheduledTime;
    QString days;
    QString person;
    QString action;
};

// Append-only CSV of fired tasks.
class TaskLog
{
public:
    explicit TaskLog(QString filePath);

    const QString &filePath() const;
    bool append(const TaskLogRecord &record);

private:
    QString m_filePath;
};

} // namespace data
} // namespace chorewheel
