#include "chorewheel/data/TaskLog.hpp"

#include "chorewheel/core/Logging.hpp"
#include "chorewheel/data/Csv.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace chorewheel {
namespace data {

TaskLog::TaskLog(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &TaskLog::filePath() const
{
    return m_filePath;
}

bool TaskLog::append(const TaskLogRecord &record)
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    const bool isNew = !info.exists() || info.size() == 0;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qCWarning(lcTaskLog) << "Cannot open task log" << m_filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    if (isNew) {
        csv::writeRow(stream, { QStringLiteral("Date"), QStringLiteral("Time"), QStringLiteral("Scheduled"),
                                QStringLiteral("Days"), QStringLiteral("Person"), QStringLiteral("Action") });
    }
    const QString scheduled = record.scheduledTime.second() != 0
        ? record.scheduledTime.toString(QStringLiteral("HH:mm:ss"))
        : record.scheduledTime.toString(QStringLiteral("HH:mm"));
    csv::writeRow(stream, { record.firedAt.date().toString(QStringLiteral("yyyy-MM-dd")),
                            record.firedAt.time().toString(QStringLiteral("HH:mm:ss")), scheduled, record.days,
                            record.person, record.action });
    stream.flush();

    if (stream.status() != QTextStream::Ok || file.error() != QFileDevice::NoError) {
        qCWarning(lcTaskLog) << "Failed to append to task log" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace chorewheel
