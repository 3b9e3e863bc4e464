#include "chorewheel/data/ScheduleStore.hpp"

#include "chorewheel/core/DayRange.hpp"
#include "chorewheel/core/Logging.hpp"
#include "chorewheel/data/Csv.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace chorewheel {
namespace data {

namespace {
const auto HEADER_FIRST_COLUMN = QStringLiteral("Time");

QTime parseTime(const QString &value)
{
    const QString trimmed = value.trimmed();
    QTime time = QTime::fromString(trimmed, QStringLiteral("H:mm"));
    if (!time.isValid()) {
        time = QTime::fromString(trimmed, QStringLiteral("HH:mm"));
    }
    return time;
}
} // namespace

ScheduleStore::ScheduleStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &ScheduleStore::filePath() const
{
    return m_filePath;
}

const std::vector<ScheduleEntry> &ScheduleStore::entries() const
{
    return m_entries;
}

bool ScheduleStore::ensureExists()
{
    if (QFileInfo::exists(m_filePath)) {
        return true;
    }
    qCInfo(lcSchedule) << "No schedule found, writing sample to" << m_filePath;
    return writeSample(m_filePath);
}

bool ScheduleStore::reload(QString *errorMessage)
{
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        qCWarning(lcSchedule) << "Cannot read schedule" << m_filePath << file.errorString();
        return false;
    }

    const QFileInfo info(m_filePath);
    m_loadedModified = info.lastModified();
    m_loadedSize = info.size();
    m_loaded = true;

    const auto rows = csv::readRows(file);
    std::vector<ScheduleEntry> entries;
    entries.reserve(static_cast<size_t>(rows.size()));
    int rowNumber = 0;
    for (const QStringList &row : rows) {
        ++rowNumber;
        if (rowNumber == 1 && csv::isHeaderRow(row, HEADER_FIRST_COLUMN)) {
            continue;
        }
        if (row.first().trimmed().startsWith('#')) {
            continue;
        }
        QString error;
        auto entry = parseRow(row, &error);
        if (!entry) {
            qCWarning(lcSchedule).noquote() << QStringLiteral("Skipping schedule row %1: %2 [%3]")
                                                   .arg(rowNumber)
                                                   .arg(error, csv::formatLine(row));
            continue;
        }
        entries.push_back(std::move(*entry));
    }

    m_entries = std::move(entries);
    qCInfo(lcSchedule) << "Loaded" << m_entries.size() << "schedule entries from" << m_filePath;
    return true;
}

bool ScheduleStore::hasChanged() const
{
    const QFileInfo info(m_filePath);
    if (!info.exists()) {
        return false;
    }
    if (!m_loaded) {
        return true;
    }
    return info.lastModified() != m_loadedModified || info.size() != m_loadedSize;
}

QDateTime ScheduleStore::loadedModificationTime() const
{
    return m_loadedModified;
}

std::vector<ScheduleEntry> ScheduleStore::rotatingEntries() const
{
    std::vector<ScheduleEntry> result;
    for (const ScheduleEntry &entry : m_entries) {
        if (entry.isRotating()) {
            result.push_back(entry);
        }
    }
    return result;
}

std::optional<ScheduleEntry> ScheduleStore::parseRow(const QStringList &columns, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) -> std::optional<ScheduleEntry> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    if (columns.size() < 4) {
        return fail(QStringLiteral("expected at least 4 columns, got %1").arg(columns.size()));
    }

    ScheduleEntry entry;
    entry.time = parseTime(columns.at(0));
    if (!entry.time.isValid()) {
        return fail(QStringLiteral("bad time '%1'").arg(columns.at(0)));
    }

    entry.participantSpec = columns.at(1).trimmed();
    entry.participants = splitParticipants(entry.participantSpec);
    if (entry.participants.isEmpty()) {
        return fail(QStringLiteral("no participants"));
    }

    entry.days = columns.at(2).trimmed();
    if (!core::isValidDayRange(entry.days)) {
        return fail(QStringLiteral("unknown day spec '%1'").arg(columns.at(2)));
    }

    entry.action = columns.at(3).trimmed();
    if (entry.action.isEmpty()) {
        return fail(QStringLiteral("empty action"));
    }

    entry.label = columns.size() > 4 ? columns.at(4).trimmed() : QString();
    if (entry.label.isEmpty()) {
        entry.label = entry.action;
    }
    return entry;
}

bool ScheduleStore::writeSample(const QString &filePath)
{
    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcSchedule) << "Cannot write sample schedule" << filePath << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    csv::writeRow(stream, { QStringLiteral("Time"), QStringLiteral("Name"), QStringLiteral("Days"),
                            QStringLiteral("Action"), QStringLiteral("Label") });
    csv::writeRow(stream, { QStringLiteral("07:15"), QStringLiteral("Alice:Tom"), QStringLiteral("Monday-Friday"),
                            QStringLiteral("feed the cat"), QStringLiteral("Cat") });
    csv::writeRow(stream, { QStringLiteral("18:30"), QStringLiteral("Frank:Alice:Tom"),
                            QStringLiteral("Sunday-Saturday"), QStringLiteral("set the table"),
                            QStringLiteral("Table") });
    csv::writeRow(stream, { QStringLiteral("19:00"), QStringLiteral("Frank"), QStringLiteral("Monday,Thursday"),
                            QStringLiteral("take out the trash"), QStringLiteral("Trash") });
    csv::writeRow(stream, { QStringLiteral("20:00"), QStringLiteral("Frank:Alice:Tom"),
                            QStringLiteral("Monday-Friday"), QStringLiteral("shower"), QStringLiteral("Shower") });
    csv::writeRow(stream, { QStringLiteral("20:30"), QStringLiteral("All"), QStringLiteral("Friday-Sunday"),
                            QStringLiteral("story"), QStringLiteral("Story time") });
    stream.flush();

    if (!file.commit()) {
        qCWarning(lcSchedule) << "Cannot commit sample schedule" << filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace chorewheel
