#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "chorewheel/data/ScheduleEntry.hpp"

namespace chorewheel {
namespace data {

class ScheduleStore
{
public:
    explicit ScheduleStore(QString filePath);

    const QString &filePath() const;
    const std::vector<ScheduleEntry> &entries() const;

    // Writes the sample schedule when no schedule file exists yet.
    bool ensureExists();

    // Replaces the entries wholesale. Malformed rows are skipped with a
    // warning. Returns false only when the file cannot be read at all, in
    // which case the previous entries are kept.
    bool reload(QString *errorMessage = nullptr);

    // True when the file on disk differs (mtime or size) from what was
    // last loaded.
    bool hasChanged() const;
    QDateTime loadedModificationTime() const;

    std::vector<ScheduleEntry> rotatingEntries() const;

    static std::optional<ScheduleEntry> parseRow(const QStringList &columns, QString *errorMessage = nullptr);
    static bool writeSample(const QString &filePath);

private:
    QString m_filePath;
    std::vector<ScheduleEntry> m_entries;
    QDateTime m_loadedModified;
    qint64 m_loadedSize = -1;
    bool m_loaded = false;
};

} // namespace data
} // namespace chorewheel
