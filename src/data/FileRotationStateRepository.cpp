#include "chorewheel/data/FileRotationStateRepository.hpp"

#include "chorewheel/core/Logging.hpp"
#include "chorewheel/data/Csv.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>
#include <utility>
#include <vector>

namespace chorewheel {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";
const auto HEADER_FIRST_COLUMN = QStringLiteral("RotationKey");

struct StateRow
{
    RotationKey key;
    QDate anchor;
    int position = 0;
    QString name;
};

bool parseFlag(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QLatin1String("true") || normalized == QLatin1String("1")
        || normalized == QLatin1String("yes");
}

bool fail(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}
} // namespace

FileRotationStateRepository::FileRotationStateRepository(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &FileRotationStateRepository::filePath() const
{
    return m_filePath;
}

std::optional<RotationTable> FileRotationStateRepository::load(QString *errorMessage) const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        fail(errorMessage, QStringLiteral("rotation state file does not exist"));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        fail(errorMessage, file.errorString());
        return std::nullopt;
    }

    std::map<RotationKey, std::vector<StateRow>> grouped;
    const auto rows = csv::readRows(file);
    int rowNumber = 0;
    for (const QStringList &row : rows) {
        ++rowNumber;
        if (rowNumber == 1 && csv::isHeaderRow(row, HEADER_FIRST_COLUMN)) {
            continue;
        }
        if (row.size() < 4) {
            fail(errorMessage, QStringLiteral("row %1: expected 5 columns").arg(rowNumber));
            return std::nullopt;
        }
        if (row.size() > 4 && !parseFlag(row.at(4))) {
            continue;
        }

        StateRow parsed;
        if (!RotationKey::fromString(row.at(0), &parsed.key)) {
            fail(errorMessage, QStringLiteral("row %1: bad rotation key '%2'").arg(rowNumber).arg(row.at(0)));
            return std::nullopt;
        }
        parsed.anchor = QDate::fromString(row.at(1).trimmed(), QLatin1String(DATE_FORMAT));
        if (!parsed.anchor.isValid()) {
            fail(errorMessage, QStringLiteral("row %1: bad anchor date '%2'").arg(rowNumber).arg(row.at(1)));
            return std::nullopt;
        }
        bool ok = false;
        parsed.position = row.at(2).trimmed().toInt(&ok);
        if (!ok || parsed.position < 1) {
            fail(errorMessage, QStringLiteral("row %1: bad position '%2'").arg(rowNumber).arg(row.at(2)));
            return std::nullopt;
        }
        parsed.name = row.at(3).trimmed();
        if (parsed.name.isEmpty()) {
            fail(errorMessage, QStringLiteral("row %1: empty name").arg(rowNumber));
            return std::nullopt;
        }
        grouped[parsed.key].push_back(std::move(parsed));
    }

    RotationTable table;
    for (auto &group : grouped) {
        auto &members = group.second;
        std::sort(members.begin(), members.end(), [](const StateRow &lhs, const StateRow &rhs) {
            return lhs.position < rhs.position;
        });

        RotationDefinition definition;
        definition.key = group.first;
        definition.anchorDate = members.front().anchor;
        for (size_t i = 0; i < members.size(); ++i) {
            const StateRow &member = members.at(i);
            if (member.position != static_cast<int>(i) + 1) {
                fail(errorMessage, QStringLiteral("%1: positions are not contiguous").arg(group.first.toString()));
                return std::nullopt;
            }
            if (member.anchor != definition.anchorDate) {
                fail(errorMessage, QStringLiteral("%1: conflicting anchor dates").arg(group.first.toString()));
                return std::nullopt;
            }
            definition.participants << member.name;
        }
        table.emplace(group.first, std::move(definition));
    }
    return table;
}

bool FileRotationStateRepository::save(const RotationTable &table, QString *errorMessage)
{
    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcRotation) << "Cannot open rotation state for writing" << m_filePath << file.errorString();
        return fail(errorMessage, file.errorString());
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    csv::writeRow(stream, { HEADER_FIRST_COLUMN, QStringLiteral("AnchorDate"), QStringLiteral("Position"),
                            QStringLiteral("Name"), QStringLiteral("Rotating") });
    for (const auto &item : table) {
        const RotationDefinition &definition = item.second;
        const QString key = definition.key.toString();
        const QString anchor = definition.anchorDate.toString(QLatin1String(DATE_FORMAT));
        for (int i = 0; i < definition.participants.size(); ++i) {
            csv::writeRow(stream, { key, anchor, QString::number(i + 1), definition.participants.at(i),
                                    QStringLiteral("true") });
        }
    }
    stream.flush();

    if (stream.status() != QTextStream::Ok || !file.commit()) {
        qCWarning(lcRotation) << "Cannot commit rotation state" << m_filePath << file.errorString();
        return fail(errorMessage, QStringLiteral("cannot commit %1: %2").arg(m_filePath, file.errorString()));
    }
    return true;
}

QDateTime FileRotationStateRepository::lastSaved() const
{
    const QFileInfo info(m_filePath);
    if (!info.exists()) {
        return {};
    }
    return info.lastModified();
}

} // namespace data
} // namespace chorewheel
