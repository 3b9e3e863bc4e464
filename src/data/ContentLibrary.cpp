#include "chorewheel/data/ContentLibrary.hpp"

#include "chorewheel/core/ContentDeckTracker.hpp"
#include "chorewheel/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRandomGenerator>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace chorewheel {
namespace data {

QString categoryName(ContentCategory category)
{
    switch (category) {
    case ContentCategory::Quote:
        return QStringLiteral("quotes");
    case ContentCategory::Joke:
        return QStringLiteral("jokes");
    case ContentCategory::Story:
    default:
        return QStringLiteral("stories");
    }
}

std::optional<ContentCategory> categoryFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("story") || normalized == QLatin1String("stories")) {
        return ContentCategory::Story;
    }
    if (normalized == QLatin1String("quote") || normalized == QLatin1String("quotes")) {
        return ContentCategory::Quote;
    }
    if (normalized == QLatin1String("joke") || normalized == QLatin1String("jokes")) {
        return ContentCategory::Joke;
    }
    return std::nullopt;
}

std::optional<ContentCategory> contentCategoryForAction(const QString &action)
{
    return categoryFromName(action);
}

ContentLibrary::ContentLibrary(QString directory, QRandomGenerator *random)
    : m_directory(std::move(directory))
    , m_random(random ? random : QRandomGenerator::global())
{
}

QString ContentLibrary::itemsPath(ContentCategory category) const
{
    return QDir(m_directory).filePath(categoryName(category) + QStringLiteral(".txt"));
}

QString ContentLibrary::trackerPath(ContentCategory category) const
{
    return QDir(m_directory).filePath(categoryName(category) + QStringLiteral("_used.txt"));
}

QStringList ContentLibrary::items(ContentCategory category) const
{
    QStringList result;
    QFile file(itemsPath(category));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return result;
    }
    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    while (!stream.atEnd()) {
        const QString line = stream.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        result << line;
    }
    return result;
}

QSet<int> ContentLibrary::consumed(ContentCategory category) const
{
    return readTracker(trackerPath(category));
}

std::optional<QString> ContentLibrary::draw(ContentCategory category)
{
    const QStringList available = items(category);
    if (available.isEmpty()) {
        qCWarning(lcContent) << "No items for" << categoryName(category) << "in" << itemsPath(category);
        return std::nullopt;
    }

    QSet<int> used = consumed(category);
    const int index = core::ContentDeckTracker::draw(available.size(), used, *m_random);
    if (!writeTracker(trackerPath(category), used)) {
        qCWarning(lcContent) << "Cannot persist tracker for" << categoryName(category);
    }
    qCDebug(lcContent) << "Drew" << categoryName(category) << index << "consumed" << used.size() << "of"
                       << available.size();
    return available.at(index);
}

QSet<int> ContentLibrary::readTracker(const QString &filePath)
{
    QSet<int> result;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return result;
    }
    QTextStream stream(&file);
    while (!stream.atEnd()) {
        const QString line = stream.readLine().trimmed();
        if (line.isEmpty()) {
            continue;
        }
        bool ok = false;
        const int index = line.toInt(&ok);
        if (!ok || index < 0) {
            qCWarning(lcContent) << "Ignoring tracker value" << line << "in" << filePath;
            continue;
        }
        result.insert(index);
    }
    return result;
}

bool ContentLibrary::writeTracker(const QString &filePath, const QSet<int> &consumed)
{
    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return false;
    }
    QList<int> sorted = consumed.values();
    std::sort(sorted.begin(), sorted.end());

    QTextStream stream(&file);
    for (int index : sorted) {
        stream << index << '\n';
    }
    stream.flush();
    return file.commit();
}

} // namespace data
} // namespace chorewheel
