#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

class QRandomGenerator;

namespace chorewheel {
namespace data {

enum class ContentCategory
{
    Story,
    Quote,
    Joke,
};

// "stories", "quotes" or "jokes"; also the stem of the category's files.
QString categoryName(ContentCategory category);
std::optional<ContentCategory> categoryFromName(const QString &name);

// Actions such as "story" or "Jokes" name a content category.
std::optional<ContentCategory> contentCategoryForAction(const QString &action);

// Item files (<stem>.txt, one item per line) and consumed-index trackers
// (<stem>_used.txt) live side by side in one directory.
class ContentLibrary
{
public:
    explicit ContentLibrary(QString directory, QRandomGenerator *random = nullptr);

    QStringList items(ContentCategory category) const;
    QSet<int> consumed(ContentCategory category) const;

    // Draws an unseen item and persists the tracker. std::nullopt when the
    // category has no items.
    std::optional<QString> draw(ContentCategory category);

    QString itemsPath(ContentCategory category) const;
    QString trackerPath(ContentCategory category) const;

    static QSet<int> readTracker(const QString &filePath);
    static bool writeTracker(const QString &filePath, const QSet<int> &consumed);

private:
    QString m_directory;
    QRandomGenerator *m_random = nullptr;
};

} // namespace data
} // namespace chorewheel
