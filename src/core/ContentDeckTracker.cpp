#include "chorewheel/core/ContentDeckTracker.hpp"

#include <QRandomGenerator>
#include <QVector>

namespace chorewheel {
namespace core {

int ContentDeckTracker::draw(int itemCount, QSet<int> &consumed, QRandomGenerator &random)
{
    if (itemCount <= 0) {
        return -1;
    }

    QSet<int> inRange;
    QVector<int> unused;
    unused.reserve(itemCount);
    for (int i = 0; i < itemCount; ++i) {
        if (consumed.contains(i)) {
            inRange.insert(i);
        } else {
            unused.append(i);
        }
    }

    int index = -1;
    if (unused.isEmpty()) {
        inRange.clear();
        index = random.bounded(itemCount);
    } else {
        index = unused.at(random.bounded(unused.size()));
    }
    inRange.insert(index);
    consumed = inRange;
    return index;
}

} // namespace core
} // namespace chorewheel
