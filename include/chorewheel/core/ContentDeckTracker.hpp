#pragma once

#include <QSet>

class QRandomGenerator;

namespace chorewheel {
namespace core {

// Draws without replacement. Once every index has been consumed the tracker
// is cleared and the draw starts a new round.
class ContentDeckTracker
{
public:
    // Returns the drawn index and records it in consumed, or -1 for an empty
    // deck. Indices outside [0, itemCount) are dropped from consumed.
    static int draw(int itemCount, QSet<int> &consumed, QRandomGenerator &random);
};

} // namespace core
} // namespace chorewheel
