#include "chorewheel/core/Clock.hpp"

namespace chorewheel {
namespace core {

QDateTime SystemClock::now() const
{
    return QDateTime::currentDateTime();
}

} // namespace core
} // namespace chorewheel
