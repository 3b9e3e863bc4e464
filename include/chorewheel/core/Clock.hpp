#pragma once

#include <QDateTime>

namespace chorewheel {
namespace core {

class Clock
{
public:
    virtual ~Clock() = default;

    virtual QDateTime now() const = 0;
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override;
};

} // namespace core
} // namespace chorewheel
