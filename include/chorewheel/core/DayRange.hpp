#pragma once

#include <QDate>
#include <QString>

namespace chorewheel {
namespace core {

// Canonical English day names, Sunday = 0 .. Saturday = 6.
QString dayName(int dayIndex);
QString dayName(const QDate &date);

// Returns -1 for anything that is not a canonical day name.
int dayIndex(const QString &name);

bool matchesDayRange(const QString &currentDayName, const QString &rangeSpec);
bool matchesDayRange(const QDate &date, const QString &rangeSpec);

// True when every day name referenced by the spec is known, so the spec can
// match at least one day of the week.
bool isValidDayRange(const QString &rangeSpec);

} // namespace core
} // namespace chorewheel
