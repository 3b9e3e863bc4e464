#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

class QIODevice;
class QTextStream;

namespace chorewheel {
namespace data {
namespace csv {

// Splits one CSV line into fields. Double-quoted fields may contain commas
// and doubled quotes; fields are not trimmed.
QStringList parseLine(const QString &line);

// Quotes a field only when it contains a comma, a quote or surrounding
// whitespace.
QString formatField(const QString &field);
QString formatLine(const QStringList &fields);

// Reads all non-empty lines of a UTF-8 file, BOM stripped. The first row is
// returned like any other; callers decide whether it is a header.
QVector<QStringList> readRows(QIODevice &device);

void writeRow(QTextStream &stream, const QStringList &fields);

bool isHeaderRow(const QStringList &row, const QString &firstColumn);

} // namespace csv
} // namespace data
} // namespace chorewheel
