#include "chorewheel/data/Csv.hpp"

#include <QIODevice>
#include <QTextStream>

namespace chorewheel {
namespace data {
namespace csv {

namespace {
const QChar QUOTE('"');
const QChar DELIMITER(',');
const QChar BOM(0xFEFF);
} // namespace

QStringList parseLine(const QString &line)
{
    QStringList fields;
    QString current;
    bool inQuotes = false;

    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line.at(i);
        if (inQuotes) {
            if (ch == QUOTE) {
                if (i + 1 < line.size() && line.at(i + 1) == QUOTE) {
                    current += QUOTE;
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += ch;
            }
            continue;
        }
        if (ch == QUOTE) {
            inQuotes = true;
        } else if (ch == DELIMITER) {
            fields << current;
            current.clear();
        } else {
            current += ch;
        }
    }
    fields << current;
    return fields;
}

QString formatField(const QString &field)
{
    const bool needsQuotes = field.contains(DELIMITER) || field.contains(QUOTE)
        || field.contains('\n') || field != field.trimmed();
    if (!needsQuotes) {
        return field;
    }
    QString escaped = field;
    escaped.replace(QUOTE, QStringLiteral("\"\""));
    return QUOTE + escaped + QUOTE;
}

QString formatLine(const QStringList &fields)
{
    QStringList formatted;
    formatted.reserve(fields.size());
    for (const QString &field : fields) {
        formatted << formatField(field);
    }
    return formatted.join(DELIMITER);
}

QVector<QStringList> readRows(QIODevice &device)
{
    QVector<QStringList> rows;
    QTextStream stream(&device);
    stream.setCodec("UTF-8");

    bool firstLine = true;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (firstLine) {
            if (line.startsWith(BOM)) {
                line.remove(0, 1);
            }
            firstLine = false;
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }
        rows.append(parseLine(line));
    }
    return rows;
}

void writeRow(QTextStream &stream, const QStringList &fields)
{
    stream << formatLine(fields) << '\n';
}

bool isHeaderRow(const QStringList &row, const QString &firstColumn)
{
    return !row.isEmpty() && row.first().trimmed().compare(firstColumn, Qt::CaseInsensitive) == 0;
}

} // namespace csv
} // namespace data
} // namespace chorewheel
