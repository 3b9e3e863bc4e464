#include <QtTest/QtTest>

#include "chorewheel/core/DayRange.hpp"

using namespace chorewheel::core;

class DayRangeTest : public QObject
{
    Q_OBJECT

private slots:
    void everyDaySpecs();
    void explicitSet();
    void simpleRange();
    void wrappingRange();
    void singleDay();
    void invalidSpecs();
    void dayNamesFromDates();
    void validation();
};

void DayRangeTest::everyDaySpecs()
{
    for (int i = 0; i < 7; ++i) {
        QVERIFY(matchesDayRange(dayName(i), QStringLiteral("Sunday-Saturday")));
        QVERIFY(matchesDayRange(dayName(i), QStringLiteral("All")));
        QVERIFY(matchesDayRange(dayName(i), QStringLiteral("*")));
    }
}

void DayRangeTest::explicitSet()
{
    const QString spec = QStringLiteral("Monday, Wednesday ,Friday");
    QVERIFY(matchesDayRange(QStringLiteral("Monday"), spec));
    QVERIFY(matchesDayRange(QStringLiteral("Wednesday"), spec));
    QVERIFY(matchesDayRange(QStringLiteral("Friday"), spec));
    QVERIFY(!matchesDayRange(QStringLiteral("Tuesday"), spec));
    QVERIFY(!matchesDayRange(QStringLiteral("Sunday"), spec));
}

void DayRangeTest::simpleRange()
{
    const QString spec = QStringLiteral("Monday-Friday");
    QVERIFY(!matchesDayRange(QStringLiteral("Sunday"), spec));
    QVERIFY(matchesDayRange(QStringLiteral("Monday"), spec));
    QVERIFY(matchesDayRange(QStringLiteral("Wednesday"), spec));
    QVERIFY(matchesDayRange(QStringLiteral("Friday"), spec));
    QVERIFY(!matchesDayRange(QStringLiteral("Saturday"), spec));
}

void DayRangeTest::wrappingRange()
{
    const QString spec = QStringLiteral("Friday-Monday");
    QStringList matched;
    for (int i = 0; i < 7; ++i) {
        if (matchesDayRange(dayName(i), spec)) {
            matched << dayName(i);
        }
    }
    QCOMPARE(matched, QStringList({ QStringLiteral("Sunday"), QStringLiteral("Monday"), QStringLiteral("Friday"),
                                    QStringLiteral("Saturday") }));

    // Deterministic across repeated calls.
    QCOMPARE(matchesDayRange(QStringLiteral("Tuesday"), spec), matchesDayRange(QStringLiteral("Tuesday"), spec));
}

void DayRangeTest::singleDay()
{
    QVERIFY(matchesDayRange(QStringLiteral("Thursday"), QStringLiteral("Thursday")));
    QVERIFY(!matchesDayRange(QStringLiteral("Friday"), QStringLiteral("Thursday")));
}

void DayRangeTest::invalidSpecs()
{
    QVERIFY(!matchesDayRange(QStringLiteral("Monday"), QString()));
    QVERIFY(!matchesDayRange(QStringLiteral("Monday"), QStringLiteral("   ")));
    QVERIFY(!matchesDayRange(QStringLiteral("Monday"), QStringLiteral("Mon-Fri")));
    QVERIFY(!matchesDayRange(QStringLiteral("Monday"), QStringLiteral("Funday")));
}

void DayRangeTest::dayNamesFromDates()
{
    QCOMPARE(dayName(QDate(2023, 1, 1)), QStringLiteral("Sunday"));
    QCOMPARE(dayName(QDate(2023, 1, 4)), QStringLiteral("Wednesday"));
    QCOMPARE(dayName(QDate(2023, 1, 7)), QStringLiteral("Saturday"));
    QCOMPARE(dayIndex(QStringLiteral("Saturday")), 6);
    QCOMPARE(dayIndex(QStringLiteral("Caturday")), -1);
    QVERIFY(matchesDayRange(QDate(2023, 1, 6), QStringLiteral("Friday-Monday")));
    QVERIFY(!matchesDayRange(QDate(2023, 1, 4), QStringLiteral("Friday-Monday")));
}

void DayRangeTest::validation()
{
    QVERIFY(isValidDayRange(QStringLiteral("All")));
    QVERIFY(isValidDayRange(QStringLiteral("Friday-Monday")));
    QVERIFY(isValidDayRange(QStringLiteral("Monday,Thursday")));
    QVERIFY(isValidDayRange(QStringLiteral("Sunday")));
    QVERIFY(!isValidDayRange(QString()));
    QVERIFY(!isValidDayRange(QStringLiteral("Mon-Fri")));
    QVERIFY(!isValidDayRange(QStringLiteral("Monday,Blursday")));
    QVERIFY(!isValidDayRange(QStringLiteral("Weekends")));
}

QTEST_GUILESS_MAIN(DayRangeTest)
#include "DayRangeTest.moc"
