#include <QtTest/QtTest>
#include "core/indexing/date_extractor.h"

class TestDateExtractor : public QObject {
    Q_OBJECT

private slots:
    void testNoDates();
    void testIsoDates();
    void testSpelledOutDates();
    void testInvalidAndOutOfRangeIgnored();
    void testSortedAndUnique();
    void testMerge();
};

void TestDateExtractor::testNoDates()
{
    QVERIFY(sx::DateExtractor::extract(QStringLiteral("Nothing dated here, 42 apples.")).empty());
}

void TestDateExtractor::testIsoDates()
{
    const auto dates = sx::DateExtractor::extract(
        QStringLiteral("Invoice 2024-03-05 paid on 2024/3/9."));
    QCOMPARE(static_cast<int>(dates.size()), 2);
    QCOMPARE(dates[0], QDate(2024, 3, 5));
    QCOMPARE(dates[1], QDate(2024, 3, 9));
}

void TestDateExtractor::testSpelledOutDates()
{
    const auto dates = sx::DateExtractor::extract(
        QStringLiteral("Met on 5th March 2024, follow-up Apr 2, 2024 and June 30 2023."));
    QCOMPARE(static_cast<int>(dates.size()), 3);
    QCOMPARE(dates[0], QDate(2023, 6, 30));
    QCOMPARE(dates[1], QDate(2024, 3, 5));
    QCOMPARE(dates[2], QDate(2024, 4, 2));
}

void TestDateExtractor::testInvalidAndOutOfRangeIgnored()
{
    const auto dates = sx::DateExtractor::extract(
        QStringLiteral("2024-02-30, 1850-01-01, 31 Foo 2024 and 2300-01-01"));
    QVERIFY(dates.empty());
}

void TestDateExtractor::testSortedAndUnique()
{
    const auto dates = sx::DateExtractor::extract(
        QStringLiteral("2024-05-01, 1 May 2024, 2023-12-31"));
    QCOMPARE(static_cast<int>(dates.size()), 2);
    QCOMPARE(dates[0], QDate(2023, 12, 31));
    QCOMPARE(dates[1], QDate(2024, 5, 1));
}

void TestDateExtractor::testMerge()
{
    const std::vector<QDate> a{QDate(2024, 1, 2), QDate(2024, 1, 5)};
    const std::vector<QDate> b{QDate(2024, 1, 5), QDate(2023, 7, 1)};
    const auto merged = sx::DateExtractor::merge(a, b);
    QCOMPARE(static_cast<int>(merged.size()), 3);
    QCOMPARE(merged[0], QDate(2023, 7, 1));
    QCOMPARE(merged[2], QDate(2024, 1, 5));
}

QTEST_MAIN(TestDateExtractor)
#include "test_date_extractor.moc"
