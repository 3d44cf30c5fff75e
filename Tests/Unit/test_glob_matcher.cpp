#include <QtTest/QtTest>
#include "core/query/glob_matcher.h"

class TestGlobMatcher : public QObject {
    Q_OBJECT

private slots:
    void testMatches_data();
    void testMatches();
    void testEmptyPatternMatchesNothing();
};

void TestGlobMatcher::testMatches_data()
{
    QTest::addColumn<QString>("pattern");
    QTest::addColumn<QString>("path");
    QTest::addColumn<bool>("expected");

    // Component patterns
    QTest::newRow("ext in subdir") << "*.md" << "notes/today.md" << true;
    QTest::newRow("ext absolute") << "*.md" << "/home/me/a.md" << true;
    QTest::newRow("ext mismatch") << "*.md" << "/home/me/a.org" << false;
    QTest::newRow("directory component") << "finance" << "/home/me/finance/q1.md" << true;
    QTest::newRow("question mark") << "q?.md" << "/x/q1.md" << true;
    QTest::newRow("question mark length") << "q?.md" << "/x/q10.md" << false;
    QTest::newRow("question never slash") << "a?b" << "a/b" << false;

    // Path patterns
    QTest::newRow("dir star suffix") << "finance/*" << "/home/me/finance/q1.md" << true;
    QTest::newRow("star stops at slash") << "finance/*" << "/home/finance/2024/q1.md" << false;
    QTest::newRow("double star crosses") << "finance/**" << "/home/finance/2024/q1.md" << true;
    QTest::newRow("leading double star") << "**/q1.md" << "/home/x/q1.md" << true;
    QTest::newRow("double star zero dirs") << "notes/**/a.md" << "notes/a.md" << true;
    QTest::newRow("whole relative path") << "notes/*.md" << "notes/x.md" << true;
    QTest::newRow("partial component") << "ance/*" << "/home/finance/q1.md" << false;
}

void TestGlobMatcher::testMatches()
{
    QFETCH(QString, pattern);
    QFETCH(QString, path);
    QFETCH(bool, expected);

    QCOMPARE(sx::GlobMatcher(pattern).matches(path), expected);
    QCOMPARE(sx::GlobMatcher::matchGlob(pattern, path), expected);
}

void TestGlobMatcher::testEmptyPatternMatchesNothing()
{
    QVERIFY(!sx::GlobMatcher(QString()).matches(QStringLiteral("/a/b.md")));
}

QTEST_MAIN(TestGlobMatcher)
#include "test_glob_matcher.moc"
