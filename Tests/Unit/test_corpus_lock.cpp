#include <QtTest/QtTest>
#include "core/indexing/corpus_lock.h"

#include <QThread>

#include <atomic>
#include <thread>

class TestCorpusLock : public QObject {
    Q_OBJECT

private slots:
    void testTryAcquireExclusive();
    void testDifferentCorporaIndependent();
    void testGuardReleasesOnDestruction();
    void testMovedGuardKeepsLock();
    void testAcquireWaitsForRelease();
};

void TestCorpusLock::testTryAcquireExclusive()
{
    sx::CorpusLockRegistry registry;
    std::optional<sx::CorpusLockRegistry::Guard> first =
        registry.tryAcquire(QStringLiteral("notes"));
    QVERIFY(first.has_value());
    QVERIFY(first->ownsLock());
    QCOMPARE(first->corpusId(), QStringLiteral("notes"));
    QVERIFY(registry.isLocked(QStringLiteral("notes")));

    QVERIFY(!registry.tryAcquire(QStringLiteral("notes")).has_value());

    first->release();
    QVERIFY(!first->ownsLock());
    QVERIFY(!registry.isLocked(QStringLiteral("notes")));
    QVERIFY(registry.tryAcquire(QStringLiteral("notes")).has_value());
}

void TestCorpusLock::testDifferentCorporaIndependent()
{
    sx::CorpusLockRegistry registry;
    auto notes = registry.tryAcquire(QStringLiteral("notes"));
    auto mail = registry.tryAcquire(QStringLiteral("mail"));
    QVERIFY(notes.has_value());
    QVERIFY(mail.has_value());
    QVERIFY(registry.isLocked(QStringLiteral("notes")));
    QVERIFY(registry.isLocked(QStringLiteral("mail")));
}

void TestCorpusLock::testGuardReleasesOnDestruction()
{
    sx::CorpusLockRegistry registry;
    {
        sx::CorpusLockRegistry::Guard guard = registry.acquire(QStringLiteral("notes"));
        QVERIFY(registry.isLocked(QStringLiteral("notes")));
    }
    QVERIFY(!registry.isLocked(QStringLiteral("notes")));
}

void TestCorpusLock::testMovedGuardKeepsLock()
{
    sx::CorpusLockRegistry registry;
    sx::CorpusLockRegistry::Guard moved;
    {
        sx::CorpusLockRegistry::Guard guard = registry.acquire(QStringLiteral("notes"));
        moved = std::move(guard);
        QVERIFY(!guard.ownsLock());
    }
    QVERIFY(moved.ownsLock());
    QVERIFY(registry.isLocked(QStringLiteral("notes")));

    moved = sx::CorpusLockRegistry::Guard();
    QVERIFY(!registry.isLocked(QStringLiteral("notes")));
}

void TestCorpusLock::testAcquireWaitsForRelease()
{
    sx::CorpusLockRegistry registry;
    auto held = registry.tryAcquire(QStringLiteral("notes"));
    QVERIFY(held.has_value());

    std::atomic<bool> acquired{false};
    std::thread waiter([&registry, &acquired]() {
        sx::CorpusLockRegistry::Guard guard = registry.acquire(QStringLiteral("notes"));
        acquired = true;
    });

    QThread::msleep(50);
    const bool acquiredWhileHeld = acquired.load();
    held->release();
    waiter.join();

    QVERIFY(!acquiredWhileHeld);
    QVERIFY(acquired.load());
    QVERIFY(!registry.isLocked(QStringLiteral("notes")));
}

QTEST_MAIN(TestCorpusLock)
#include "test_corpus_lock.moc"
