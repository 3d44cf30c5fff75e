#include <QtTest/QtTest>
#include "core/embedding/provider_executor.h"

#include <QThread>

#include <atomic>
#include <chrono>
#include <vector>

class TestProviderExecutor : public QObject {
    Q_OBJECT

private slots:
    void testWorkerCountsClamped();
    void testSubmitReturnsResult();
    void testBulkConcurrencyBounded();
    void testLiveLaneNotBlockedByBulk();
    void testQueuedJobsRunBeforeShutdown();
};

void TestProviderExecutor::testWorkerCountsClamped()
{
    sx::ProviderExecutor executor(0, -3);
    QCOMPARE(executor.liveWorkers(), 1);
    QCOMPARE(executor.bulkWorkers(), 1);

    sx::ProviderExecutor sized(2, 5);
    QCOMPARE(sized.liveWorkers(), 2);
    QCOMPARE(sized.bulkWorkers(), 5);
}

void TestProviderExecutor::testSubmitReturnsResult()
{
    sx::ProviderExecutor executor(1, 1);
    std::future<int> answer = executor.submit(sx::ProviderExecutor::Lane::Live,
                                              []() { return 6 * 7; });
    std::future<QString> text = executor.submit(sx::ProviderExecutor::Lane::Bulk, []() {
        return QStringLiteral("embedded");
    });
    QCOMPARE(answer.get(), 42);
    QCOMPARE(text.get(), QStringLiteral("embedded"));
}

void TestProviderExecutor::testBulkConcurrencyBounded()
{
    sx::ProviderExecutor executor(1, 3);
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(executor.submit(sx::ProviderExecutor::Lane::Bulk, [&]() {
            const int now = ++inFlight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            QThread::msleep(20);
            --inFlight;
        }));
    }
    for (std::future<void>& future : futures) {
        future.get();
    }
    QVERIFY(peak.load() <= 3);
    QVERIFY(peak.load() >= 1);
}

void TestProviderExecutor::testLiveLaneNotBlockedByBulk()
{
    sx::ProviderExecutor executor(1, 1);
    std::atomic<bool> release{false};

    std::vector<std::future<void>> bulk;
    for (int i = 0; i < 4; ++i) {
        bulk.push_back(executor.submit(sx::ProviderExecutor::Lane::Bulk, [&release]() {
            while (!release.load()) {
                QThread::msleep(5);
            }
        }));
    }

    // The bulk worker is stuck; the query still runs on its own lane.
    std::future<int> live = executor.submit(sx::ProviderExecutor::Lane::Live, []() { return 1; });
    const std::future_status status = live.wait_for(std::chrono::seconds(5));
    release = true;
    for (std::future<void>& future : bulk) {
        future.get();
    }

    QVERIFY(status == std::future_status::ready);
    QCOMPARE(live.get(), 1);
}

void TestProviderExecutor::testQueuedJobsRunBeforeShutdown()
{
    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    {
        sx::ProviderExecutor executor(1, 1);
        for (int i = 0; i < 5; ++i) {
            futures.push_back(executor.submit(sx::ProviderExecutor::Lane::Bulk, [&ran]() {
                QThread::msleep(5);
                ++ran;
            }));
        }
    }
    QCOMPARE(ran.load(), 5);
    for (std::future<void>& future : futures) {
        QVERIFY(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    }
}

QTEST_MAIN(TestProviderExecutor)
#include "test_provider_executor.moc"
