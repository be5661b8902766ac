#include <QtTest/QtTest>

#include "core/store/async_write_queue.h"

#include <QThread>

#include <atomic>
#include <mutex>
#include <vector>

namespace {

lp::WriteQueueConfig fastConfig()
{
    lp::WriteQueueConfig config;
    config.retryBackoffMs = 1;
    return config;
}

} // namespace

class TestAsyncWriteQueue : public QObject {
    Q_OBJECT

private slots:
    void testWritesRunInOrder();
    void testRetriesUntilSuccess();
    void testExhaustedRetriesEscalate();
    void testFullQueueDropsNewWrites();
    void testStopDrainsPendingWrites();
};

void TestAsyncWriteQueue::testWritesRunInOrder()
{
    lp::AsyncWriteQueue queue(fastConfig());
    queue.start();

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 20; ++i) {
        QVERIFY(queue.enqueue(QStringLiteral("write-%1").arg(i), [&mutex, &order, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
            return true;
        }));
    }
    QVERIFY(queue.waitForIdle(5000));

    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(order.size(), static_cast<size_t>(20));
    for (int i = 0; i < 20; ++i) {
        QCOMPARE(order[static_cast<size_t>(i)], i);
    }
    QCOMPARE(queue.stats().completed, static_cast<size_t>(20));
}

void TestAsyncWriteQueue::testRetriesUntilSuccess()
{
    lp::AsyncWriteQueue queue(fastConfig());
    bool escalated = false;
    queue.setEscalationHandler([&escalated](const QString&, int) { escalated = true; });
    queue.start();

    std::atomic<int> calls{0};
    queue.enqueue(QStringLiteral("flaky"), [&calls]() { return ++calls >= 3; });
    QVERIFY(queue.waitForIdle(5000));

    QCOMPARE(calls.load(), 3);
    const lp::AsyncWriteStats stats = queue.stats();
    QCOMPARE(stats.completed, static_cast<size_t>(1));
    QCOMPARE(stats.retried, static_cast<size_t>(2));
    QCOMPARE(stats.failed, static_cast<size_t>(0));
    QVERIFY(!escalated);
}

void TestAsyncWriteQueue::testExhaustedRetriesEscalate()
{
    lp::AsyncWriteQueue queue(fastConfig());
    QString escalatedLabel;
    int escalatedAttempts = 0;
    queue.setEscalationHandler([&](const QString& label, int attempts) {
        escalatedLabel = label;
        escalatedAttempts = attempts;
    });
    queue.start();

    std::atomic<int> calls{0};
    queue.enqueue(QStringLiteral("insert_signal"), [&calls]() {
        ++calls;
        return false;
    });
    QVERIFY(queue.waitForIdle(5000));

    QCOMPARE(calls.load(), 4);
    QCOMPARE(escalatedLabel, QStringLiteral("insert_signal"));
    QCOMPARE(escalatedAttempts, 4);
    QCOMPARE(queue.stats().failed, static_cast<size_t>(1));
}

void TestAsyncWriteQueue::testFullQueueDropsNewWrites()
{
    lp::WriteQueueConfig config = fastConfig();
    config.maxPendingWrites = 2;
    lp::AsyncWriteQueue queue(config);

    // Not started yet, so nothing drains.
    QVERIFY(queue.enqueue(QStringLiteral("a"), []() { return true; }));
    QVERIFY(queue.enqueue(QStringLiteral("b"), []() { return true; }));
    QVERIFY(!queue.enqueue(QStringLiteral("c"), []() { return true; }));
    QCOMPARE(queue.stats().dropped, static_cast<size_t>(1));
    QCOMPARE(queue.stats().pending, static_cast<size_t>(2));

    queue.start();
    QVERIFY(queue.waitForIdle(5000));
    QCOMPARE(queue.stats().completed, static_cast<size_t>(2));
}

void TestAsyncWriteQueue::testStopDrainsPendingWrites()
{
    lp::AsyncWriteQueue queue(fastConfig());
    queue.start();

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        queue.enqueue(QStringLiteral("slow"), [&done]() {
            QThread::msleep(2);
            ++done;
            return true;
        });
    }
    queue.stop();

    QCOMPARE(done.load(), 10);
    QCOMPARE(queue.stats().pending, static_cast<size_t>(0));
}

QTEST_MAIN(TestAsyncWriteQueue)
#include "test_async_write_queue.moc"
