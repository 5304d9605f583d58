/**
 * @file test_convergencedetector.cpp
 * @brief Unit tests for ConvergenceDetector
 *
 * Driven by FakeTicker, so no test here actually sleeps.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "sync/convergencedetector.h"
#include "faketicker.h"

using namespace LedgerSync;

namespace {

StoreSummary summaryWithPending(int pending)
{
    StoreSummary summary;
    summary.counts.insert("Expense", 1);
    summary.pendingChanges = pending;
    return summary;
}

} // namespace

class TestConvergenceDetector : public QObject
{
    Q_OBJECT

private slots:
    // ========== Stability Tests ==========
    void testStableImmediately();
    void testStableAfterChanges();
    void testRequiredSamplesRespected_data();
    void testRequiredSamplesRespected();

    // ========== Timeout Tests ==========
    void testTimesOutWhileChanging();
    void testLastSleepClippedToTimeout();
    void testZeroTimeout();

    // ========== Hook Tests ==========
    void testOnChangeCalledPerChange();
    void testCancelEndsPolling();

    // ========== Configuration Tests ==========
    void testConfigurationClamped();
};

// ========== Stability Tests ==========

void TestConvergenceDetector::testStableImmediately()
{
    FakeTicker ticker;
    ConvergenceDetector detector(&ticker, [] { return summaryWithPending(0); });

    QVERIFY(detector.awaitConvergence(30000));
    QCOMPARE(detector.state(), ConvergenceDetector::State::Stable);
    QCOMPARE(detector.samplesTaken(), 3);
    QCOMPARE(ticker.sleeps.load(), 2);
    QCOMPARE(ticker.elapsedMs(), qint64(2000));
}

void TestConvergenceDetector::testStableAfterChanges()
{
    FakeTicker ticker;
    int calls = 0;
    ConvergenceDetector detector(&ticker, [&calls] {
        ++calls;
        return summaryWithPending(qMin(calls, 4));
    });

    QVERIFY(detector.awaitConvergence(30000));
    QCOMPARE(detector.samplesTaken(), 6);
    QCOMPARE(detector.lastSample().pendingChanges, 4);
}

void TestConvergenceDetector::testRequiredSamplesRespected_data()
{
    QTest::addColumn<int>("required");
    QTest::addColumn<int>("expectedSamples");

    QTest::newRow("two") << 2 << 2;
    QTest::newRow("three") << 3 << 3;
    QTest::newRow("five") << 5 << 5;
}

void TestConvergenceDetector::testRequiredSamplesRespected()
{
    QFETCH(int, required);
    QFETCH(int, expectedSamples);

    FakeTicker ticker;
    ConvergenceDetector detector(&ticker, [] { return summaryWithPending(0); });
    detector.setRequiredStableSamples(required);

    QVERIFY(detector.awaitConvergence(60000));
    QCOMPARE(detector.samplesTaken(), expectedSamples);
}

// ========== Timeout Tests ==========

void TestConvergenceDetector::testTimesOutWhileChanging()
{
    FakeTicker ticker;
    int calls = 0;
    ConvergenceDetector detector(&ticker, [&calls] { return summaryWithPending(++calls); });

    QVERIFY(!detector.awaitConvergence(5000));
    QCOMPARE(detector.state(), ConvergenceDetector::State::TimedOut);
    QCOMPARE(detector.samplesTaken(), 6);
    QCOMPARE(ticker.elapsedMs(), qint64(5000));
}

void TestConvergenceDetector::testLastSleepClippedToTimeout()
{
    FakeTicker ticker;
    int calls = 0;
    ConvergenceDetector detector(&ticker, [&calls] { return summaryWithPending(++calls); });

    QVERIFY(!detector.awaitConvergence(2500));
    QCOMPARE(ticker.sleeps.load(), 3);
    QCOMPARE(ticker.elapsedMs(), qint64(2500));
}

void TestConvergenceDetector::testZeroTimeout()
{
    FakeTicker ticker;
    ConvergenceDetector detector(&ticker, [] { return summaryWithPending(0); });

    QVERIFY(!detector.awaitConvergence(0));
    QCOMPARE(detector.samplesTaken(), 1);
    QCOMPARE(ticker.sleeps.load(), 0);
}

// ========== Hook Tests ==========

void TestConvergenceDetector::testOnChangeCalledPerChange()
{
    FakeTicker ticker;
    int calls = 0;
    int changes = 0;
    ConvergenceDetector detector(&ticker, [&calls] {
        ++calls;
        return summaryWithPending(qMin(calls, 4));
    });
    detector.setOnChange([&changes] { ++changes; });

    QVERIFY(detector.awaitConvergence(30000));
    QCOMPARE(changes, 3);
}

void TestConvergenceDetector::testCancelEndsPolling()
{
    FakeTicker ticker;
    int calls = 0;
    ConvergenceDetector detector(&ticker, [&calls] { return summaryWithPending(++calls); });
    detector.setCancelCheck([&calls] { return calls >= 2; });

    QVERIFY(!detector.awaitConvergence(30000));
    QCOMPARE(detector.state(), ConvergenceDetector::State::TimedOut);
    QCOMPARE(detector.samplesTaken(), 2);
    QCOMPARE(ticker.sleeps.load(), 1);
}

// ========== Configuration Tests ==========

void TestConvergenceDetector::testConfigurationClamped()
{
    FakeTicker ticker;
    ConvergenceDetector detector(&ticker, [] { return StoreSummary(); });

    QCOMPARE(detector.state(), ConvergenceDetector::State::Idle);
    QCOMPARE(detector.interval(), 1000);
    QCOMPARE(detector.requiredStableSamples(), 3);

    detector.setInterval(-10);
    QCOMPARE(detector.interval(), 1000);
    detector.setInterval(250);
    QCOMPARE(detector.interval(), 250);

    detector.setRequiredStableSamples(0);
    QCOMPARE(detector.requiredStableSamples(), 2);
}

QTEST_MAIN(TestConvergenceDetector)
#include "test_convergencedetector.moc"
