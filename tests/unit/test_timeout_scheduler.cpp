// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/timeoutscheduler.h"

using namespace XNotid;

/**
 * @brief Unit tests for TimeoutScheduler
 *
 * Tests cover:
 * - Timeout resolution from urgency, explicit timeouts and acknowledge-to-dismiss
 * - Arming, re-arming and disarming
 * - Pause and resume
 */
class TestTimeoutScheduler : public QObject
{
    Q_OBJECT

private:
    static Notification notification(Urgency urgency, int expireTimeout = 0)
    {
        Notification n;
        n.id = 1;
        n.urgency = urgency;
        n.expireTimeout = expireTimeout;
        return n;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Resolution
    // ═══════════════════════════════════════════════════════════════════════════

    void testResolve_urgencyDefaults()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Low)), 5000);
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Normal)), 10000);
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Critical)), 0);
    }

    void testResolve_explicitTimeoutWins()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Critical, 5000)), 5000);
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Low, 250)), 250);
    }

    void testResolve_negativeMeansNever()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Normal, -1)), 0);
    }

    void testResolve_acknowledgeNeverExpires()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        Notification n = notification(Urgency::Low, 3000);
        n.acknowledgeToDismiss = true;
        QCOMPARE(scheduler.resolveTimeout(n), 0);
    }

    void testResolve_customConfig()
    {
        EngineConfig config;
        config.normalTimeoutMs = 0;
        config.criticalTimeoutMs = 30000;
        TimeoutScheduler scheduler(config);
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Normal)), 0);
        QCOMPARE(scheduler.resolveTimeout(notification(Urgency::Critical)), 30000);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Arming
    // ═══════════════════════════════════════════════════════════════════════════

    void testArm_firesOnce()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QSignalSpy expiredSpy(&scheduler, &TimeoutScheduler::expired);

        QVERIFY(scheduler.arm(7, 30));
        QVERIFY(scheduler.isArmed(7));
        QCOMPARE(scheduler.duration(7), 30);

        QVERIFY(expiredSpy.wait(1000));
        QCOMPARE(expiredSpy.count(), 1);
        QCOMPARE(expiredSpy.at(0).at(0).toUInt(), 7u);
        QVERIFY(!scheduler.isArmed(7));

        QTest::qWait(80);
        QCOMPARE(expiredSpy.count(), 1);
    }

    void testArm_nonPositiveIsNotArmed()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QVERIFY(!scheduler.arm(1, 0));
        QVERIFY(!scheduler.arm(1, -5));
        QVERIFY(!scheduler.isArmed(1));
    }

    void testDisarm_preventsExpiry()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QSignalSpy expiredSpy(&scheduler, &TimeoutScheduler::expired);

        QVERIFY(scheduler.arm(3, 30));
        scheduler.disarm(3);
        QVERIFY(!scheduler.isArmed(3));
        QTest::qWait(100);
        QCOMPARE(expiredSpy.count(), 0);
    }

    void testArm_rearmReplacesPreviousTimer()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QSignalSpy expiredSpy(&scheduler, &TimeoutScheduler::expired);

        QVERIFY(scheduler.arm(4, 30));
        QVERIFY(scheduler.arm(4, 400));
        QTest::qWait(120);
        QCOMPARE(expiredSpy.count(), 0);
        QCOMPARE(scheduler.duration(4), 400);
        scheduler.disarmAll();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Pause / resume
    // ═══════════════════════════════════════════════════════════════════════════

    void testPause_holdsExpiryUntilResume()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        QSignalSpy expiredSpy(&scheduler, &TimeoutScheduler::expired);

        QVERIFY(scheduler.arm(9, 50));
        scheduler.pause(9);
        QVERIFY(scheduler.isPaused(9));
        QVERIFY(!scheduler.isArmed(9));

        QTest::qWait(150);
        QCOMPARE(expiredSpy.count(), 0);

        scheduler.resume(9);
        QVERIFY(!scheduler.isPaused(9));
        QVERIFY(scheduler.isArmed(9));
        QVERIFY(expiredSpy.wait(1000));
        QCOMPARE(expiredSpy.count(), 1);
    }

    void testPause_unknownIdIsNoop()
    {
        TimeoutScheduler scheduler(EngineConfig{});
        scheduler.pause(42);
        scheduler.resume(42);
        QVERIFY(!scheduler.isPaused(42));
        QVERIFY(!scheduler.isArmed(42));
        QCOMPARE(scheduler.duration(42), 0);
    }
};

QTEST_MAIN(TestTimeoutScheduler)
#include "test_timeout_scheduler.moc"
