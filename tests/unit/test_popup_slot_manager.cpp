// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/popupslotmanager.h"

using namespace XNotid;

/**
 * @brief Unit tests for PopupSlotManager
 *
 * Tests cover:
 * - Lowest-free-slot allocation up to maxVisible
 * - Release and reuse
 * - Archive FIFO ordering
 */
class TestPopupSlotManager : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Slots
    // ═══════════════════════════════════════════════════════════════════════════

    void testAcquire_fillsUpToMaxVisible()
    {
        PopupSlotManager manager(3);
        QCOMPARE(manager.acquire(10).value_or(-1), 0);
        QCOMPARE(manager.acquire(11).value_or(-1), 1);
        QCOMPARE(manager.acquire(12).value_or(-1), 2);
        QVERIFY(!manager.hasFreeSlot());
        QVERIFY(!manager.acquire(13).has_value());
        QCOMPARE(manager.occupiedCount(), 3);
    }

    void testAcquire_sameIdKeepsSlot()
    {
        PopupSlotManager manager(2);
        QCOMPARE(manager.acquire(5).value_or(-1), 0);
        QCOMPARE(manager.acquire(5).value_or(-1), 0);
        QCOMPARE(manager.occupiedCount(), 1);
    }

    void testRelease_reusesLowestSlot()
    {
        PopupSlotManager manager(3);
        manager.acquire(1);
        manager.acquire(2);
        manager.acquire(3);

        QCOMPARE(manager.release(2).value_or(-1), 1);
        QVERIFY(!manager.release(2).has_value());
        QVERIFY(!manager.slotOf(2).has_value());

        QCOMPARE(manager.acquire(4).value_or(-1), 1);
        QCOMPARE(manager.visibleIds(), (QList<uint>{1, 4, 3}));
    }

    void testConstruct_clampsToOne()
    {
        PopupSlotManager manager(0);
        QCOMPARE(manager.maxVisible(), 1);
        QVERIFY(manager.acquire(1).has_value());
        QVERIFY(!manager.acquire(2).has_value());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Archive
    // ═══════════════════════════════════════════════════════════════════════════

    void testArchive_fifoOrder()
    {
        PopupSlotManager manager(1);
        manager.archive(20);
        manager.archive(21);
        manager.archive(20);
        manager.archive(22);

        QCOMPARE(manager.archivedIds(), (QList<uint>{20, 21, 22}));
        QCOMPARE(manager.takeOldestArchived().value_or(0), 20u);
        QCOMPARE(manager.takeOldestArchived().value_or(0), 21u);
        QVERIFY(manager.isArchived(22));
    }

    void testUnarchive_removesFromMiddle()
    {
        PopupSlotManager manager(1);
        manager.archive(1);
        manager.archive(2);
        manager.archive(3);

        QVERIFY(manager.unarchive(2));
        QVERIFY(!manager.unarchive(2));
        QCOMPARE(manager.archivedIds(), (QList<uint>{1, 3}));

        manager.takeOldestArchived();
        manager.takeOldestArchived();
        QVERIFY(!manager.takeOldestArchived().has_value());
    }
};

QTEST_MAIN(TestPopupSlotManager)
#include "test_popup_slot_manager.moc"
