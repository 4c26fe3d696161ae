// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSignalSpy>

#include "core/notificationstore.h"
#include "core/cardparser.h"

using namespace XNotid;

/**
 * @brief Unit tests for NotificationStore
 *
 * Tests cover:
 * - Id allocation (non-zero, monotonic, skipping live ids)
 * - Hint derivation and card attachment
 * - Replacement semantics
 * - Close and action bookkeeping
 * - Lifecycle transition validation
 */
class TestNotificationStore : public QObject
{
    Q_OBJECT

private:
    static NotificationRequest request(const QString& summary, const QVariantMap& hints = {},
                                       const QStringList& actions = {}, const QString& body = QString())
    {
        NotificationRequest req;
        req.appName = QStringLiteral("test-app");
        req.summary = summary;
        req.body = body;
        req.hints = hints;
        req.actions = actions;
        return req;
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // Id allocation
    // ═══════════════════════════════════════════════════════════════════════════

    void testCreate_idsAreNonZeroAndIncreasing()
    {
        NotificationStore store;
        const uint first = store.create(request(QStringLiteral("one")));
        const uint second = store.create(request(QStringLiteral("two")));

        QVERIFY(first != 0);
        QVERIFY(second > first);
        QCOMPARE(store.count(), 2);
        QCOMPARE(store.find(first)->state, NotificationState::Queued);
        QVERIFY(!store.find(first)->uuid.isNull());
    }

    void testCreate_closedIdsAreNotReused()
    {
        NotificationStore store;
        const uint first = store.create(request(QStringLiteral("one")));
        QVERIFY(store.close(first, CloseReason::Dismissed));

        const uint second = store.create(request(QStringLiteral("two")));
        QVERIFY(second != first);
    }

    void testReplace_unknownIdCreatesFreshRecord()
    {
        NotificationStore store;
        const uint id = store.replace(4242, request(QStringLiteral("fresh")));
        QVERIFY(id != 4242);
        QVERIFY(store.contains(id));
        QVERIFY(!store.contains(4242));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Hint derivation
    // ═══════════════════════════════════════════════════════════════════════════

    void testCreate_derivesFieldsFromHints()
    {
        NotificationStore store;
        QVariantMap hints;
        hints.insert(QStringLiteral("urgency"), QVariant::fromValue<uchar>(2));
        hints.insert(QStringLiteral("transient"), true);
        hints.insert(QStringLiteral("desktop-entry"), QStringLiteral("org.example.App"));
        hints.insert(QStringLiteral("category"), QStringLiteral("transfer.complete"));
        hints.insert(QStringLiteral("value"), 150);
        hints.insert(QStringLiteral("image-path"), QStringLiteral("/tmp/icon.png"));

        const uint id = store.create(request(QStringLiteral("hinted"), hints));
        const Notification* record = store.find(id);
        QVERIFY(record);
        QCOMPARE(record->urgency, Urgency::Critical);
        QVERIFY(record->transient);
        QVERIFY(!record->resident);
        QCOMPARE(record->desktopEntry, QStringLiteral("org.example.App"));
        QCOMPARE(record->category, QStringLiteral("transfer.complete"));
        QCOMPARE(record->progress, 100);
        QCOMPARE(record->imagePath, QStringLiteral("/tmp/icon.png"));
        QVERIFY(!record->acknowledgeToDismiss);
    }

    void testCreate_imagePathFallsBackToAppIcon()
    {
        NotificationStore store;
        NotificationRequest req = request(QStringLiteral("icon"));
        req.appIcon = QStringLiteral("dialog-information");
        const uint id = store.create(req);
        QCOMPARE(store.find(id)->imagePath, QStringLiteral("dialog-information"));
        QCOMPARE(store.find(id)->progress, -1);
        QCOMPARE(store.find(id)->urgency, Urgency::Normal);
    }

    void testParseActions_dropsTrailingKey()
    {
        const QList<NotificationAction> actions = NotificationStore::parseActions(
            {QStringLiteral("default"), QStringLiteral("Open"), QStringLiteral("reply"), QStringLiteral("Reply"),
             QStringLiteral("orphan")});
        QCOMPARE(actions.size(), 2);
        QCOMPARE(actions.at(0).key, QStringLiteral("default"));
        QCOMPARE(actions.at(1).label, QStringLiteral("Reply"));
    }

    void testCreate_cardForcesAcknowledge()
    {
        NotificationStore store;
        const uint id = store.create(request(
            QStringLiteral("card"), {}, {},
            QStringLiteral(R"({"xnotid_card": "v1", "type": "permission", "question": "Run?"})")));
        const Notification* record = store.find(id);
        QVERIFY(record->card.has_value());
        QVERIFY(record->acknowledgeToDismiss);
    }

    void testCreate_malformedCardFallsBackToPlainText()
    {
        NotificationStore store;
        const QString body = QStringLiteral(R"({"xnotid_card": "v1", "type": "permission"})");
        const uint id = store.create(request(QStringLiteral("broken"), {}, {}, body));
        const Notification* record = store.find(id);
        QVERIFY(!record->card.has_value());
        QVERIFY(!record->acknowledgeToDismiss);
        QCOMPARE(record->body, body);
    }

    void testReplace_reparsesCardAndKeepsIdentity()
    {
        NotificationStore store;
        const uint id = store.create(request(
            QStringLiteral("card"), {}, {},
            QStringLiteral(R"({"xnotid_card": "v1", "type": "permission", "question": "Run?"})")));
        const QUuid uuid = store.find(id)->uuid;
        QVERIFY(store.transition(id, NotificationState::Visible, 1));

        QCOMPARE(store.replace(id, request(QStringLiteral("plain now"))), id);
        const Notification* record = store.find(id);
        QCOMPARE(record->summary, QStringLiteral("plain now"));
        QVERIFY(!record->card.has_value());
        QVERIFY(!record->acknowledgeToDismiss);
        QCOMPARE(record->uuid, uuid);
        QCOMPARE(record->state, NotificationState::Visible);
        QCOMPARE(record->slot, 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Close
    // ═══════════════════════════════════════════════════════════════════════════

    void testClose_emitsRecordWithStateIntact()
    {
        NotificationStore store;
        QSignalSpy closedSpy(&store, &NotificationStore::recordClosed);

        const uint id = store.create(request(QStringLiteral("bye")));
        QVERIFY(store.transition(id, NotificationState::Visible, 0));
        QVERIFY(store.close(id, CloseReason::ClosedByRequest));

        QVERIFY(!store.contains(id));
        QCOMPARE(closedSpy.count(), 1);
        const auto closed = closedSpy.at(0).at(0).value<XNotid::Notification>();
        QCOMPARE(closed.id, id);
        QCOMPARE(closed.state, NotificationState::Visible);
        QCOMPARE(closed.slot, 0);
        QCOMPARE(closedSpy.at(0).at(1).value<XNotid::CloseReason>(), CloseReason::ClosedByRequest);
    }

    void testClose_unknownIdIsSilent()
    {
        NotificationStore store;
        QSignalSpy closedSpy(&store, &NotificationStore::recordClosed);
        QVERIFY(!store.close(99, CloseReason::ClosedByRequest));
        QCOMPARE(closedSpy.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Actions
    // ═══════════════════════════════════════════════════════════════════════════

    void testRecordAction_declaredKeyInvokesThenCloses()
    {
        NotificationStore store;
        QSignalSpy actionSpy(&store, &NotificationStore::actionInvoked);
        QSignalSpy closedSpy(&store, &NotificationStore::recordClosed);

        const uint id = store.create(
            request(QStringLiteral("act"), {}, {QStringLiteral("open"), QStringLiteral("Open")}));
        QVERIFY(store.transition(id, NotificationState::Visible, 0));

        QCOMPARE(store.recordAction(id, QStringLiteral("open")), NotificationStore::ActionResult::InvokedAndDismissed);
        QCOMPARE(actionSpy.count(), 1);
        QCOMPARE(actionSpy.at(0).at(1).toString(), QStringLiteral("open"));
        QCOMPARE(closedSpy.count(), 1);
        QCOMPARE(closedSpy.at(0).at(0).value<XNotid::Notification>().state, NotificationState::ActionTaken);
        QCOMPARE(closedSpy.at(0).at(1).value<XNotid::CloseReason>(), CloseReason::Dismissed);
    }

    void testRecordAction_undeclaredKeyRejected()
    {
        NotificationStore store;
        QSignalSpy actionSpy(&store, &NotificationStore::actionInvoked);

        const uint id = store.create(
            request(QStringLiteral("act"), {}, {QStringLiteral("open"), QStringLiteral("Open")}));
        QCOMPARE(store.recordAction(id, QStringLiteral("delete")), NotificationStore::ActionResult::Rejected);
        QCOMPARE(store.recordAction(id, QString()), NotificationStore::ActionResult::Rejected);
        QCOMPARE(store.recordAction(777, QStringLiteral("open")), NotificationStore::ActionResult::UnknownIdentifier);
        QCOMPARE(actionSpy.count(), 0);
        QVERIFY(store.contains(id));
    }

    void testRecordAction_residentStaysLive()
    {
        NotificationStore store;
        QSignalSpy actionSpy(&store, &NotificationStore::actionInvoked);

        QVariantMap hints;
        hints.insert(QStringLiteral("resident"), true);
        const uint id = store.create(
            request(QStringLiteral("resident"), hints, {QStringLiteral("play"), QStringLiteral("Play")}));

        QCOMPARE(store.recordAction(id, QStringLiteral("play")), NotificationStore::ActionResult::Invoked);
        QCOMPARE(store.recordAction(id, QStringLiteral("play")), NotificationStore::ActionResult::Invoked);
        QCOMPARE(actionSpy.count(), 2);
        QVERIFY(store.contains(id));
    }

    void testRecordAction_cardResponses()
    {
        NotificationStore store;
        const uint permission = store.create(request(
            QStringLiteral("perm"), {}, {},
            QStringLiteral(R"({"xnotid_card": "v1", "type": "permission", "question": "Run?"})")));
        QCOMPARE(store.recordAction(permission, QStringLiteral("deny")), NotificationStore::ActionResult::Rejected);
        QCOMPARE(store.recordAction(permission, CardParser::permissionResponseKey()),
                 NotificationStore::ActionResult::InvokedAndDismissed);

        const uint choice = store.create(request(
            QStringLiteral("choice"), {}, {},
            QStringLiteral(R"({"xnotid_card": "v1", "type": "multiple-choice", "question": "Q",)"
                           R"( "choices": [{"id": "a", "label": "A"}]})")));
        const QString key = CardParser::buildChoiceResponse(*store.find(choice)->card, {QStringLiteral("a")});
        QCOMPARE(store.recordAction(choice, key), NotificationStore::ActionResult::InvokedAndDismissed);
        QVERIFY(!store.contains(choice));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Transitions
    // ═══════════════════════════════════════════════════════════════════════════

    void testTransition_validatesLifecycle()
    {
        NotificationStore store;
        const uint id = store.create(request(QStringLiteral("t")));

        QVERIFY(!store.transition(id, NotificationState::Expired));
        QVERIFY(store.transition(id, NotificationState::Archived));
        QCOMPARE(store.find(id)->slot, -1);
        QVERIFY(store.transition(id, NotificationState::Visible, 2));
        QCOMPARE(store.find(id)->slot, 2);
        QVERIFY(!store.transition(id, NotificationState::Queued));
        QVERIFY(store.transition(id, NotificationState::Expired));
        QCOMPARE(store.find(id)->slot, -1);
        QVERIFY(!store.transition(id, NotificationState::Visible));
        QVERIFY(!store.transition(12345, NotificationState::Visible));
    }

    void testIdsInState_sorted()
    {
        NotificationStore store;
        const uint a = store.create(request(QStringLiteral("a")));
        const uint b = store.create(request(QStringLiteral("b")));
        const uint c = store.create(request(QStringLiteral("c")));
        QVERIFY(store.transition(c, NotificationState::Archived));
        QVERIFY(store.transition(a, NotificationState::Archived));

        QCOMPARE(store.idsInState(NotificationState::Archived), (QList<uint>{a, c}));
        QCOMPARE(store.idsInState(NotificationState::Queued), QList<uint>{b});
        QCOMPARE(store.ids(), (QList<uint>{a, b, c}));
    }
};

QTEST_MAIN(TestNotificationStore)
#include "test_notification_store.moc"
