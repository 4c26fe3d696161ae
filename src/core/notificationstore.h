// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QHash>
#include <QList>
#include <QObject>

namespace XNotid {

/**
 * @brief Canonical mapping from notification id to notification record
 *
 * The store is the only owner of Notification records and the single place
 * where lifecycle transitions happen. Other components hold ids and read
 * records through const accessors.
 *
 * Id allocation is monotonic with skip: the counter advances on each
 * allocation, skips 0 on wraparound and skips ids that are still live.
 */
class XNOTID_EXPORT NotificationStore : public QObject
{
    Q_OBJECT

public:
    enum class ActionResult {
        UnknownIdentifier, ///< No live record, no-op
        Rejected,          ///< Key not declared or not a valid card response
        Invoked,            ///< actionInvoked emitted, resident record stays live
        InvokedAndDismissed ///< actionInvoked emitted, record closed as Dismissed
    };

    explicit NotificationStore(QObject* parent = nullptr);
    ~NotificationStore() override;

    /**
     * @brief Insert a new record in the Queued state
     * @return The allocated non-zero id
     */
    uint create(const NotificationRequest& request);

    /**
     * @brief Update a live record in place, or create a new one if @p id isn't live
     *
     * The card and hints are re-parsed. State, slot, uuid and creation time
     * are preserved.
     *
     * @return The id of the updated or created record
     */
    uint replace(uint id, const NotificationRequest& request);

    /**
     * @brief Remove a record and emit recordClosed()
     * @return false if @p id was not live (silent no-op)
     */
    bool close(uint id, CloseReason reason);

    /**
     * @brief Record a user-selected action
     *
     * Emits actionInvoked() once for a permitted key, then moves the record to
     * ActionTaken and closes it as Dismissed. Records with the "resident" hint
     * stay live instead, unless they are acknowledge-to-dismiss.
     */
    ActionResult recordAction(uint id, const QString& actionKey);

    /**
     * @brief Move a record to @p state, validated against the lifecycle
     * @param slot Popup slot for Visible, ignored otherwise
     * @return false if the record is unknown or the transition is illegal
     */
    bool transition(uint id, NotificationState state, int slot = -1);

    const Notification* find(uint id) const;
    bool contains(uint id) const;
    int count() const;
    QList<uint> ids() const;
    QList<uint> idsInState(NotificationState state) const;

    /**
     * @brief Whether @p from -> @p to is a legal lifecycle transition
     */
    static bool isValidTransition(NotificationState from, NotificationState to);

    /**
     * @brief Split the protocol's flat [key, label, ...] list into pairs
     *
     * A trailing key without a label is dropped.
     */
    static QList<NotificationAction> parseActions(const QStringList& flat);

    static Urgency parseUrgency(const QVariantMap& hints);

Q_SIGNALS:
    /**
     * @brief Emitted after a record has been removed
     * @param notification Copy of the record as it was when closed (state and slot intact)
     */
    void recordClosed(const XNotid::Notification& notification, XNotid::CloseReason reason);
    void actionInvoked(uint id, const QString& actionKey);

private:
    uint allocateId();
    void applyRequest(Notification& record, const NotificationRequest& request) const;
    bool isPermittedAction(const Notification& record, const QString& actionKey) const;

    QHash<uint, Notification> m_records;
    uint m_lastId = 0;
};

} // namespace XNotid
