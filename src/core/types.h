// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "constants.h"
#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVariantMap>
#include <optional>

namespace XNotid {

/**
 * @brief Notification urgency as carried by the "urgency" byte hint
 */
enum class Urgency {
    Low = 0,
    Normal = 1,
    Critical = 2
};

/**
 * @brief Reason codes reported through NotificationClosed
 *
 * Values are the wire codes of the freedesktop notification protocol.
 */
enum class CloseReason : uint {
    Expired = 1,
    Dismissed = 2,
    ClosedByRequest = 3,
    Undefined = 4
};

/**
 * @brief Lifecycle state of a notification record
 *
 * Queued -> Visible -> {Expired, Dismissed, ActionTaken} -> Closed
 * Queued -> Archived -> Visible (promotion)
 */
enum class NotificationState {
    Queued,
    Visible,
    Archived,
    Expired,
    Dismissed,
    ActionTaken,
    Closed
};

struct NotificationAction
{
    QString key;
    QString label;

    bool operator==(const NotificationAction& other) const
    {
        return key == other.key && label == other.label;
    }
};

struct CardChoice
{
    QString id;
    QString label;

    bool operator==(const CardChoice& other) const
    {
        return id == other.id && label == other.label;
    }
};

/**
 * @brief Structured interactive payload decoded from a notification body
 *
 * Closed set of kinds. Fields that don't apply to a kind keep their defaults.
 * Immutable once attached to a notification.
 */
struct Card
{
    enum class Kind {
        MultipleChoice,
        Permission
    };

    Kind kind = Kind::Permission;
    QString question;

    // MultipleChoice
    QList<CardChoice> choices;
    bool allowOther = false;

    // Permission
    QString allowLabel;

    bool isMultipleChoice() const
    {
        return kind == Kind::MultipleChoice;
    }
    bool isPermission() const
    {
        return kind == Kind::Permission;
    }
};

/**
 * @brief Inbound creation or replacement request, as received over D-Bus
 *
 * @c actions is the protocol's flat [key, label, key, label, ...] list.
 * @c expireTimeout: 0 = urgency default, negative = never, positive = milliseconds.
 */
struct NotificationRequest
{
    QString appName;
    uint replacesId = 0;
    QString appIcon;
    QString summary;
    QString body;
    QStringList actions;
    QVariantMap hints;
    int expireTimeout = 0;
};

/**
 * @brief Canonical notification record, owned by NotificationStore
 */
struct Notification
{
    uint id = 0;
    QUuid uuid;

    QString appName;
    QString appIcon;
    QString summary;
    QString body;
    Urgency urgency = Urgency::Normal;
    QList<NotificationAction> actions;
    QVariantMap hints;
    int expireTimeout = 0;
    std::optional<Card> card;

    // Derived from hints
    bool acknowledgeToDismiss = false;
    bool transient = false;
    bool resident = false;
    QString desktopEntry;
    QString imagePath;
    QString category;
    int progress = -1;

    NotificationState state = NotificationState::Queued;
    int slot = -1;
    QDateTime createdAt;
    QDateTime updatedAt;

    bool hasAction(const QString& key) const
    {
        for (const auto& action : actions) {
            if (action.key == key) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Read-only snapshot of a notification held by the notification center
 */
struct CenterEntry
{
    enum class Origin {
        Archived,
        Expired
    };

    uint id = 0;
    QString appName;
    QString appIcon;
    QString summary;
    QString body;
    Urgency urgency = Urgency::Normal;
    QList<NotificationAction> actions;
    std::optional<Card> card;
    Origin origin = Origin::Archived;
    QDateTime timestamp;

    static CenterEntry fromNotification(const Notification& notification, Origin origin)
    {
        CenterEntry entry;
        entry.id = notification.id;
        entry.appName = notification.appName;
        entry.appIcon = notification.imagePath;
        entry.summary = notification.summary;
        entry.body = notification.body;
        entry.urgency = notification.urgency;
        entry.actions = notification.actions;
        entry.card = notification.card;
        entry.origin = origin;
        entry.timestamp = QDateTime::currentDateTimeUtc();
        return entry;
    }
};

/**
 * @brief Immutable engine configuration snapshot
 *
 * Timeouts are in milliseconds; 0 means never expire.
 */
struct EngineConfig
{
    int maxVisible = Defaults::MaxVisible;
    int lowTimeoutMs = Defaults::LowTimeoutMs;
    int normalTimeoutMs = Defaults::NormalTimeoutMs;
    int criticalTimeoutMs = Defaults::CriticalTimeoutMs;

    // Clicking a popup without a default action closes it
    bool clickToDismiss = true;
};

XNOTID_EXPORT QString urgencyToString(Urgency urgency);
XNOTID_EXPORT QString closeReasonToString(CloseReason reason);
XNOTID_EXPORT QString stateToString(NotificationState state);

} // namespace XNotid
