// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationstore.h"
#include "cardparser.h"
#include "constants.h"
#include "logging.h"
#include <algorithm>

namespace XNotid {

NotificationStore::NotificationStore(QObject* parent)
    : QObject(parent)
{
}

NotificationStore::~NotificationStore() = default;

// ═══════════════════════════════════════════════════════════════════════════════
// Record creation
// ═══════════════════════════════════════════════════════════════════════════════

uint NotificationStore::allocateId()
{
    do {
        ++m_lastId;
    } while (m_lastId == 0 || m_records.contains(m_lastId));
    return m_lastId;
}

uint NotificationStore::create(const NotificationRequest& request)
{
    Notification record;
    record.id = allocateId();
    record.uuid = QUuid::createUuid();
    record.createdAt = QDateTime::currentDateTimeUtc();
    record.state = NotificationState::Queued;
    applyRequest(record, request);

    const uint id = record.id;
    m_records.insert(id, record);
    qCDebug(lcStore) << "Created notification" << id << "from" << request.appName;
    return id;
}

uint NotificationStore::replace(uint id, const NotificationRequest& request)
{
    auto it = m_records.find(id);
    if (id == 0 || it == m_records.end()) {
        return create(request);
    }

    applyRequest(it.value(), request);
    qCDebug(lcStore) << "Replaced notification" << id;
    return id;
}

void NotificationStore::applyRequest(Notification& record, const NotificationRequest& request) const
{
    record.appName = request.appName;
    record.appIcon = request.appIcon;
    record.summary = request.summary;
    record.body = request.body;
    record.actions = parseActions(request.actions);
    record.hints = request.hints;
    record.expireTimeout = request.expireTimeout;
    record.updatedAt = QDateTime::currentDateTimeUtc();

    // Hint-derived fields
    const QVariantMap& hints = request.hints;
    record.urgency = parseUrgency(hints);
    record.transient = hints.value(Hints::Transient).toBool();
    record.resident = hints.value(Hints::Resident).toBool();
    record.desktopEntry = hints.value(Hints::DesktopEntry).toString();
    record.category = hints.value(Hints::Category).toString();

    record.imagePath = hints.value(Hints::ImagePath).toString();
    if (record.imagePath.isEmpty()) {
        record.imagePath = hints.value(Hints::ImagePathLegacy).toString();
    }
    if (record.imagePath.isEmpty()) {
        record.imagePath = request.appIcon;
    }

    bool progressOk = false;
    const int progress = hints.value(Hints::Value).toInt(&progressOk);
    record.progress = (hints.contains(Hints::Value) && progressOk) ? std::clamp(progress, 0, 100) : -1;

    // A fresh card replaces whatever was attached before
    record.card.reset();
    const CardParseResult parsed = CardParser::parse(request.body);
    if (parsed.isCard()) {
        record.card = parsed.card;
    } else if (parsed.isMalformed()) {
        qCWarning(lcCard) << "Malformed card from" << request.appName << ":" << parsed.error
                          << "- showing as plain text";
    }

    record.acknowledgeToDismiss = record.card.has_value() || hints.value(Hints::Acknowledge).toBool();
}

QList<NotificationAction> NotificationStore::parseActions(const QStringList& flat)
{
    QList<NotificationAction> actions;
    actions.reserve(flat.size() / 2);
    for (int i = 0; i + 1 < flat.size(); i += 2) {
        actions.append({flat.at(i), flat.at(i + 1)});
    }
    return actions;
}

Urgency NotificationStore::parseUrgency(const QVariantMap& hints)
{
    bool ok = false;
    const int value = hints.value(Hints::Urgency).toInt(&ok);
    if (!ok) {
        return Urgency::Normal;
    }
    switch (value) {
    case 0:
        return Urgency::Low;
    case 2:
        return Urgency::Critical;
    default:
        return Urgency::Normal;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Close and actions
// ═══════════════════════════════════════════════════════════════════════════════

bool NotificationStore::close(uint id, CloseReason reason)
{
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        qCDebug(lcStore) << "Close for unknown notification" << id << "ignored";
        return false;
    }

    const Notification record = it.value();
    m_records.erase(it);

    qCDebug(lcStore) << "Closed notification" << id << "reason" << closeReasonToString(reason);
    Q_EMIT recordClosed(record, reason);
    return true;
}

bool NotificationStore::isPermittedAction(const Notification& record, const QString& actionKey) const
{
    if (actionKey.isEmpty()) {
        return false;
    }
    if (record.hasAction(actionKey)) {
        return true;
    }
    return record.card.has_value() && CardParser::isValidResponse(*record.card, actionKey);
}

NotificationStore::ActionResult NotificationStore::recordAction(uint id, const QString& actionKey)
{
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        qCDebug(lcStore) << "Action for unknown notification" << id << "ignored";
        return ActionResult::UnknownIdentifier;
    }

    Notification& record = it.value();
    if (record.state == NotificationState::ActionTaken) {
        return ActionResult::Rejected;
    }
    if (!isPermittedAction(record, actionKey)) {
        qCDebug(lcStore) << "Rejected undeclared action" << actionKey << "for notification" << id;
        return ActionResult::Rejected;
    }

    // Resident notifications survive their actions unless they must be acknowledged
    if (record.resident && !record.acknowledgeToDismiss) {
        Q_EMIT actionInvoked(id, actionKey);
        return ActionResult::Invoked;
    }

    record.state = NotificationState::ActionTaken;
    Q_EMIT actionInvoked(id, actionKey);
    close(id, CloseReason::Dismissed);
    return ActionResult::InvokedAndDismissed;
}

// ═══════════════════════════════════════════════════════════════════════════════
// State machine
// ═══════════════════════════════════════════════════════════════════════════════

bool NotificationStore::isValidTransition(NotificationState from, NotificationState to)
{
    using S = NotificationState;
    switch (from) {
    case S::Queued:
        return to == S::Visible || to == S::Archived || to == S::Closed;
    case S::Visible:
        return to == S::Expired || to == S::Dismissed || to == S::ActionTaken || to == S::Closed;
    case S::Archived:
        return to == S::Visible || to == S::Queued || to == S::Dismissed || to == S::ActionTaken
            || to == S::Closed;
    case S::Expired:
    case S::Dismissed:
    case S::ActionTaken:
        return to == S::Closed;
    case S::Closed:
        return false;
    }
    return false;
}

bool NotificationStore::transition(uint id, NotificationState state, int slot)
{
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return false;
    }

    Notification& record = it.value();
    if (!isValidTransition(record.state, state)) {
        qCWarning(lcStore) << "Illegal transition for notification" << id << ":" << stateToString(record.state)
                           << "->" << stateToString(state);
        return false;
    }

    record.state = state;
    record.slot = (state == NotificationState::Visible) ? slot : -1;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

const Notification* NotificationStore::find(uint id) const
{
    auto it = m_records.constFind(id);
    return it == m_records.constEnd() ? nullptr : &it.value();
}

bool NotificationStore::contains(uint id) const
{
    return m_records.contains(id);
}

int NotificationStore::count() const
{
    return m_records.size();
}

QList<uint> NotificationStore::ids() const
{
    QList<uint> result = m_records.keys();
    std::sort(result.begin(), result.end());
    return result;
}

QList<uint> NotificationStore::idsInState(NotificationState state) const
{
    QList<uint> result;
    for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it) {
        if (it.value().state == state) {
            result.append(it.key());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace XNotid
