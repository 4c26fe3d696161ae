// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationengine.h"
#include "eventlog.h"
#include "interfaces.h"
#include "logging.h"
#include "notificationcenter.h"
#include "popupslotmanager.h"
#include "timeoutscheduler.h"

namespace XNotid {

NotificationEngine::NotificationEngine(const EngineConfig& config, IRenderSurface* surface, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_surface(surface)
    , m_store(std::make_unique<NotificationStore>())
    , m_scheduler(std::make_unique<TimeoutScheduler>(config))
    , m_slots(std::make_unique<PopupSlotManager>(config.maxVisible))
    , m_center(std::make_unique<NotificationCenter>())
{
    Q_ASSERT(surface);

    connect(m_store.get(), &NotificationStore::recordClosed, this, &NotificationEngine::onRecordClosed);
    connect(m_store.get(), &NotificationStore::actionInvoked, this, &NotificationEngine::onActionInvoked);
    connect(m_scheduler.get(), &TimeoutScheduler::expired, this, &NotificationEngine::onExpired);
    connect(m_center.get(), &NotificationCenter::entriesChanged, this, &NotificationEngine::onCenterChanged);
    connect(m_center.get(), &NotificationCenter::visibilityChanged, this,
            &NotificationEngine::onCenterVisibilityChanged);
}

NotificationEngine::~NotificationEngine()
{
    // Members are torn down in reverse order; the store must not report closes into a half-destroyed engine
    disconnect(m_store.get(), nullptr, this, nullptr);
    m_scheduler->disarmAll();
}

void NotificationEngine::setEventLog(std::unique_ptr<EventLog> eventLog)
{
    m_eventLog = std::move(eventLog);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Inbound entry points
// ═══════════════════════════════════════════════════════════════════════════════

uint NotificationEngine::notify(const NotificationRequest& request)
{
    const Notification* existing = m_store->find(request.replacesId);
    if (request.replacesId == 0 || !existing) {
        const uint id = m_store->create(request);
        if (m_eventLog) {
            m_eventLog->logReceived(*m_store->find(id));
        }
        admit(id);
        return id;
    }

    const uint id = request.replacesId;
    const NotificationState previousState = existing->state;
    // A replace under the pointer must not start the clock
    const bool wasPaused = m_scheduler->isPaused(id);

    m_scheduler->disarm(id);
    m_store->replace(id, request);
    const Notification* record = m_store->find(id);
    if (m_eventLog) {
        m_eventLog->logReceived(*record);
    }

    switch (previousState) {
    case NotificationState::Visible: {
        // Keep the slot, refresh what is shown and restart the clock
        m_surface->updatePopup(*record, record->slot);
        armTimer(id);
        if (wasPaused && m_scheduler->isArmed(id)) {
            m_scheduler->pause(id);
        }
        break;
    }
    case NotificationState::Archived:
        m_slots->unarchive(id);
        m_center->acknowledge(id);
        m_store->transition(id, NotificationState::Queued);
        admit(id);
        break;
    default:
        admit(id);
        break;
    }
    return id;
}

bool NotificationEngine::close(uint id, CloseReason reason)
{
    return m_store->close(id, reason);
}

NotificationStore::ActionResult NotificationEngine::invokeAction(uint id, const QString& actionKey)
{
    return m_store->recordAction(id, actionKey);
}

bool NotificationEngine::activate(uint id)
{
    const Notification* record = m_store->find(id);
    if (!record) {
        return false;
    }
    if (record->hasAction(QStringLiteral("default"))) {
        return invokeAction(id, QStringLiteral("default")) != NotificationStore::ActionResult::Rejected;
    }
    if (!m_config.clickToDismiss || record->acknowledgeToDismiss || record->card) {
        qCDebug(lcAdmission) << "Click ignored for notification" << id;
        return false;
    }
    return m_store->close(id, CloseReason::Dismissed);
}

bool NotificationEngine::acknowledge(uint id)
{
    const Notification* record = m_store->find(id);
    if (record && record->state == NotificationState::Archived) {
        // onRecordClosed drops the center entry
        return m_store->close(id, CloseReason::Dismissed);
    }
    return m_center->acknowledge(id);
}

void NotificationEngine::clearCenter()
{
    const QList<uint> archived = m_slots->archivedIds();
    for (uint id : archived) {
        m_store->close(id, CloseReason::Dismissed);
    }
    m_center->clearAll();
}

void NotificationEngine::toggleCenter()
{
    m_center->toggleVisibility();
}

bool NotificationEngine::isCenterVisible() const
{
    return m_center->isVisible();
}

void NotificationEngine::setDoNotDisturb(bool enabled)
{
    if (m_doNotDisturb == enabled) {
        return;
    }
    m_doNotDisturb = enabled;
    qCInfo(lcAdmission) << "Do-Not-Disturb" << (enabled ? "enabled" : "disabled");

    m_surface->setDoNotDisturb(enabled);
    Q_EMIT doNotDisturbChanged(enabled);

    if (!enabled) {
        promoteNext();
    }
}

void NotificationEngine::toggleDoNotDisturb()
{
    setDoNotDisturb(!m_doNotDisturb);
}

void NotificationEngine::setHovered(uint id, bool hovered)
{
    const Notification* record = m_store->find(id);
    if (!record || record->state != NotificationState::Visible) {
        return;
    }
    if (hovered) {
        m_scheduler->pause(id);
    } else {
        m_scheduler->resume(id);
    }
}

QStringList NotificationEngine::capabilities() const
{
    return m_surface->capabilities();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════════════════════════════════════

void NotificationEngine::admit(uint id)
{
    std::optional<int> slot;
    if (!isSuppressed(*m_store->find(id))) {
        slot = m_slots->acquire(id);
    }
    if (slot) {
        m_store->transition(id, NotificationState::Visible, *slot);
        m_surface->showPopup(*m_store->find(id), *slot);
        armTimer(id);
        return;
    }

    m_store->transition(id, NotificationState::Archived);
    m_slots->archive(id);
    m_center->append(CenterEntry::fromNotification(*m_store->find(id), CenterEntry::Origin::Archived));
    qCDebug(lcAdmission) << "No popup slot for notification" << id << "moved to center";
}

bool NotificationEngine::isSuppressed(const Notification& notification) const
{
    return m_doNotDisturb && notification.urgency != Urgency::Critical;
}

void NotificationEngine::armTimer(uint id)
{
    const Notification* record = m_store->find(id);
    if (!record) {
        return;
    }
    const int timeout = m_scheduler->resolveTimeout(*record);
    if (timeout > 0) {
        m_scheduler->arm(id, timeout);
    }
}

void NotificationEngine::promoteNext()
{
    while (m_slots->hasFreeSlot()) {
        const std::optional<uint> next = takeNextPromotable();
        if (!next) {
            return;
        }

        const uint id = *next;
        if (!m_store->contains(id)) {
            continue;
        }

        const std::optional<int> slot = m_slots->acquire(id);
        if (!slot) {
            return;
        }

        m_center->acknowledge(id);
        m_store->transition(id, NotificationState::Visible, *slot);
        m_surface->showPopup(*m_store->find(id), *slot);
        armTimer(id);
        qCDebug(lcAdmission) << "Promoted notification" << id << "to slot" << *slot;
    }
}

// Takes the oldest archived notification allowed on screen; under Do-Not-Disturb
// suppressed ones keep their place in the queue
std::optional<uint> NotificationEngine::takeNextPromotable()
{
    if (!m_doNotDisturb) {
        return m_slots->takeOldestArchived();
    }

    const QList<uint> archived = m_slots->archivedIds();
    for (uint id : archived) {
        const Notification* record = m_store->find(id);
        if (!record || !isSuppressed(*record)) {
            m_slots->unarchive(id);
            return id;
        }
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Store, scheduler and center events
// ═══════════════════════════════════════════════════════════════════════════════

void NotificationEngine::onRecordClosed(const Notification& notification, CloseReason reason)
{
    const uint id = notification.id;
    m_scheduler->disarm(id);

    const std::optional<int> slot = m_slots->release(id);
    if (slot) {
        m_surface->removePopup(*slot);
        if (reason == CloseReason::Expired && !notification.transient) {
            m_center->append(CenterEntry::fromNotification(notification, CenterEntry::Origin::Expired));
        }
    } else {
        m_slots->unarchive(id);
        m_center->acknowledge(id);
    }

    if (m_eventLog) {
        m_eventLog->logClosed(notification, reason);
    }

    Q_EMIT notificationClosed(id, static_cast<uint>(reason));

    if (slot) {
        promoteNext();
    }
}

void NotificationEngine::onActionInvoked(uint id, const QString& actionKey)
{
    const Notification* record = m_store->find(id);
    if (m_eventLog && record) {
        m_eventLog->logAction(*record, actionKey);
    }
    Q_EMIT actionInvoked(id, actionKey);
}

void NotificationEngine::onExpired(uint id)
{
    const Notification* record = m_store->find(id);
    if (!record || record->state != NotificationState::Visible) {
        return;
    }
    m_store->transition(id, NotificationState::Expired);
    m_store->close(id, CloseReason::Expired);
}

void NotificationEngine::onCenterChanged()
{
    if (m_center->isVisible()) {
        m_surface->showCenter(m_center->entries());
    }
}

void NotificationEngine::onCenterVisibilityChanged(bool visible)
{
    if (visible) {
        m_surface->showCenter(m_center->entries());
    } else {
        m_surface->hideCenter();
    }
}

} // namespace XNotid
