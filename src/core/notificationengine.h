// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "notificationstore.h"
#include "types.h"
#include <QObject>
#include <QStringList>
#include <memory>
#include <optional>

namespace XNotid {

class IRenderSurface;
class TimeoutScheduler;
class PopupSlotManager;
class NotificationCenter;
class EventLog;

/**
 * @brief Single-writer orchestrator of the notification lifecycle
 *
 * Owns the store, the timeout scheduler, the popup slot manager and the
 * notification center, and drives the render surface. Every mutation runs
 * on the thread that owns the engine; D-Bus calls, timer expiries and
 * popup interactions all reach it as queued events on that thread's loop.
 *
 * All dismissal paths (remote CloseNotification, popup close button,
 * center acknowledge) end in close(id, reason).
 */
class XNOTID_EXPORT NotificationEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @param surface Render surface, must outlive the engine
     */
    explicit NotificationEngine(const EngineConfig& config, IRenderSurface* surface, QObject* parent = nullptr);
    ~NotificationEngine() override;

    /**
     * @brief Attach the JSONL event log; nullptr disables logging
     */
    void setEventLog(std::unique_ptr<EventLog> eventLog);

    /**
     * @brief Create a notification, or replace the live one named by replacesId
     * @return The notification id, never 0
     */
    uint notify(const NotificationRequest& request);

    /**
     * @brief Close a live notification
     * @return false if @p id was unknown (success no-op)
     */
    bool close(uint id, CloseReason reason);

    NotificationStore::ActionResult invokeAction(uint id, const QString& actionKey);

    /**
     * @brief A click on the popup body
     *
     * Invokes the "default" action when declared. Otherwise closes the popup
     * as Dismissed if click-to-dismiss is enabled, unless the notification
     * is a card or requires acknowledgement.
     *
     * @return true if the click had an effect
     */
    bool activate(uint id);

    /**
     * @brief Remove a center entry; a still-archived notification is closed as Dismissed
     */
    bool acknowledge(uint id);

    /**
     * @brief Empty the center, closing every archived notification as Dismissed
     */
    void clearCenter();

    void toggleCenter();
    bool isCenterVisible() const;

    /**
     * @brief Do-Not-Disturb mode
     *
     * While enabled, non-critical notifications go straight to the center
     * and only critical ones are promoted into free slots. Popups already
     * on screen stay. Disabling refills free slots from the archive.
     */
    void setDoNotDisturb(bool enabled);
    void toggleDoNotDisturb();
    bool isDoNotDisturb() const
    {
        return m_doNotDisturb;
    }

    /**
     * @brief Pause or resume the expiry of a visible popup while hovered
     */
    void setHovered(uint id, bool hovered);

    QStringList capabilities() const;

    const EngineConfig& config() const
    {
        return m_config;
    }
    const NotificationStore* store() const
    {
        return m_store.get();
    }
    const TimeoutScheduler* scheduler() const
    {
        return m_scheduler.get();
    }
    const PopupSlotManager* popupSlots() const
    {
        return m_slots.get();
    }
    const NotificationCenter* center() const
    {
        return m_center.get();
    }

Q_SIGNALS:
    void notificationClosed(uint id, uint reason);
    void actionInvoked(uint id, const QString& actionKey);
    void doNotDisturbChanged(bool enabled);

private Q_SLOTS:
    void onRecordClosed(const XNotid::Notification& notification, XNotid::CloseReason reason);
    void onActionInvoked(uint id, const QString& actionKey);
    void onExpired(uint id);
    void onCenterChanged();
    void onCenterVisibilityChanged(bool visible);

private:
    void admit(uint id);
    void armTimer(uint id);
    void promoteNext();
    bool isSuppressed(const Notification& notification) const;
    std::optional<uint> takeNextPromotable();

    EngineConfig m_config;
    IRenderSurface* m_surface = nullptr;
    bool m_doNotDisturb = false;

    std::unique_ptr<NotificationStore> m_store;
    std::unique_ptr<TimeoutScheduler> m_scheduler;
    std::unique_ptr<PopupSlotManager> m_slots;
    std::unique_ptr<NotificationCenter> m_center;
    std::unique_ptr<EventLog> m_eventLog;
};

} // namespace XNotid
