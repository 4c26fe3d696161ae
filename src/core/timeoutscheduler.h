// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QHash>
#include <QObject>

class QTimer;

namespace XNotid {

/**
 * @brief Per-notification one-shot expiry timers
 *
 * At most one timer is outstanding per id. Timers are single-shot QTimers
 * on the owning thread's event loop, so an expiry is just another queued
 * event next to inbound D-Bus calls. Receivers must re-check the record
 * state before acting on expired().
 */
class XNOTID_EXPORT TimeoutScheduler : public QObject
{
    Q_OBJECT

public:
    explicit TimeoutScheduler(const EngineConfig& config, QObject* parent = nullptr);
    ~TimeoutScheduler() override;

    /**
     * @brief Resolve the effective timeout for a notification
     *
     * - positive expireTimeout wins
     * - negative expireTimeout means never
     * - zero falls back to the configured duration for the urgency
     * - acknowledge-to-dismiss notifications never expire
     *
     * @return Duration in milliseconds, 0 when no timer should be armed
     */
    int resolveTimeout(const Notification& notification) const;

    /**
     * @brief Arm (or re-arm) the expiry for @p id
     * @return false when @p durationMs is not positive and nothing was armed
     */
    bool arm(uint id, int durationMs);
    void disarm(uint id);
    bool isArmed(uint id) const;

    /**
     * @brief Stop the timer while the pointer hovers the popup
     *
     * The duration is kept so resume() can re-arm it in full.
     */
    void pause(uint id);
    void resume(uint id);
    bool isPaused(uint id) const;

    /**
     * @brief Duration the timer for @p id was armed with, 0 if none
     */
    int duration(uint id) const;

    void disarmAll();

Q_SIGNALS:
    void expired(uint id);

private:
    struct Entry
    {
        QTimer* timer = nullptr;
        int durationMs = 0;
        bool paused = false;
    };

    EngineConfig m_config;
    QHash<uint, Entry> m_entries;
};

} // namespace XNotid
