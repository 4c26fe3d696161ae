// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "timeoutscheduler.h"
#include "logging.h"
#include <QTimer>

namespace XNotid {

TimeoutScheduler::TimeoutScheduler(const EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
}

TimeoutScheduler::~TimeoutScheduler()
{
    disarmAll();
}

int TimeoutScheduler::resolveTimeout(const Notification& notification) const
{
    if (notification.acknowledgeToDismiss) {
        return 0;
    }
    if (notification.expireTimeout > 0) {
        return notification.expireTimeout;
    }
    if (notification.expireTimeout < 0) {
        return 0;
    }

    switch (notification.urgency) {
    case Urgency::Low:
        return qMax(0, m_config.lowTimeoutMs);
    case Urgency::Critical:
        return qMax(0, m_config.criticalTimeoutMs);
    case Urgency::Normal:
        break;
    }
    return qMax(0, m_config.normalTimeoutMs);
}

bool TimeoutScheduler::arm(uint id, int durationMs)
{
    disarm(id);
    if (durationMs <= 0) {
        return false;
    }

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(durationMs);
    connect(timer, &QTimer::timeout, this, [this, id, timer]() {
        auto it = m_entries.find(id);
        if (it == m_entries.end() || it->timer != timer) {
            return;
        }
        m_entries.erase(it);
        timer->deleteLater();
        qCDebug(lcScheduler) << "Notification" << id << "expired";
        Q_EMIT expired(id);
    });

    m_entries.insert(id, Entry{timer, durationMs, false});
    timer->start();
    qCDebug(lcScheduler) << "Armed notification" << id << "for" << durationMs << "ms";
    return true;
}

void TimeoutScheduler::disarm(uint id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return;
    }
    it->timer->stop();
    it->timer->deleteLater();
    m_entries.erase(it);
}

bool TimeoutScheduler::isArmed(uint id) const
{
    auto it = m_entries.constFind(id);
    return it != m_entries.constEnd() && !it->paused;
}

void TimeoutScheduler::pause(uint id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->paused) {
        return;
    }
    it->timer->stop();
    it->paused = true;
    qCDebug(lcScheduler) << "Paused notification" << id;
}

void TimeoutScheduler::resume(uint id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end() || !it->paused) {
        return;
    }
    it->paused = false;
    it->timer->start(it->durationMs);
    qCDebug(lcScheduler) << "Resumed notification" << id << "for" << it->durationMs << "ms";
}

bool TimeoutScheduler::isPaused(uint id) const
{
    auto it = m_entries.constFind(id);
    return it != m_entries.constEnd() && it->paused;
}

int TimeoutScheduler::duration(uint id) const
{
    auto it = m_entries.constFind(id);
    return it == m_entries.constEnd() ? 0 : it->durationMs;
}

void TimeoutScheduler::disarmAll()
{
    for (auto& entry : m_entries) {
        entry.timer->stop();
        entry.timer->deleteLater();
    }
    m_entries.clear();
}

} // namespace XNotid
