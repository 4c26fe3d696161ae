// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationcenter.h"
#include "logging.h"

namespace XNotid {

NotificationCenter::NotificationCenter(QObject* parent)
    : QObject(parent)
{
}

NotificationCenter::~NotificationCenter() = default;

int NotificationCenter::indexOf(uint id) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

void NotificationCenter::append(const CenterEntry& entry)
{
    const int existing = indexOf(entry.id);
    if (existing >= 0) {
        m_entries.removeAt(existing);
    }
    m_entries.append(entry);
    qCDebug(lcCenter) << "Center entry added for notification" << entry.id << "total" << m_entries.size();
    Q_EMIT entriesChanged();
}

bool NotificationCenter::acknowledge(uint id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    m_entries.removeAt(index);
    Q_EMIT entriesChanged();
    return true;
}

QList<uint> NotificationCenter::clearAll()
{
    QList<uint> removed;
    if (m_entries.isEmpty()) {
        return removed;
    }

    removed.reserve(m_entries.size());
    for (const CenterEntry& entry : std::as_const(m_entries)) {
        removed.append(entry.id);
    }
    m_entries.clear();
    qCDebug(lcCenter) << "Center cleared," << removed.size() << "entries removed";
    Q_EMIT entriesChanged();
    return removed;
}

bool NotificationCenter::contains(uint id) const
{
    return indexOf(id) >= 0;
}

void NotificationCenter::setVisible(bool visible)
{
    if (m_visible == visible) {
        return;
    }
    m_visible = visible;
    Q_EMIT visibilityChanged(m_visible);
}

void NotificationCenter::toggleVisibility()
{
    setVisible(!m_visible);
}

} // namespace XNotid
