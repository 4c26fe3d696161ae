// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "popupslotmanager.h"
#include "logging.h"
#include <QMap>

namespace XNotid {

PopupSlotManager::PopupSlotManager(int maxVisible)
    : m_maxVisible(qMax(1, maxVisible))
{
    if (maxVisible < 1) {
        qCWarning(lcAdmission) << "maxVisible" << maxVisible << "clamped to 1";
    }
}

std::optional<int> PopupSlotManager::acquire(uint id)
{
    auto existing = m_slots.constFind(id);
    if (existing != m_slots.constEnd()) {
        return existing.value();
    }

    if (m_slots.size() >= m_maxVisible) {
        return std::nullopt;
    }

    const QList<int> taken = m_slots.values();
    for (int slot = 0; slot < m_maxVisible; ++slot) {
        if (!taken.contains(slot)) {
            m_slots.insert(id, slot);
            qCDebug(lcAdmission) << "Notification" << id << "admitted to slot" << slot;
            return slot;
        }
    }
    return std::nullopt;
}

std::optional<int> PopupSlotManager::release(uint id)
{
    auto it = m_slots.find(id);
    if (it == m_slots.end()) {
        return std::nullopt;
    }
    const int slot = it.value();
    m_slots.erase(it);
    qCDebug(lcAdmission) << "Slot" << slot << "released by notification" << id;
    return slot;
}

std::optional<int> PopupSlotManager::slotOf(uint id) const
{
    auto it = m_slots.constFind(id);
    if (it == m_slots.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool PopupSlotManager::hasFreeSlot() const
{
    return m_slots.size() < m_maxVisible;
}

int PopupSlotManager::occupiedCount() const
{
    return m_slots.size();
}

QList<uint> PopupSlotManager::visibleIds() const
{
    QMap<int, uint> bySlot;
    for (auto it = m_slots.constBegin(); it != m_slots.constEnd(); ++it) {
        bySlot.insert(it.value(), it.key());
    }
    return bySlot.values();
}

void PopupSlotManager::archive(uint id)
{
    if (!m_archive.contains(id)) {
        m_archive.append(id);
        qCDebug(lcAdmission) << "Notification" << id << "archived, queue length" << m_archive.size();
    }
}

bool PopupSlotManager::unarchive(uint id)
{
    return m_archive.removeOne(id);
}

bool PopupSlotManager::isArchived(uint id) const
{
    return m_archive.contains(id);
}

std::optional<uint> PopupSlotManager::takeOldestArchived()
{
    if (m_archive.isEmpty()) {
        return std::nullopt;
    }
    return m_archive.takeFirst();
}

} // namespace XNotid
