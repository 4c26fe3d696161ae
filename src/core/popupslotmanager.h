// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include <QHash>
#include <QList>
#include <optional>

namespace XNotid {

/**
 * @brief Admission control for popup slots
 *
 * Tracks which notification occupies which of the @c maxVisible popup slots
 * and the FIFO of notifications waiting in the archive. Slot indices are
 * dense and reused: acquire() always hands out the lowest free index.
 *
 * Promotion order is strictly insertion order; urgency never reorders it.
 */
class XNOTID_EXPORT PopupSlotManager
{
public:
    explicit PopupSlotManager(int maxVisible);

    int maxVisible() const
    {
        return m_maxVisible;
    }

    /**
     * @brief Assign the lowest free slot to @p id
     * @return The slot index, or std::nullopt when all slots are taken
     *
     * Returns the existing slot if @p id already holds one.
     */
    std::optional<int> acquire(uint id);

    /**
     * @brief Free the slot held by @p id
     * @return The freed slot index, or std::nullopt if @p id held none
     */
    std::optional<int> release(uint id);

    std::optional<int> slotOf(uint id) const;
    bool hasFreeSlot() const;
    int occupiedCount() const;

    /**
     * @brief Ids holding a slot, ordered by slot index
     */
    QList<uint> visibleIds() const;

    // Archive FIFO
    void archive(uint id);
    bool unarchive(uint id);
    bool isArchived(uint id) const;
    QList<uint> archivedIds() const
    {
        return m_archive;
    }

    /**
     * @brief Take the oldest archived id, if any
     */
    std::optional<uint> takeOldestArchived();

private:
    int m_maxVisible;
    QHash<uint, int> m_slots;
    QList<uint> m_archive;
};

} // namespace XNotid
