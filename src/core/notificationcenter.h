// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QList>
#include <QObject>

namespace XNotid {

/**
 * @brief Ordered backlog of notifications not currently shown as popups
 *
 * Holds immutable CenterEntry snapshots in the order they were archived or
 * expired. The visibility flag is consumed by the render surface; toggling
 * it never changes the backlog.
 */
class XNOTID_EXPORT NotificationCenter : public QObject
{
    Q_OBJECT

public:
    explicit NotificationCenter(QObject* parent = nullptr);
    ~NotificationCenter() override;

    /**
     * @brief Append a snapshot at the tail
     *
     * An existing entry with the same id is dropped first, so a notification
     * appears at most once.
     */
    void append(const CenterEntry& entry);

    /**
     * @brief Remove the entry for @p id
     * @return false if there was none
     */
    bool acknowledge(uint id);

    /**
     * @brief Remove every entry
     * @return The ids that were removed, oldest first
     */
    QList<uint> clearAll();

    bool contains(uint id) const;
    int count() const
    {
        return m_entries.size();
    }
    QList<CenterEntry> entries() const
    {
        return m_entries;
    }

    bool isVisible() const
    {
        return m_visible;
    }
    void setVisible(bool visible);
    void toggleVisibility();

Q_SIGNALS:
    void entriesChanged();
    void visibilityChanged(bool visible);

private:
    int indexOf(uint id) const;

    QList<CenterEntry> m_entries;
    bool m_visible = false;
};

} // namespace XNotid
