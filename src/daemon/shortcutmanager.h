// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QAction>

namespace XNotid {

class ISettings;

/**
 * @brief Manages global keyboard shortcuts
 *
 * Registers the xnotid actions with KGlobalAccel so they show up (and can be
 * rebound) in System Settings. Triggered actions are reported as signals;
 * the daemon routes them to the engine.
 */
class ShortcutManager : public QObject
{
    Q_OBJECT

public:
    explicit ShortcutManager(ISettings* settings, QObject* parent = nullptr);
    ~ShortcutManager() override;

    /**
     * @brief Initialize and register shortcuts
     */
    void registerShortcuts();

    /**
     * @brief Unregister all shortcuts
     */
    void unregisterShortcuts();

Q_SIGNALS:
    void toggleCenterRequested();

private:
    ISettings* m_settings;
    QAction* m_toggleCenterAction = nullptr;
};

} // namespace XNotid
