// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace XNotid {

class Settings;
class PopupSurface;
class NotificationEngine;
class ShortcutManager;
class NotificationsAdaptor;
class ControlAdaptor;

/**
 * @brief Main daemon for xnotid
 *
 * The daemon runs in the background and handles:
 * - org.freedesktop.Notifications on the session bus
 * - the org.xnotid.Control interface
 * - popup and center rendering via Wayland layer-shell
 * - the global toggle-center shortcut
 *
 * Lifecycle is init() -> start() -> stop(). init() fails when the session
 * bus is unreachable or another notification daemon owns the bus name.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    /**
     * @brief Take over the notification bus name from a running daemon
     *
     * Must be called before init().
     */
    void setReplaceExisting(bool replace)
    {
        m_replaceExisting = replace;
    }

    bool init();
    void start();
    void stop();

    Settings* settings() const
    {
        return m_settings.get();
    }
    NotificationEngine* engine() const
    {
        return m_engine.get();
    }

Q_SIGNALS:
    void started();
    void stopped();

private:
    bool registerDBus();
    void connectSurface();

    // Declaration order matters: the engine holds a raw pointer to the surface
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<PopupSurface> m_surface;
    std::unique_ptr<NotificationEngine> m_engine;
    std::unique_ptr<ShortcutManager> m_shortcutManager;

    // D-Bus adaptors need a parent (the adapted object); Qt requires it.
    // So we use raw pointers; Qt parent-child system manages their lifetime
    NotificationsAdaptor* m_notificationsAdaptor = nullptr;
    QObject* m_controlObject = nullptr;
    ControlAdaptor* m_controlAdaptor = nullptr;

    bool m_replaceExisting = false;
    bool m_registered = false;
    bool m_running = false;
};

} // namespace XNotid
