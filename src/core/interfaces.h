// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QStringList>

namespace XNotid {

/**
 * @brief Popup placement corner on the configured monitor
 */
enum class PopupCorner {
    TopLeft = 0,
    TopRight = 1,
    BottomLeft = 2,
    BottomRight = 3
};

/**
 * @brief Abstract interface for settings access
 *
 * Allows dependency inversion - components depend on this interface
 * rather than concrete Settings implementation.
 */
class XNOTID_EXPORT ISettings : public QObject
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // Popups
    virtual int monitor() const = 0;
    virtual PopupCorner corner() const = 0;
    virtual int popupWidth() const = 0;
    virtual int maxVisible() const = 0;
    virtual int spacing() const = 0;
    virtual int margin() const = 0;
    virtual bool hoverPause() const = 0;
    virtual bool clickToDismiss() const = 0;

    // Timeouts (seconds, 0 = never)
    virtual int lowTimeout() const = 0;
    virtual int normalTimeout() const = 0;
    virtual int criticalTimeout() const = 0;

    // Event log
    virtual bool logEnabled() const = 0;
    virtual QString logPath() const = 0;

    // Shortcuts
    virtual QString toggleCenterShortcut() const = 0;

    /**
     * @brief Immutable snapshot handed to the engine at startup
     */
    virtual EngineConfig engineConfig() const = 0;

    virtual void load() = 0;

Q_SIGNALS:
    void settingsChanged();
};

/**
 * @brief Rendering collaborator of the notification engine
 *
 * The engine only emits declarative intents; the surface owns windows,
 * fonts and compositor interaction. All calls are one-way. User input comes
 * back through the signals and is routed to the engine's entry points.
 */
class XNOTID_EXPORT IRenderSurface : public QObject
{
    Q_OBJECT

public:
    explicit IRenderSurface(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IRenderSurface() override;

    virtual QStringList capabilities() const = 0;

    virtual void showPopup(const Notification& notification, int slot) = 0;
    virtual void updatePopup(const Notification& notification, int slot) = 0;
    virtual void removePopup(int slot) = 0;

    virtual void showCenter(const QList<CenterEntry>& entries) = 0;
    virtual void hideCenter() = 0;

    /**
     * @brief Reflect the Do-Not-Disturb state in the center header
     */
    virtual void setDoNotDisturb(bool enabled) = 0;

Q_SIGNALS:
    void activateRequested(uint id);
    void dismissRequested(uint id);
    void actionRequested(uint id, const QString& actionKey);
    void hoverChanged(uint id, bool hovered);
    void acknowledgeRequested(uint id);
    void clearAllRequested();
    void toggleCenterRequested();
    void doNotDisturbToggleRequested();
};

} // namespace XNotid
