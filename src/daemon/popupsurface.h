// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/types.h"
#include <QHash>
#include <QMap>
#include <QPointer>
#include <QVariant>
#include <memory>

class QQmlEngine;
class QQuickWindow;
class QScreen;
class QUrl;

namespace XNotid {

/**
 * @brief Qt Quick render surface for popups and the notification center
 *
 * Two layer-shell windows on the configured monitor:
 * - PopupWindow.qml stacks one card per occupied slot from the configured corner
 * - CenterWindow.qml is a side panel listing the center backlog
 *
 * The popup window is hidden while the center is open. QML interaction
 * signals are re-emitted as IRenderSurface signals.
 */
class PopupSurface : public IRenderSurface
{
    Q_OBJECT

public:
    explicit PopupSurface(ISettings* settings, QObject* parent = nullptr);
    ~PopupSurface() override;

    QStringList capabilities() const override;

    void showPopup(const Notification& notification, int slot) override;
    void updatePopup(const Notification& notification, int slot) override;
    void removePopup(int slot) override;

    void showCenter(const QList<CenterEntry>& entries) override;
    void hideCenter() override;
    void setDoNotDisturb(bool enabled) override;

private Q_SLOTS:
    void onPopupActivated(int notificationId);
    void onPopupDismissed(int notificationId);
    void onPopupAction(int notificationId, const QString& actionKey);
    void onChoiceSubmitted(int notificationId, const QVariant& selectedIds, const QString& otherText);
    void onPopupHovered(int notificationId, bool hovered);
    void onCenterAcknowledge(int notificationId);
    void onCenterClearAll();
    void onCenterDoNotDisturbToggled();
    void onCenterCloseRequested();

private:
    QQuickWindow* createQmlWindow(const QUrl& qmlUrl, QScreen* screen, const char* windowType);
    QScreen* targetScreen() const;
    bool ensurePopupWindow();
    bool ensureCenterWindow();
    void syncPopups();
    const Card* findCard(uint id) const;

    static QVariantMap popupToVariant(const Notification& notification, int slot);
    static QVariantMap entryToVariant(const CenterEntry& entry);

    ISettings* m_settings;
    std::unique_ptr<QQmlEngine> m_engine;
    QPointer<QQuickWindow> m_popupWindow;
    QPointer<QQuickWindow> m_centerWindow;

    QMap<int, Notification> m_popups; // slot -> shown record
    QList<CenterEntry> m_centerEntries;
    bool m_centerVisible = false;
    bool m_doNotDisturb = false;
};

} // namespace XNotid
