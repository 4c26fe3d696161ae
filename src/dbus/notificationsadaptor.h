// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace XNotid {

class NotificationEngine;

/**
 * @brief D-Bus adaptor for the freedesktop notification protocol
 *
 * Provides D-Bus interface: org.freedesktop.Notifications
 * at /org/freedesktop/Notifications.
 *
 * Close requests for unknown ids succeed silently; clients routinely race
 * with expiry and user dismissal.
 */
class XNOTID_EXPORT NotificationsAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.freedesktop.Notifications")

public:
    explicit NotificationsAdaptor(NotificationEngine* engine, QObject* parent = nullptr);
    ~NotificationsAdaptor() override = default;

public Q_SLOTS:
    uint Notify(const QString& appName, uint replacesId, const QString& appIcon, const QString& summary,
                const QString& body, const QStringList& actions, const QVariantMap& hints, int expireTimeout);
    void CloseNotification(uint id);
    QStringList GetCapabilities();
    QString GetServerInformation(QString& vendor, QString& version, QString& specVersion);

Q_SIGNALS:
    void NotificationClosed(uint id, uint reason);
    void ActionInvoked(uint id, const QString& actionKey);

private:
    NotificationEngine* m_engine;
};

} // namespace XNotid
