// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationsadaptor.h"
#include "../core/constants.h"
#include "../core/dbusvariantutils.h"
#include "../core/logging.h"
#include "../core/notificationengine.h"

namespace XNotid {

NotificationsAdaptor::NotificationsAdaptor(NotificationEngine* engine, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_engine(engine)
{
    Q_ASSERT(engine);

    connect(m_engine, &NotificationEngine::notificationClosed, this, &NotificationsAdaptor::NotificationClosed);
    connect(m_engine, &NotificationEngine::actionInvoked, this, &NotificationsAdaptor::ActionInvoked);
}

uint NotificationsAdaptor::Notify(const QString& appName, uint replacesId, const QString& appIcon,
                                  const QString& summary, const QString& body, const QStringList& actions,
                                  const QVariantMap& hints, int expireTimeout)
{
    NotificationRequest request;
    request.appName = appName;
    request.replacesId = replacesId;
    request.appIcon = appIcon;
    request.summary = summary;
    request.body = body;
    request.actions = actions;
    request.hints = DBusVariantUtils::normalizeHints(hints);
    request.expireTimeout = expireTimeout;

    const uint id = m_engine->notify(request);
    qCDebug(lcDbus) << "Notify from" << appName << "replaces" << replacesId << "->" << id;
    return id;
}

void NotificationsAdaptor::CloseNotification(uint id)
{
    if (!m_engine->close(id, CloseReason::ClosedByRequest)) {
        qCDebug(lcDbus) << "CloseNotification for unknown id" << id;
    }
}

QStringList NotificationsAdaptor::GetCapabilities()
{
    return m_engine->capabilities();
}

QString NotificationsAdaptor::GetServerInformation(QString& vendor, QString& version, QString& specVersion)
{
    vendor = QString(ServerInfo::Vendor);
    version = QString(ServerInfo::Version);
    specVersion = QString(ServerInfo::SpecVersion);
    return QString(ServerInfo::Name);
}

} // namespace XNotid
