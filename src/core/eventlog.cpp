// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "eventlog.h"
#include "constants.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

namespace XNotid {

EventLog::EventLog(const QString& path)
    : m_path(path)
{
}

QJsonObject EventLog::baseEvent(const Notification& notification, const QString& event) const
{
    QJsonObject obj;
    obj[JsonKeys::Uuid] = notification.uuid.toString(QUuid::WithoutBraces);
    obj[JsonKeys::Timestamp] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    obj[JsonKeys::Event] = event;
    obj[JsonKeys::NotificationId] = static_cast<qint64>(notification.id);
    obj[JsonKeys::AppName] = notification.appName;
    obj[JsonKeys::Summary] = notification.summary;
    return obj;
}

void EventLog::logReceived(const Notification& notification)
{
    QJsonObject obj = baseEvent(notification, QStringLiteral("received"));
    obj[JsonKeys::AppIcon] = notification.appIcon;
    obj[JsonKeys::Body] = notification.body;
    obj[JsonKeys::CreatedAt] = notification.createdAt.toString(Qt::ISODateWithMs);
    obj[JsonKeys::Urgency] = urgencyToString(notification.urgency);
    obj[JsonKeys::DesktopEntry] =
        notification.desktopEntry.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(notification.desktopEntry);
    obj[JsonKeys::Hints] = QJsonObject::fromVariantMap(notification.hints);
    append(obj);
}

void EventLog::logClosed(const Notification& notification, CloseReason reason)
{
    append(baseEvent(notification, closeReasonToString(reason)));
}

void EventLog::logAction(const Notification& notification, const QString& actionKey)
{
    QJsonObject obj = baseEvent(notification, QStringLiteral("action"));
    obj[JsonKeys::ActionKey] = actionKey;
    append(obj);
}

void EventLog::append(const QJsonObject& line)
{
    if (m_path.isEmpty()) {
        return;
    }

    if (!m_directoryReady) {
        const QString dir = QFileInfo(m_path).absolutePath();
        if (!QDir().mkpath(dir)) {
            qCWarning(lcCore) << "Cannot create event log directory" << dir;
            return;
        }
        m_directoryReady = true;
    }

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qCWarning(lcCore) << "Cannot open event log" << m_path << ":" << file.errorString();
        return;
    }

    QByteArray data = QJsonDocument(line).toJson(QJsonDocument::Compact);
    data.append('\n');
    if (file.write(data) != data.size()) {
        qCWarning(lcCore) << "Short write to event log" << m_path << ":" << file.errorString();
    }
}

} // namespace XNotid
