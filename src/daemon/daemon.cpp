// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusReply>
#include <QThread>
#include "popupsurface.h"
#include "shortcutmanager.h"
#include "../core/constants.h"
#include "../core/eventlog.h"
#include "../core/logging.h"
#include "../core/notificationengine.h"
#include "../config/settings.h"
#include "../dbus/controladaptor.h"
#include "../dbus/notificationsadaptor.h"

namespace XNotid {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    // Don't pass 'this' as parent for unique_ptr-managed objects.
    // unique_ptr owns lifetime; a Qt parent would double-free.
    , m_settings(std::make_unique<Settings>(nullptr))
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init()
{
    // Load settings; the engine only ever sees this snapshot
    m_settings->load();
    const EngineConfig config = m_settings->engineConfig();

    m_surface = std::make_unique<PopupSurface>(m_settings.get(), nullptr);
    m_engine = std::make_unique<NotificationEngine>(config, m_surface.get(), nullptr);
    if (m_settings->logEnabled()) {
        m_engine->setEventLog(std::make_unique<EventLog>(m_settings->logPath()));
        qCInfo(lcDaemon) << "Event log:" << m_settings->logPath();
    }
    connectSurface();

    m_shortcutManager = std::make_unique<ShortcutManager>(m_settings.get(), nullptr);
    connect(m_shortcutManager.get(), &ShortcutManager::toggleCenterRequested, m_engine.get(),
            &NotificationEngine::toggleCenter);

    // Create D-Bus adaptors
    m_notificationsAdaptor = new NotificationsAdaptor(m_engine.get(), this);
    m_controlObject = new QObject(this);
    m_controlAdaptor = new ControlAdaptor(m_engine.get(), m_controlObject);

    if (!registerDBus()) {
        return false;
    }

    qCInfo(lcDaemon) << "Engine ready: maxVisible" << config.maxVisible << "timeouts (ms)" << config.lowTimeoutMs
                     << config.normalTimeoutMs << config.criticalTimeoutMs;
    return true;
}

void Daemon::connectSurface()
{
    NotificationEngine* engine = m_engine.get();

    // Every dismissal path ends in NotificationEngine::close()
    connect(m_surface.get(), &IRenderSurface::activateRequested, engine, &NotificationEngine::activate);
    connect(m_surface.get(), &IRenderSurface::dismissRequested, engine, [engine](uint id) {
        engine->close(id, CloseReason::Dismissed);
    });
    connect(m_surface.get(), &IRenderSurface::actionRequested, engine, [engine](uint id, const QString& key) {
        if (engine->invokeAction(id, key) == NotificationStore::ActionResult::Rejected) {
            qCWarning(lcDaemon) << "Surface requested undeclared action" << key << "for notification" << id;
        }
    });
    connect(m_surface.get(), &IRenderSurface::hoverChanged, engine, &NotificationEngine::setHovered);
    connect(m_surface.get(), &IRenderSurface::acknowledgeRequested, engine, &NotificationEngine::acknowledge);
    connect(m_surface.get(), &IRenderSurface::clearAllRequested, engine, &NotificationEngine::clearCenter);
    connect(m_surface.get(), &IRenderSurface::toggleCenterRequested, engine, &NotificationEngine::toggleCenter);
    connect(m_surface.get(), &IRenderSurface::doNotDisturbToggleRequested, engine,
            &NotificationEngine::toggleDoNotDisturb);
}

bool Daemon::registerDBus()
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to session D-Bus - daemon cannot function without D-Bus";
        return false;
    }

    const auto replaceOption = m_replaceExisting ? QDBusConnectionInterface::ReplaceExistingService
                                                 : QDBusConnectionInterface::DontQueueService;

    // Retry D-Bus service registration (with linear backoff)
    const int maxRetries = 3;
    bool serviceRegistered = false;
    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        const QDBusReply<QDBusConnectionInterface::RegisterServiceReply> reply =
            bus.interface()->registerService(QString(DBus::ServiceName), replaceOption,
                                             QDBusConnectionInterface::DontAllowReplacement);
        if (reply.isValid() && reply.value() == QDBusConnectionInterface::ServiceRegistered) {
            serviceRegistered = true;
            break;
        }

        if (reply.isValid()) {
            // Name is owned by another notification daemon - not transient
            qCCritical(lcDaemon) << "D-Bus name" << DBus::ServiceName
                                 << "is owned by another notification daemon (use --replace to take over)";
            return false;
        }

        const QDBusError error = reply.error();
        if (error.type() == QDBusError::ServiceUnknown || error.type() == QDBusError::NoReply) {
            // Transient error - retry
            if (attempt < maxRetries - 1) {
                int delayMs = 1000 * (attempt + 1); // Linear backoff: 1s, 2s, 3s
                qCWarning(lcDaemon) << "Failed to register D-Bus service (attempt" << (attempt + 1) << "/" << maxRetries
                                    << "):" << error.message() << "- retrying in" << delayMs << "ms";
                QThread::msleep(delayMs);
                continue;
            }
        }

        // Non-retryable error or max retries reached
        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName << "Error:" << error.message()
                             << "Type:" << error.type();
        return false;
    }

    if (!serviceRegistered) {
        qCCritical(lcDaemon) << "Failed to register D-Bus service after" << maxRetries << "attempts";
        return false;
    }

    // Register D-Bus objects (no retry needed - service is already registered)
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath
                             << "Error:" << bus.lastError().message();
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    // The control surface is a convenience; the daemon works without it
    if (!bus.registerService(QString(DBus::ControlServiceName))
        || !bus.registerObject(QString(DBus::ControlObjectPath), m_controlObject)) {
        qCWarning(lcDaemon) << "Failed to register control interface" << DBus::ControlServiceName
                            << "Error:" << bus.lastError().message();
    }

    m_registered = true;
    qCInfo(lcDaemon) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }

    m_shortcutManager->registerShortcuts();

    m_running = true;
    Q_EMIT started();
}

void Daemon::stop()
{
    if (m_shortcutManager) {
        m_shortcutManager->unregisterShortcuts();
    }

    // Unregister D-Bus names to prevent late calls during shutdown
    if (m_registered) {
        auto bus = QDBusConnection::sessionBus();
        bus.unregisterObject(QString(DBus::ControlObjectPath));
        bus.unregisterObject(QString(DBus::ObjectPath));
        bus.unregisterService(QString(DBus::ControlServiceName));
        bus.unregisterService(QString(DBus::ServiceName));
        m_registered = false;
    }

    if (!m_running) {
        return;
    }
    m_running = false;
    Q_EMIT stopped();
}

} // namespace XNotid
