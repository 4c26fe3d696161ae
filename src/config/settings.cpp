// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <QDir>
#include <climits> // For INT_MAX in readValidatedInt

namespace XNotid {

Settings::Settings(QObject* parent)
    : ISettings(parent)
    , m_logPath(ConfigDefaults::logPath())
    , m_toggleCenterShortcut(ConfigDefaults::toggleCenterShortcut())
{
}

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

PopupCorner Settings::cornerFromString(const QString& corner, bool* ok)
{
    const QString normalized = corner.trimmed().toLower();
    if (ok) {
        *ok = true;
    }
    if (normalized == QLatin1String("top-left")) {
        return PopupCorner::TopLeft;
    }
    if (normalized == QLatin1String("top-right")) {
        return PopupCorner::TopRight;
    }
    if (normalized == QLatin1String("bottom-left")) {
        return PopupCorner::BottomLeft;
    }
    if (normalized == QLatin1String("bottom-right")) {
        return PopupCorner::BottomRight;
    }
    if (ok) {
        *ok = false;
    }
    return PopupCorner::TopRight;
}

QString Settings::cornerToString(PopupCorner corner)
{
    switch (corner) {
    case PopupCorner::TopLeft:
        return QStringLiteral("top-left");
    case PopupCorner::BottomLeft:
        return QStringLiteral("bottom-left");
    case PopupCorner::BottomRight:
        return QStringLiteral("bottom-right");
    case PopupCorner::TopRight:
        break;
    }
    return QStringLiteral("top-right");
}

EngineConfig Settings::engineConfig() const
{
    EngineConfig config;
    config.maxVisible = m_maxVisible;
    config.lowTimeoutMs = m_lowTimeout * 1000;
    config.normalTimeoutMs = m_normalTimeout * 1000;
    config.criticalTimeoutMs = m_criticalTimeout * 1000;
    config.clickToDismiss = m_clickToDismiss;
    return config;
}

void Settings::load()
{
    auto config = KSharedConfig::openConfig(QStringLiteral("xnotidrc"));

    // KSharedConfig caches in memory; make sure we see what is on disk
    config->reparseConfiguration();
    load(config);
}

void Settings::load(const KSharedConfigPtr& config)
{
    const KConfigGroup popups = config->group(QStringLiteral("Popups"));
    const KConfigGroup timeouts = config->group(QStringLiteral("Timeouts"));
    const KConfigGroup log = config->group(QStringLiteral("Log"));
    const KConfigGroup shortcuts = config->group(QStringLiteral("Shortcuts"));

    // Popups
    m_monitor = readValidatedInt(popups, "Monitor", ConfigDefaults::monitor(), 0, INT_MAX, "monitor index");

    const QString corner = popups.readEntry(QLatin1String("Corner"), ConfigDefaults::corner());
    bool cornerOk = false;
    m_corner = cornerFromString(corner, &cornerOk);
    if (!cornerOk) {
        qCWarning(lcConfig) << "Invalid popup corner:" << corner << "using default" << ConfigDefaults::corner();
        m_corner = cornerFromString(ConfigDefaults::corner());
    }

    m_popupWidth = readValidatedInt(popups, "Width", ConfigDefaults::popupWidth(), 100, 2000, "popup width");
    m_maxVisible = readValidatedInt(popups, "MaxVisible", ConfigDefaults::maxVisible(), 1, 20, "max visible popups");
    m_spacing = readValidatedInt(popups, "Spacing", ConfigDefaults::spacing(), 0, 200, "popup spacing");
    m_margin = readValidatedInt(popups, "Margin", ConfigDefaults::margin(), 0, 500, "popup margin");
    m_hoverPause = popups.readEntry(QLatin1String("HoverPause"), ConfigDefaults::hoverPause());
    m_clickToDismiss = popups.readEntry(QLatin1String("ClickToDismiss"), ConfigDefaults::clickToDismiss());

    // Timeouts (seconds, 0 = never)
    m_lowTimeout = readValidatedInt(timeouts, "Low", ConfigDefaults::lowTimeout(), 0, 86400, "low timeout");
    m_normalTimeout = readValidatedInt(timeouts, "Normal", ConfigDefaults::normalTimeout(), 0, 86400, "normal timeout");
    m_criticalTimeout =
        readValidatedInt(timeouts, "Critical", ConfigDefaults::criticalTimeout(), 0, 86400, "critical timeout");

    // Event log
    m_logEnabled = log.readEntry(QLatin1String("Enabled"), ConfigDefaults::logEnabled());
    QString logPath = log.readEntry(QLatin1String("Path"), ConfigDefaults::logPath()).trimmed();
    if (logPath.startsWith(QLatin1String("~/"))) {
        logPath = QDir::homePath() + logPath.mid(1);
    }
    m_logPath = logPath.isEmpty() ? ConfigDefaults::logPath() : logPath;

    // Shortcuts
    m_toggleCenterShortcut = shortcuts.readEntry(QLatin1String("ToggleCenter"), ConfigDefaults::toggleCenterShortcut());

    qCDebug(lcConfig) << "Settings loaded: maxVisible" << m_maxVisible << "corner" << cornerToString(m_corner)
                      << "timeouts" << m_lowTimeout << m_normalTimeout << m_criticalTimeout;
    Q_EMIT settingsChanged();
}

} // namespace XNotid
