// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace XNotid {

/**
 * @brief Global settings for xnotid
 *
 * Implements the ISettings interface with KConfig integration. Values are
 * read from xnotidrc with defaults from xnotid.kcfg; out-of-range values
 * fall back to the default with a warning. The engine only ever sees the
 * immutable engineConfig() snapshot taken at startup.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class XNOTID_EXPORT Settings : public ISettings
{
    Q_OBJECT

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // ISettings
    int monitor() const override
    {
        return m_monitor;
    }
    PopupCorner corner() const override
    {
        return m_corner;
    }
    int popupWidth() const override
    {
        return m_popupWidth;
    }
    int maxVisible() const override
    {
        return m_maxVisible;
    }
    int spacing() const override
    {
        return m_spacing;
    }
    int margin() const override
    {
        return m_margin;
    }
    bool hoverPause() const override
    {
        return m_hoverPause;
    }
    bool clickToDismiss() const override
    {
        return m_clickToDismiss;
    }

    int lowTimeout() const override
    {
        return m_lowTimeout;
    }
    int normalTimeout() const override
    {
        return m_normalTimeout;
    }
    int criticalTimeout() const override
    {
        return m_criticalTimeout;
    }

    bool logEnabled() const override
    {
        return m_logEnabled;
    }
    QString logPath() const override
    {
        return m_logPath;
    }

    QString toggleCenterShortcut() const override
    {
        return m_toggleCenterShortcut;
    }

    EngineConfig engineConfig() const override;

    /**
     * @brief Load from the user's xnotidrc
     */
    void load() override;

    /**
     * @brief Load from an explicit config object (used by tests)
     */
    void load(const KSharedConfigPtr& config);

    static PopupCorner cornerFromString(const QString& corner, bool* ok = nullptr);
    static QString cornerToString(PopupCorner corner);

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);

    // Popups
    int m_monitor = 0;
    PopupCorner m_corner = PopupCorner::TopRight;
    int m_popupWidth = 400;
    int m_maxVisible = Defaults::MaxVisible;
    int m_spacing = 8;
    int m_margin = 12;
    bool m_hoverPause = true;
    bool m_clickToDismiss = true;

    // Timeouts (seconds)
    int m_lowTimeout = Defaults::LowTimeoutMs / 1000;
    int m_normalTimeout = Defaults::NormalTimeoutMs / 1000;
    int m_criticalTimeout = Defaults::CriticalTimeoutMs / 1000;

    // Event log
    bool m_logEnabled = true;
    QString m_logPath;

    // Shortcuts
    QString m_toggleCenterShortcut;
};

} // namespace XNotid
