// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotidconfig.h" // Generated from xnotid.kcfg via KConfigXT

#include <QString>

namespace XNotid {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated XNotidConfig class to provide
 * static access to default values. The .kcfg file is the single source of
 * truth for all defaults - this class simply exposes those generated defaults.
 *
 * Usage:
 *   int visible = ConfigDefaults::maxVisible();   // Returns 3 (from .kcfg)
 *   int normal = ConfigDefaults::normalTimeout(); // Returns 10 (seconds)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Popups
    // ═══════════════════════════════════════════════════════════════════════════

    static int monitor() { return instance().defaultMonitorValue(); }
    static QString corner() { return instance().defaultCornerValue(); }
    static int popupWidth() { return instance().defaultWidthValue(); }
    static int maxVisible() { return instance().defaultMaxVisibleValue(); }
    static int spacing() { return instance().defaultSpacingValue(); }
    static int margin() { return instance().defaultMarginValue(); }
    static bool hoverPause() { return instance().defaultHoverPauseValue(); }
    static bool clickToDismiss() { return instance().defaultClickToDismissValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Timeouts (seconds)
    // ═══════════════════════════════════════════════════════════════════════════

    static int lowTimeout() { return instance().defaultLowTimeoutValue(); }
    static int normalTimeout() { return instance().defaultNormalTimeoutValue(); }
    static int criticalTimeout() { return instance().defaultCriticalTimeoutValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Event log
    // ═══════════════════════════════════════════════════════════════════════════

    static bool logEnabled() { return instance().defaultLogEnabledValue(); }
    static QString logPath() { return instance().defaultLogPathValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Shortcuts
    // ═══════════════════════════════════════════════════════════════════════════

    static QString toggleCenterShortcut() { return instance().defaultToggleCenterValue(); }

private:
    // Lazily-initialized singleton instance
    static XNotidConfig& instance()
    {
        static XNotidConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace XNotid
