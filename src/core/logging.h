// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for xnotid
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcStore) << "Debug message";
 *   qCWarning(lcCard) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="xnotid.*=true"                  # Enable all
 *   QT_LOGGING_RULES="xnotid.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="xnotid.dbus=true"               # Enable D-Bus only
 *   QT_LOGGING_RULES="xnotid.core.scheduler=true"     # Enable timeout tracing only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, disabled in release builds
 *   qCInfo     - Significant operational events (startup, shutdown, bus name acquired)
 *   qCWarning  - Recoverable errors, invalid input, missing resources
 *   qCCritical - System failures preventing normal operation
 */

namespace XNotid {

// Core module - store, cards, timeouts, admission, center
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStore)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCard)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcScheduler)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcAdmission)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCenter)

// Daemon module - bootstrap, popup rendering, shortcuts
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRender)
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)

// D-Bus module - notification and control adaptors
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading
XNOTID_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace XNotid
