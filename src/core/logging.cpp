// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace XNotid {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "xnotid.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "xnotid.core.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCard, "xnotid.core.card", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScheduler, "xnotid.core.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(lcAdmission, "xnotid.core.admission", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCenter, "xnotid.core.center", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "xnotid.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "xnotid.daemon.render", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShortcuts, "xnotid.daemon.shortcuts", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "xnotid.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "xnotid.config", QtInfoMsg)

} // namespace XNotid
