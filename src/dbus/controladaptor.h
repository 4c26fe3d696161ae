// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>

namespace XNotid {

class NotificationEngine;

/**
 * @brief D-Bus adaptor for UI control
 *
 * Provides D-Bus interface: org.xnotid.Control at /org/xnotid/Control
 */
class XNOTID_EXPORT ControlAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.xnotid.Control")

public:
    explicit ControlAdaptor(NotificationEngine* engine, QObject* parent = nullptr);
    ~ControlAdaptor() override = default;

public Q_SLOTS:
    void ToggleCenter();

    /**
     * @brief Enable or disable Do-Not-Disturb
     */
    void SetDoNotDisturb(bool enabled);
    void ToggleDoNotDisturb();
    bool DoNotDisturb();

Q_SIGNALS:
    void DoNotDisturbChanged(bool enabled);

private:
    NotificationEngine* m_engine;
};

} // namespace XNotid
