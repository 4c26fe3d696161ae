// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "controladaptor.h"
#include "../core/logging.h"
#include "../core/notificationengine.h"

namespace XNotid {

ControlAdaptor::ControlAdaptor(NotificationEngine* engine, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_engine(engine)
{
    Q_ASSERT(engine);

    connect(engine, &NotificationEngine::doNotDisturbChanged, this, &ControlAdaptor::DoNotDisturbChanged);
}

void ControlAdaptor::ToggleCenter()
{
    m_engine->toggleCenter();
    qCDebug(lcDbus) << "Center toggled, visible:" << m_engine->isCenterVisible();
}

void ControlAdaptor::SetDoNotDisturb(bool enabled)
{
    m_engine->setDoNotDisturb(enabled);
}

void ControlAdaptor::ToggleDoNotDisturb()
{
    m_engine->toggleDoNotDisturb();
}

bool ControlAdaptor::DoNotDisturb()
{
    return m_engine->isDoNotDisturb();
}

} // namespace XNotid
