// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace XNotid {

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:
        return QStringLiteral("low");
    case Urgency::Critical:
        return QStringLiteral("critical");
    case Urgency::Normal:
        break;
    }
    return QStringLiteral("normal");
}

QString closeReasonToString(CloseReason reason)
{
    switch (reason) {
    case CloseReason::Expired:
        return QStringLiteral("expired");
    case CloseReason::Dismissed:
        return QStringLiteral("dismissed");
    case CloseReason::ClosedByRequest:
        return QStringLiteral("closed");
    case CloseReason::Undefined:
        break;
    }
    return QStringLiteral("undefined");
}

QString stateToString(NotificationState state)
{
    switch (state) {
    case NotificationState::Queued:
        return QStringLiteral("queued");
    case NotificationState::Visible:
        return QStringLiteral("visible");
    case NotificationState::Archived:
        return QStringLiteral("archived");
    case NotificationState::Expired:
        return QStringLiteral("expired");
    case NotificationState::Dismissed:
        return QStringLiteral("dismissed");
    case NotificationState::ActionTaken:
        return QStringLiteral("action-taken");
    case NotificationState::Closed:
        return QStringLiteral("closed");
    }
    return QString();
}

} // namespace XNotid
