// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include "types.h"
#include <QJsonObject>
#include <QString>

namespace XNotid {

/**
 * @brief Append-only JSONL audit trail of notification events
 *
 * One compact JSON object per line. The file is opened in append mode for
 * every write so external rotation is picked up without a restart. Write
 * failures are logged and otherwise ignored; the log is never read back.
 */
class XNOTID_EXPORT EventLog
{
public:
    explicit EventLog(const QString& path);

    QString path() const
    {
        return m_path;
    }

    void logReceived(const Notification& notification);
    void logClosed(const Notification& notification, CloseReason reason);
    void logAction(const Notification& notification, const QString& actionKey);

private:
    QJsonObject baseEvent(const Notification& notification, const QString& event) const;
    void append(const QJsonObject& line);

    QString m_path;
    bool m_directoryReady = false;
};

} // namespace XNotid
