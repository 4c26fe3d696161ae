// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace XNotid {

/**
 * @brief Structural constants for the core module
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and xnotid.kcfg.
 */
namespace Defaults {
constexpr int MaxVisible = 3;
constexpr int LowTimeoutMs = 5000;
constexpr int NormalTimeoutMs = 10000;
constexpr int CriticalTimeoutMs = 0; // Never expires
}

/**
 * @brief Server identity reported by GetServerInformation
 */
namespace ServerInfo {
inline constexpr QLatin1String Name{"xnotid"};
inline constexpr QLatin1String Vendor{"xnotid"};
inline constexpr QLatin1String Version{XNOTID_VERSION_STRING};
inline constexpr QLatin1String SpecVersion{"1.2"};
}

/**
 * @brief Notification hint keys
 *
 * Standard freedesktop hints plus the x- extensions understood by xnotid.
 */
namespace Hints {
inline constexpr QLatin1String Urgency{"urgency"};
inline constexpr QLatin1String Category{"category"};
inline constexpr QLatin1String DesktopEntry{"desktop-entry"};
inline constexpr QLatin1String Transient{"transient"};
inline constexpr QLatin1String Resident{"resident"};
inline constexpr QLatin1String Value{"value"};
inline constexpr QLatin1String ImagePath{"image-path"};
inline constexpr QLatin1String ImagePathLegacy{"image_path"};
inline constexpr QLatin1String Acknowledge{"x-acknowledge"};
}

/**
 * @brief Capability strings advertised through GetCapabilities
 */
namespace Capabilities {
inline constexpr QLatin1String Actions{"actions"};
inline constexpr QLatin1String Body{"body"};
inline constexpr QLatin1String BodyHyperlinks{"body-hyperlinks"};
inline constexpr QLatin1String BodyMarkup{"body-markup"};
inline constexpr QLatin1String IconStatic{"icon-static"};
inline constexpr QLatin1String Persistence{"persistence"};
}

/**
 * @brief JSON keys for the card envelope embedded in a notification body
 */
namespace CardKeys {
inline constexpr QLatin1String Marker{"xnotid_card"};
inline constexpr QLatin1String MarkerVersion{"v1"};
inline constexpr QLatin1String Type{"type"};
inline constexpr QLatin1String Question{"question"};
inline constexpr QLatin1String Choices{"choices"};
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Label{"label"};
inline constexpr QLatin1String AllowOther{"allow_other"};
inline constexpr QLatin1String AllowLabel{"allow_label"};
inline constexpr QLatin1String Selected{"selected"};
inline constexpr QLatin1String Other{"other"};

inline constexpr QLatin1String TypeMultipleChoice{"multiple-choice"};
inline constexpr QLatin1String TypePermission{"permission"};
inline constexpr QLatin1String AllowAction{"allow"};
}

/**
 * @brief JSON keys for event log lines
 */
namespace JsonKeys {
inline constexpr QLatin1String Uuid{"uuid"};
inline constexpr QLatin1String Timestamp{"timestamp"};
inline constexpr QLatin1String Event{"event"};
inline constexpr QLatin1String NotificationId{"notification_id"};
inline constexpr QLatin1String AppName{"app_name"};
inline constexpr QLatin1String AppIcon{"app_icon"};
inline constexpr QLatin1String Summary{"summary"};
inline constexpr QLatin1String Body{"body"};
inline constexpr QLatin1String CreatedAt{"created_at"};
inline constexpr QLatin1String Urgency{"urgency"};
inline constexpr QLatin1String DesktopEntry{"desktop_entry"};
inline constexpr QLatin1String Hints{"hints"};
inline constexpr QLatin1String ActionKey{"action_key"};
}

namespace DBus {
inline constexpr QLatin1String ServiceName{"org.freedesktop.Notifications"};
inline constexpr QLatin1String ObjectPath{"/org/freedesktop/Notifications"};

inline constexpr QLatin1String ControlServiceName{"org.xnotid.Control"};
inline constexpr QLatin1String ControlObjectPath{"/org/xnotid/Control"};

namespace Interface {
inline constexpr QLatin1String Notifications{"org.freedesktop.Notifications"};
inline constexpr QLatin1String Control{"org.xnotid.Control"};
}
}

} // namespace XNotid
