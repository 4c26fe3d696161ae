// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "xnotid_export.h"
#include <QVariant>
#include <QVariantMap>

namespace XNotid {

/**
 * @brief D-Bus variant conversion utilities
 *
 * Hint values that are containers arrive wrapped in read-only QDBusArgument
 * objects. Neither QML nor QJsonValue can use those, so hints are unwrapped
 * into plain QVariants before they reach the store.
 */
namespace DBusVariantUtils {

/**
 * @brief Recursively convert QDBusArgument values to plain QVariant types
 *
 * Maps become QVariantMap, arrays and structures become QVariantList.
 * Plain types pass through unchanged.
 */
XNOTID_EXPORT QVariant convertDbusArgument(const QVariant& value);

/**
 * @brief Unwrap every hint value and drop raw pixel data hints
 *
 * "image-data", "image_data" and "icon_data" carry (iiibiiay) pixel buffers
 * which xnotid does not render.
 */
XNOTID_EXPORT QVariantMap normalizeHints(const QVariantMap& hints);

} // namespace DBusVariantUtils

} // namespace XNotid
