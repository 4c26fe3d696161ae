// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dbusvariantutils.h"
#include "logging.h"

#include <QDBusArgument>
#include <QDBusVariant>

namespace XNotid {
namespace DBusVariantUtils {

namespace {

QVariantList convertList(const QVariantList& list)
{
    QVariantList result;
    result.reserve(list.size());
    for (const QVariant& item : list) {
        result.append(convertDbusArgument(item));
    }
    return result;
}

QVariantMap convertMap(const QVariantMap& map)
{
    QVariantMap result;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        result.insert(it.key(), convertDbusArgument(it.value()));
    }
    return result;
}

} // namespace

QVariant convertDbusArgument(const QVariant& value)
{
    if (value.typeId() == qMetaTypeId<QDBusVariant>()) {
        return convertDbusArgument(value.value<QDBusVariant>().variant());
    }

    if (value.typeId() == qMetaTypeId<QDBusArgument>()) {
        const QDBusArgument arg = value.value<QDBusArgument>();
        switch (arg.currentType()) {
        case QDBusArgument::MapType: {
            QVariantMap map;
            arg >> map;
            return convertMap(map);
        }
        case QDBusArgument::ArrayType:
        case QDBusArgument::StructureType: {
            QVariantList list;
            arg >> list;
            return convertList(list);
        }
        case QDBusArgument::BasicType:
        case QDBusArgument::VariantType: {
            QVariant extracted;
            arg >> extracted;
            return extracted;
        }
        default:
            qCWarning(lcDbus) << "Unhandled QDBusArgument type:" << arg.currentType();
            return QVariant();
        }
    }

    if (value.typeId() == QMetaType::QVariantList) {
        return convertList(value.toList());
    }
    if (value.typeId() == QMetaType::QVariantMap) {
        return convertMap(value.toMap());
    }

    return value;
}

QVariantMap normalizeHints(const QVariantMap& hints)
{
    static const QStringList pixelHints{QStringLiteral("image-data"), QStringLiteral("image_data"),
                                        QStringLiteral("icon_data")};

    QVariantMap result;
    for (auto it = hints.constBegin(); it != hints.constEnd(); ++it) {
        if (pixelHints.contains(it.key())) {
            qCDebug(lcDbus) << "Dropping pixel data hint" << it.key();
            continue;
        }
        result.insert(it.key(), convertDbusArgument(it.value()));
    }
    return result;
}

} // namespace DBusVariantUtils
} // namespace XNotid
