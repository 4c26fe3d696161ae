// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "shortcutmanager.h"
#include "../config/configdefaults.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include <QKeySequence>
#include <KGlobalAccel>
#include <KLocalizedString>

namespace XNotid {

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Macros
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Setup a global shortcut action
 * @param actionMember Pointer to QAction* member variable
 * @param i18nName Translatable display name for the action
 * @param objectName QStringLiteral object name for KGlobalAccel
 * @param getterName Method name (must exist on both ConfigDefaults and ISettings)
 * @param signal Signal emitted when the action triggers
 *
 * Uses ConfigDefaults::getterName() for setDefaultShortcut so System Settings
 * shows the true app default when resetting. Uses m_settings->getterName() for
 * the actual shortcut (user's config or default).
 */
#define SETUP_SHORTCUT(actionMember, i18nName, objectName, getterName, signal) \
    do { \
        if (!actionMember) { \
            actionMember = new QAction(i18n(i18nName), this); \
            actionMember->setObjectName(QStringLiteral(objectName)); \
            const QKeySequence defaultShortcut(ConfigDefaults::getterName()); \
            const QKeySequence shortcut(m_settings->getterName()); \
            KGlobalAccel::self()->setDefaultShortcut(actionMember, {defaultShortcut}); \
            KGlobalAccel::setGlobalShortcut(actionMember, shortcut); \
            connect(actionMember, &QAction::triggered, this, signal); \
        } \
    } while (0)

ShortcutManager::ShortcutManager(ISettings* settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    Q_ASSERT(settings);
}

ShortcutManager::~ShortcutManager()
{
    unregisterShortcuts();
}

void ShortcutManager::registerShortcuts()
{
    SETUP_SHORTCUT(m_toggleCenterAction, "Toggle Notification Center", "toggle_center", toggleCenterShortcut,
                   &ShortcutManager::toggleCenterRequested);
    qCInfo(lcShortcuts) << "Toggle center shortcut:" << m_settings->toggleCenterShortcut();
}

void ShortcutManager::unregisterShortcuts()
{
    // KGlobalAccel unregisters an action when it is deleted; delete synchronously
    // so the unregistration happens before the D-Bus connection goes away
    delete m_toggleCenterAction;
    m_toggleCenterAction = nullptr;
}

} // namespace XNotid
