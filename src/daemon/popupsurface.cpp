// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "popupsurface.h"
#include "../core/cardparser.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <QCoreApplication>
#include <QGuiApplication>
#include <QQmlComponent>
#include <QQmlContext>
#include <QQmlEngine>
#include <QQmlProperty>
#include <QQuickWindow>
#include <QScreen>
#include <QUrl>
#include <KLocalizedContext>

#include <LayerShellQt/Window>

namespace XNotid {

namespace {

void writeQmlProperty(QObject* object, const QString& name, const QVariant& value)
{
    if (!object) {
        return;
    }

    QQmlProperty prop(object, name);
    if (prop.isValid()) {
        prop.write(value);
    } else {
        object->setProperty(name.toUtf8().constData(), value);
    }
}

LayerShellQt::Window::Anchors anchorsForCorner(PopupCorner corner)
{
    switch (corner) {
    case PopupCorner::TopLeft:
        return LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorLeft);
    case PopupCorner::BottomLeft:
        return LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorBottom | LayerShellQt::Window::AnchorLeft);
    case PopupCorner::BottomRight:
        return LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorBottom | LayerShellQt::Window::AnchorRight);
    case PopupCorner::TopRight:
        break;
    }
    return LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorRight);
}

// The center panel spans the full height on the same side as the popups
LayerShellQt::Window::Anchors centerAnchorsForCorner(PopupCorner corner)
{
    const bool left = corner == PopupCorner::TopLeft || corner == PopupCorner::BottomLeft;
    return LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorBottom
                                         | (left ? LayerShellQt::Window::AnchorLeft
                                                 : LayerShellQt::Window::AnchorRight));
}

QVariantList actionsToVariant(const QList<NotificationAction>& actions)
{
    QVariantList list;
    for (const NotificationAction& action : actions) {
        // "default" is the implicit click action and gets no button
        if (action.key == QLatin1String("default")) {
            continue;
        }
        list.append(QVariantMap{{QStringLiteral("key"), action.key}, {QStringLiteral("label"), action.label}});
    }
    return list;
}

QVariant cardToVariant(const std::optional<Card>& card)
{
    if (!card) {
        return QVariant();
    }

    QVariantList choices;
    for (const CardChoice& choice : card->choices) {
        choices.append(QVariantMap{{QStringLiteral("id"), choice.id}, {QStringLiteral("label"), choice.label}});
    }

    return QVariantMap{
        {QStringLiteral("kind"), card->isPermission() ? QStringLiteral("permission") : QStringLiteral("multiple-choice")},
        {QStringLiteral("question"), card->question},
        {QStringLiteral("choices"), choices},
        {QStringLiteral("allowOther"), card->allowOther},
        {QStringLiteral("allowLabel"), card->allowLabel},
    };
}

} // namespace

PopupSurface::PopupSurface(ISettings* settings, QObject* parent)
    : IRenderSurface(parent)
    , m_settings(settings)
    , m_engine(std::make_unique<QQmlEngine>()) // No parent - unique_ptr manages lifetime
{
    Q_ASSERT(settings);

    // Set up i18n for QML (makes i18n() available in QML)
    KLocalizedContext* localizedContext = new KLocalizedContext(m_engine.get());
    m_engine->rootContext()->setContextObject(localizedContext);
}

PopupSurface::~PopupSurface()
{
    for (QQuickWindow* window : {m_popupWindow.data(), m_centerWindow.data()}) {
        if (window) {
            window->close();
            window->deleteLater();
        }
    }

    // All deleteLater() calls must complete while the engine is still valid
    QCoreApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
}

QStringList PopupSurface::capabilities() const
{
    return {QString(Capabilities::Actions),        QString(Capabilities::Body),
            QString(Capabilities::BodyHyperlinks), QString(Capabilities::BodyMarkup),
            QString(Capabilities::IconStatic),     QString(Capabilities::Persistence)};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Window management
// ═══════════════════════════════════════════════════════════════════════════════

QQuickWindow* PopupSurface::createQmlWindow(const QUrl& qmlUrl, QScreen* screen, const char* windowType)
{
    if (!screen) {
        qCWarning(lcRender) << "Screen is null for" << windowType;
        return nullptr;
    }

    QQmlComponent component(m_engine.get(), qmlUrl);

    if (component.isError()) {
        qCWarning(lcRender) << "Failed to load" << windowType << "QML:" << component.errors();
        return nullptr;
    }

    if (component.status() != QQmlComponent::Ready) {
        qCWarning(lcRender) << windowType << "QML component not ready, status:" << component.status();
        return nullptr;
    }

    QObject* obj = component.createWithInitialProperties(
        {{QStringLiteral("popupWidth"), m_settings->popupWidth()},
         {QStringLiteral("spacing"), m_settings->spacing()},
         {QStringLiteral("hoverPause"), m_settings->hoverPause()}});
    if (!obj) {
        qCWarning(lcRender) << "Failed to create" << windowType << "window:" << component.errors();
        return nullptr;
    }

    auto* window = qobject_cast<QQuickWindow*>(obj);
    if (!window) {
        qCWarning(lcRender) << "Created object is not a QQuickWindow for" << windowType;
        obj->deleteLater();
        return nullptr;
    }

    // Take C++ ownership so QML's GC doesn't delete the window
    QQmlEngine::setObjectOwnership(window, QQmlEngine::CppOwnership);

    // Set the screen before configuring LayerShellQt
    window->setScreen(screen);

    return window;
}

QScreen* PopupSurface::targetScreen() const
{
    const QList<QScreen*> screens = QGuiApplication::screens();
    const int index = m_settings->monitor();
    if (index >= 0 && index < screens.size()) {
        return screens.at(index);
    }
    qCDebug(lcRender) << "Monitor" << index << "not present, using primary screen";
    return QGuiApplication::primaryScreen();
}

bool PopupSurface::ensurePopupWindow()
{
    if (m_popupWindow) {
        return true;
    }

    QScreen* screen = targetScreen();
    auto* window = createQmlWindow(QUrl(QStringLiteral("qrc:/ui/PopupWindow.qml")), screen, "popup");
    if (!window) {
        return false;
    }

    if (auto* layerWindow = LayerShellQt::Window::get(window)) {
        const int margin = m_settings->margin();
        layerWindow->setLayer(LayerShellQt::Window::LayerOverlay);
        layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityNone);
        layerWindow->setAnchors(anchorsForCorner(m_settings->corner()));
        layerWindow->setMargins(QMargins(margin, margin, margin, margin));
        layerWindow->setExclusiveZone(-1);
        layerWindow->setScope(QStringLiteral("xnotid-popups"));
    }

    connect(window, SIGNAL(activated(int)), this, SLOT(onPopupActivated(int)));
    connect(window, SIGNAL(dismissRequested(int)), this, SLOT(onPopupDismissed(int)));
    connect(window, SIGNAL(actionRequested(int, QString)), this, SLOT(onPopupAction(int, QString)));
    connect(window, SIGNAL(choiceSubmitted(int, QVariant, QString)), this,
            SLOT(onChoiceSubmitted(int, QVariant, QString)));
    connect(window, SIGNAL(hoverChanged(int, bool)), this, SLOT(onPopupHovered(int, bool)));

    m_popupWindow = window;
    return true;
}

bool PopupSurface::ensureCenterWindow()
{
    if (m_centerWindow) {
        return true;
    }

    QScreen* screen = targetScreen();
    auto* window = createQmlWindow(QUrl(QStringLiteral("qrc:/ui/CenterWindow.qml")), screen, "center");
    if (!window) {
        return false;
    }

    if (auto* layerWindow = LayerShellQt::Window::get(window)) {
        const int margin = m_settings->margin();
        layerWindow->setLayer(LayerShellQt::Window::LayerTop);
        layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityOnDemand);
        layerWindow->setAnchors(centerAnchorsForCorner(m_settings->corner()));
        layerWindow->setMargins(QMargins(margin, margin, margin, margin));
        layerWindow->setExclusiveZone(-1);
        layerWindow->setScope(QStringLiteral("xnotid-center"));
    }

    connect(window, SIGNAL(acknowledgeRequested(int)), this, SLOT(onCenterAcknowledge(int)));
    connect(window, SIGNAL(actionRequested(int, QString)), this, SLOT(onPopupAction(int, QString)));
    connect(window, SIGNAL(choiceSubmitted(int, QVariant, QString)), this,
            SLOT(onChoiceSubmitted(int, QVariant, QString)));
    connect(window, SIGNAL(clearAllRequested()), this, SLOT(onCenterClearAll()));
    connect(window, SIGNAL(doNotDisturbToggled()), this, SLOT(onCenterDoNotDisturbToggled()));
    connect(window, SIGNAL(closeRequested()), this, SLOT(onCenterCloseRequested()));

    writeQmlProperty(window, QStringLiteral("doNotDisturb"), m_doNotDisturb);

    m_centerWindow = window;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// IRenderSurface
// ═══════════════════════════════════════════════════════════════════════════════

void PopupSurface::showPopup(const Notification& notification, int slot)
{
    m_popups.insert(slot, notification);
    syncPopups();
}

void PopupSurface::updatePopup(const Notification& notification, int slot)
{
    m_popups.insert(slot, notification);
    syncPopups();
}

void PopupSurface::removePopup(int slot)
{
    if (m_popups.remove(slot) > 0) {
        syncPopups();
    }
}

void PopupSurface::showCenter(const QList<CenterEntry>& entries)
{
    if (!ensureCenterWindow()) {
        return;
    }

    m_centerEntries = entries;
    QVariantList model;
    for (const CenterEntry& entry : entries) {
        model.append(entryToVariant(entry));
    }
    writeQmlProperty(m_centerWindow, QStringLiteral("entries"), model);

    if (!m_centerVisible) {
        m_centerVisible = true;
        m_centerWindow->show();
        syncPopups();
    }
}

void PopupSurface::hideCenter()
{
    if (!m_centerVisible) {
        return;
    }
    m_centerVisible = false;
    if (m_centerWindow) {
        m_centerWindow->hide();
    }
    syncPopups();
}

void PopupSurface::setDoNotDisturb(bool enabled)
{
    m_doNotDisturb = enabled;
    writeQmlProperty(m_centerWindow, QStringLiteral("doNotDisturb"), enabled);
}

void PopupSurface::syncPopups()
{
    if (m_popups.isEmpty() && !m_popupWindow) {
        return;
    }
    if (!ensurePopupWindow()) {
        return;
    }

    QVariantList model;
    for (auto it = m_popups.constBegin(); it != m_popups.constEnd(); ++it) {
        model.append(popupToVariant(it.value(), it.key()));
    }
    writeQmlProperty(m_popupWindow, QStringLiteral("popups"), model);

    const bool shouldShow = !m_popups.isEmpty() && !m_centerVisible;
    if (shouldShow && !m_popupWindow->isVisible()) {
        m_popupWindow->show();
    } else if (!shouldShow && m_popupWindow->isVisible()) {
        m_popupWindow->hide();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Model conversion
// ═══════════════════════════════════════════════════════════════════════════════

QVariantMap PopupSurface::popupToVariant(const Notification& notification, int slot)
{
    return QVariantMap{
        {QStringLiteral("notificationId"), static_cast<int>(notification.id)},
        {QStringLiteral("slot"), slot},
        {QStringLiteral("appName"), notification.appName},
        {QStringLiteral("summary"), notification.summary},
        {QStringLiteral("body"), notification.card ? QString() : notification.body},
        {QStringLiteral("icon"), notification.imagePath},
        {QStringLiteral("urgency"), urgencyToString(notification.urgency)},
        {QStringLiteral("actions"), actionsToVariant(notification.actions)},
        {QStringLiteral("hasDefaultAction"), notification.hasAction(QStringLiteral("default"))},
        {QStringLiteral("card"), cardToVariant(notification.card)},
        {QStringLiteral("acknowledgeToDismiss"), notification.acknowledgeToDismiss},
        {QStringLiteral("progress"), notification.progress},
        {QStringLiteral("cssClass"), notification.hints.value(QStringLiteral("x-css-class")).toString()},
    };
}

QVariantMap PopupSurface::entryToVariant(const CenterEntry& entry)
{
    // Only archived entries are still live and can be acted on
    const bool live = entry.origin == CenterEntry::Origin::Archived;
    bool hasDefaultAction = false;
    for (const NotificationAction& action : entry.actions) {
        hasDefaultAction = hasDefaultAction || action.key == QLatin1String("default");
    }

    return QVariantMap{
        {QStringLiteral("notificationId"), static_cast<int>(entry.id)},
        {QStringLiteral("appName"), entry.appName},
        {QStringLiteral("summary"), entry.summary},
        {QStringLiteral("body"), entry.card ? QString() : entry.body},
        {QStringLiteral("icon"), entry.appIcon},
        {QStringLiteral("urgency"), urgencyToString(entry.urgency)},
        {QStringLiteral("actions"), live ? actionsToVariant(entry.actions) : QVariantList()},
        {QStringLiteral("hasDefaultAction"), live && hasDefaultAction},
        {QStringLiteral("card"), live ? cardToVariant(entry.card) : QVariant()},
        {QStringLiteral("progress"), -1},
        {QStringLiteral("expired"), !live},
        {QStringLiteral("timestamp"), entry.timestamp.toLocalTime()},
    };
}

// ═══════════════════════════════════════════════════════════════════════════════
// QML interaction
// ═══════════════════════════════════════════════════════════════════════════════

void PopupSurface::onPopupActivated(int notificationId)
{
    Q_EMIT activateRequested(static_cast<uint>(notificationId));
}

void PopupSurface::onPopupDismissed(int notificationId)
{
    Q_EMIT dismissRequested(static_cast<uint>(notificationId));
}

void PopupSurface::onPopupAction(int notificationId, const QString& actionKey)
{
    Q_EMIT actionRequested(static_cast<uint>(notificationId), actionKey);
}

void PopupSurface::onChoiceSubmitted(int notificationId, const QVariant& selectedIds, const QString& otherText)
{
    const uint id = static_cast<uint>(notificationId);
    const Card* card = findCard(id);
    if (!card) {
        qCDebug(lcRender) << "Choice submitted for notification" << id << "which is no longer shown";
        return;
    }
    Q_EMIT actionRequested(id, CardParser::buildChoiceResponse(*card, selectedIds.toStringList(), otherText));
}

// Popups first, then live center entries
const Card* PopupSurface::findCard(uint id) const
{
    for (const Notification& shown : m_popups) {
        if (shown.id == id && shown.card) {
            return &*shown.card;
        }
    }
    for (const CenterEntry& entry : m_centerEntries) {
        if (entry.id == id && entry.card && entry.origin == CenterEntry::Origin::Archived) {
            return &*entry.card;
        }
    }
    return nullptr;
}

void PopupSurface::onPopupHovered(int notificationId, bool hovered)
{
    Q_EMIT hoverChanged(static_cast<uint>(notificationId), hovered);
}

void PopupSurface::onCenterAcknowledge(int notificationId)
{
    Q_EMIT acknowledgeRequested(static_cast<uint>(notificationId));
}

void PopupSurface::onCenterClearAll()
{
    Q_EMIT clearAllRequested();
}

void PopupSurface::onCenterDoNotDisturbToggled()
{
    Q_EMIT doNotDisturbToggleRequested();
}

void PopupSurface::onCenterCloseRequested()
{
    Q_EMIT toggleCenterRequested();
}

} // namespace XNotid
