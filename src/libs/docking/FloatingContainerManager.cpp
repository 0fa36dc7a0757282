// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/FloatingContainerManager.hpp"

#include "docking/DockLayout.hpp"
#include "docking/WidgetRegistry.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QLoggingCategory>

Q_LOGGING_CATEGORY(floatinglog, "docking.floating")

namespace Docking {

FloatingContainerManager::FloatingContainerManager(DockLayout& layout)
    : m_layout(layout)
{}

DockResult FloatingContainerManager::checkFloating(ContainerId container) const
{
    const ContainerRecord* rec = m_layout.container(container);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(container.toString()));
    if (!rec->floating) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Container %1 is not floating.").arg(container.toString()));
    }
    return DockResult::success();
}

DockResult FloatingContainerManager::detach(NodeId area, const QPoint& screenPos, const QSize& size, ContainerId* out)
{
    const AreaNode* a = m_layout.area(area);
    if (!a)
        return DockResult::failure(DockError::NotFound, QStringLiteral("No dock area #%1.").arg(area.toString()));

    for (const QString& id : a->widgetIds) {
        const DockWidget* w = m_layout.registry().widget(id);
        if (w && !w->isFloatable()) {
            qCWarning(floatinglog) << "Refusing to float area" << area.toString() << "holding" << id;
            return DockResult::failure(DockError::InvalidTarget,
                                       QStringLiteral("Dock widget '%1' is not floatable.").arg(id));
        }
    }

    const QRect geometry(screenPos, size);
    const ContainerId source = m_layout.containerOf(area);
    const ContainerRecord* rec = m_layout.container(source);

    // Already the whole of a floating window: just move the window.
    if (rec && rec->floating && rec->root == area) {
        if (out)
            *out = source;
        return m_layout.setContainerGeometry(source, geometry);
    }

    const ContainerId created = m_layout.createFloatingContainer(geometry);
    const DockResult r = m_layout.moveArea(area, created, NodeId{}, DropZone::Center);
    if (!r) {
        const DockResult cleanup = m_layout.destroyContainer(created);
        if (!cleanup)
            qCWarning(floatinglog).noquote() << cleanup.message();
        return r;
    }

    qCDebug(floatinglog) << "Detached area" << area.toString() << "into container" << created.toString();
    if (out)
        *out = created;
    return DockResult::success();
}

DockResult FloatingContainerManager::floatWidget(const QString& widgetId,
                                                 const QPoint& screenPos,
                                                 const QSize& size,
                                                 ContainerId* out)
{
    const DockWidget* w = m_layout.registry().widget(widgetId);
    if (!w)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(widgetId));
    if (!w->isFloatable())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("Dock widget '%1' is not floatable.").arg(widgetId));

    const QRect geometry(screenPos, size);
    const WidgetRegistry::Location loc = m_layout.registry().location(widgetId);
    if (loc.isDocked()) {
        const ContainerRecord* rec = m_layout.container(loc.container);
        const AreaNode* a = m_layout.area(loc.area);
        if (rec && rec->floating && rec->root == loc.area && a->widgetIds.size() == 1) {
            if (out)
                *out = loc.container;
            return m_layout.setContainerGeometry(loc.container, geometry);
        }
    }

    const ContainerId created = m_layout.createFloatingContainer(geometry);
    const DockResult r = m_layout.addWidgetToContainer(widgetId, created, DockSide::Right);
    if (!r) {
        const DockResult cleanup = m_layout.destroyContainer(created);
        if (!cleanup)
            qCWarning(floatinglog).noquote() << cleanup.message();
        return r;
    }

    qCDebug(floatinglog) << "Floated widget" << widgetId << "into container" << created.toString();
    if (out)
        *out = created;
    return DockResult::success();
}

DockResult FloatingContainerManager::reattach(ContainerId container, NodeId targetArea, DropZone zone, int tabIndex)
{
    const ContainerId destination = targetArea.isValid() ? m_layout.containerOf(targetArea) : m_layout.mainContainer();
    if (destination.isNull())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area #%1.").arg(targetArea.toString()));
    return reattachToContainer(container, destination, targetArea, zone, tabIndex);
}

DockResult FloatingContainerManager::reattachToContainer(ContainerId container,
                                                         ContainerId destination,
                                                         NodeId targetArea,
                                                         DropZone zone,
                                                         int tabIndex)
{
    UTILS_TRY(checkFloating(container));

    const DockResult r = m_layout.mergeContainer(container, destination, targetArea, zone, tabIndex);
    if (!r) {
        qCWarning(floatinglog).noquote() << "Reattach failed:" << r.message();
        return r;
    }

    qCDebug(floatinglog) << "Reattached container" << container.toString() << "into" << destination.toString();
    return r;
}

DockResult FloatingContainerManager::destroyContainer(ContainerId container)
{
    UTILS_TRY(checkFloating(container));
    return m_layout.destroyContainer(container);
}

DockResult FloatingContainerManager::setGeometry(ContainerId container, const QRect& geometry)
{
    UTILS_TRY(checkFloating(container));
    return m_layout.setContainerGeometry(container, geometry);
}

DockResult FloatingContainerManager::show(ContainerId container)
{
    UTILS_TRY(checkFloating(container));
    return m_layout.setContainerVisibility(container, ContainerVisibility::Shown);
}

DockResult FloatingContainerManager::hide(ContainerId container)
{
    UTILS_TRY(checkFloating(container));
    return m_layout.setContainerVisibility(container, ContainerVisibility::Hidden);
}

DockResult FloatingContainerManager::close(ContainerId container)
{
    UTILS_TRY(checkFloating(container));

    const QStringList ids = m_layout.widgetsIn(container);
    for (const QString& id : ids) {
        const DockWidget* w = m_layout.registry().widget(id);
        if (w && !w->isClosable()) {
            return DockResult::failure(DockError::InvalidTarget,
                                       QStringLiteral("Dock widget '%1' is not closable.").arg(id));
        }
    }

    UTILS_TRY(m_layout.closeContainer(container));
    qCDebug(floatinglog) << "Closed container" << container.toString();
    return DockResult::success();
}

DockResult FloatingContainerManager::raise(ContainerId container)
{
    UTILS_TRY(checkFloating(container));
    return m_layout.raiseContainer(container);
}

QVector<ContainerId> FloatingContainerManager::containers() const
{
    return m_layout.floatingContainerIds();
}

ContainerId FloatingContainerManager::containerAt(const QPointF& pos) const
{
    for (ContainerId id : m_layout.containersFrontToBack()) {
        const ContainerRecord* rec = m_layout.container(id);
        if (rec && rec->visibility == ContainerVisibility::Shown && QRectF(rec->geometry).contains(pos))
            return id;
    }
    return {};
}

} // namespace Docking
