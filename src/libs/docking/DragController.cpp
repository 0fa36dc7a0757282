// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DragController.hpp"

#include "docking/DockConfig.hpp"
#include "docking/DockLayout.hpp"
#include "docking/FloatingContainerManager.hpp"
#include "docking/WidgetRegistry.hpp"

#include <QtCore/QLoggingCategory>

Q_LOGGING_CATEGORY(draglog, "docking.drag")

namespace Docking {

DragController::DragController(DockLayout& layout,
                               FloatingContainerManager& floating,
                               const DockConfig& config,
                               QObject* parent)
    : QObject(parent)
    , m_layout(layout)
    , m_floating(floating)
    , m_config(config)
{}

DockResult DragController::validateItem(const DragItem& item) const
{
    const WidgetRegistry& registry = m_layout.registry();

    switch (item.kind) {
        case DragItem::Kind::Widget: {
            const DockWidget* w = registry.widget(item.widgetId);
            if (!w) {
                return DockResult::failure(DockError::NotFound,
                                           QStringLiteral("Dock widget not registered: '%1'.").arg(item.widgetId));
            }
            if (!registry.location(item.widgetId).isDocked()) {
                return DockResult::failure(DockError::NotFound,
                                           QStringLiteral("Dock widget '%1' is not docked.").arg(item.widgetId));
            }
            if (!w->isMovable()) {
                return DockResult::failure(DockError::InvalidTarget,
                                           QStringLiteral("Dock widget '%1' is not movable.").arg(item.widgetId));
            }
            return DockResult::success();
        }
        case DragItem::Kind::Area: {
            const AreaNode* a = m_layout.area(item.area);
            if (!a) {
                return DockResult::failure(DockError::NotFound,
                                           QStringLiteral("No dock area #%1.").arg(item.area.toString()));
            }
            for (const QString& id : a->widgetIds) {
                const DockWidget* w = registry.widget(id);
                if (w && !w->isMovable()) {
                    return DockResult::failure(DockError::InvalidTarget,
                                               QStringLiteral("Dock widget '%1' is not movable.").arg(id));
                }
            }
            return DockResult::success();
        }
        case DragItem::Kind::Container: {
            const ContainerRecord* rec = m_layout.container(item.container);
            if (!rec) {
                return DockResult::failure(DockError::NotFound,
                                           QStringLiteral("Container not found: %1").arg(item.container.toString()));
            }
            if (!rec->floating) {
                return DockResult::failure(DockError::InvalidTarget,
                                           QStringLiteral("The main container cannot be dragged."));
            }
            return DockResult::success();
        }
    }
    return DockResult::success();
}

DockResult DragController::dragStart(const DragItem& item, const QPointF& pos)
{
    if (m_state == State::Dragging)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("A drag is already in progress."));

    const DockResult valid = validateItem(item);
    if (!valid) {
        qCWarning(draglog).noquote() << "Drag refused:" << valid.message();
        return valid;
    }

    m_state = State::Dragging;
    m_item = item;
    m_lastPlan.reset();
    m_lastPos = pos;
    emit dragStateChanged(true);
    return DockResult::success();
}

std::optional<DropPlan> DragController::dragMove(const QPointF& pos)
{
    if (m_state != State::Dragging)
        return std::nullopt;

    m_lastPos = pos;
    const std::optional<DropPlan> plan = resolveDrop(m_layout, pos, m_item, m_config);
    if (plan == m_lastPlan)
        return plan;

    m_lastPlan = plan;
    if (plan)
        emit dropPlanChanged(*plan);
    else
        emit dropPlanCleared();
    return plan;
}

DockResult DragController::dragRelease()
{
    if (m_state != State::Dragging)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No drag in progress."));

    const DragItem item = m_item;
    const std::optional<DropPlan> plan = m_lastPlan;
    const QPointF pos = m_lastPos;
    reset();

    // The layout may have changed since the last move.
    const DockResult valid = validateItem(item);
    if (!valid)
        return valid;

    const DockResult r = plan ? commit(item, *plan) : floatItem(item, pos);
    if (!r)
        qCWarning(draglog).noquote() << "Drop failed:" << r.message();
    return r;
}

void DragController::dragCancel()
{
    if (m_state != State::Dragging)
        return;
    reset();
}

void DragController::reset()
{
    const bool hadPlan = m_lastPlan.has_value();
    m_state = State::Idle;
    m_item = DragItem{};
    m_lastPlan.reset();
    if (hadPlan)
        emit dropPlanCleared();
    emit dragStateChanged(false);
}

DockResult DragController::commit(const DragItem& item, const DropPlan& plan)
{
    qCDebug(draglog).noquote() << "Committing" << describe(plan);

    const std::optional<DockSide> side = sideForZone(plan.zone);

    switch (item.kind) {
        case DragItem::Kind::Widget:
            switch (plan.kind) {
                case DropPlan::Kind::TabInsert:
                    return m_layout.insertWidget(item.widgetId, plan.targetArea, plan.tabIndex);
                case DropPlan::Kind::SplitArea:
                    return m_layout.splitArea(plan.targetArea, item.widgetId, side.value_or(DockSide::Right));
                case DropPlan::Kind::SplitContainer:
                case DropPlan::Kind::SetRoot:
                    return m_layout.addWidgetToContainer(item.widgetId, plan.container, side.value_or(DockSide::Right));
            }
            break;
        case DragItem::Kind::Area:
            return m_layout.moveArea(item.area, plan.container, plan.targetArea, plan.zone, plan.tabIndex);
        case DragItem::Kind::Container:
            return m_floating.reattachToContainer(item.container, plan.container, plan.targetArea, plan.zone,
                                                  plan.tabIndex);
    }
    return DockResult::success();
}

DockResult DragController::floatItem(const DragItem& item, const QPointF& pos)
{
    const QPoint topLeft = pos.toPoint();

    switch (item.kind) {
        case DragItem::Kind::Widget:
            return m_floating.floatWidget(item.widgetId, topLeft, m_config.defaultFloatingSize);
        case DragItem::Kind::Area:
            return m_floating.detach(item.area, topLeft, m_config.defaultFloatingSize);
        case DragItem::Kind::Container: {
            const ContainerRecord* rec = m_layout.container(item.container);
            const QSize size = rec ? rec->geometry.size() : m_config.defaultFloatingSize;
            return m_floating.setGeometry(item.container, QRect(topLeft, size));
        }
    }
    return DockResult::success();
}

} // namespace Docking
