// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DropTargetResolver.hpp"

#include "docking/DockConfig.hpp"
#include "docking/DockLayout.hpp"
#include "docking/WidgetRegistry.hpp"

#include <QtCore/QLoggingCategory>

Q_LOGGING_CATEGORY(droplog, "docking.drop")

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

bool isShown(const ContainerRecord& rec)
{
    return rec.visibility == ContainerVisibility::Shown;
}

// True when dropping the item into the container edge would leave the
// layout as it is.
bool isSoleOccupant(const DockLayout& layout, const DragItem& item, ContainerId containerId)
{
    const NodeId root = layout.rootOf(containerId);
    if (item.kind == DragItem::Kind::Area)
        return root == item.area;

    if (item.kind == DragItem::Kind::Widget) {
        const AreaNode* a = layout.area(root);
        return a && a->widgetIds.size() == 1 && a->widgetIds.first() == item.widgetId;
    }
    return false;
}

std::optional<DropPlan> containerPlan(const DockLayout& layout,
                                      const DragItem& item,
                                      const ContainerRecord& rec,
                                      const QRectF& rect,
                                      DropZone zone,
                                      const DockConfig& config)
{
    if (zone == DropZone::None || !config.isZoneAllowed(zone))
        return std::nullopt;
    if (isSoleOccupant(layout, item, rec.id))
        return std::nullopt;

    DropPlan plan;
    plan.kind = DropPlan::Kind::SplitContainer;
    plan.container = rec.id;
    plan.zone = zone;
    plan.previewRect = previewRect(rect, zone);
    return plan;
}

NodeId areaUnder(const DockLayout& layout, ContainerId containerId, const QPointF& pos)
{
    for (NodeId id : layout.areas(containerId)) {
        const LayoutNode* n = layout.node(id);
        if (n && n->geometry.contains(pos))
            return id;
    }
    return {};
}

} // namespace

DropZone classifyZone(const QRectF& rect, const QPointF& pos, double edgeFraction)
{
    if (rect.isEmpty() || !rect.contains(pos))
        return DropZone::None;

    const double left = (pos.x() - rect.left()) / rect.width();
    const double right = (rect.right() - pos.x()) / rect.width();
    const double top = (pos.y() - rect.top()) / rect.height();
    const double bottom = (rect.bottom() - pos.y()) / rect.height();

    DropZone zone = DropZone::Left;
    double best = left;
    if (right < best) {
        best = right;
        zone = DropZone::Right;
    }
    if (top < best) {
        best = top;
        zone = DropZone::Top;
    }
    if (bottom < best) {
        best = bottom;
        zone = DropZone::Bottom;
    }

    return best < edgeFraction ? zone : DropZone::Center;
}

int tabInsertIndex(const AreaNode& area, const QPointF& pos)
{
    for (int i = 0; i < area.tabGeometries.size(); ++i) {
        if (area.tabGeometries.at(i).center().x() > pos.x())
            return i;
    }
    return int(area.widgetIds.size());
}

QRectF previewRect(const QRectF& rect, DropZone zone)
{
    const double halfW = rect.width() / 2.0;
    const double halfH = rect.height() / 2.0;

    switch (zone) {
        case DropZone::Left: return QRectF(rect.x(), rect.y(), halfW, rect.height());
        case DropZone::Right: return QRectF(rect.x() + halfW, rect.y(), halfW, rect.height());
        case DropZone::Top: return QRectF(rect.x(), rect.y(), rect.width(), halfH);
        case DropZone::Bottom: return QRectF(rect.x(), rect.y() + halfH, rect.width(), halfH);
        default: return rect;
    }
}

std::optional<DropPlan> resolveDrop(const DockLayout& layout,
                                    const QPointF& pos,
                                    const DragItem& item,
                                    const DockConfig& config)
{
    const ContainerRecord* target = nullptr;
    for (ContainerId id : layout.containersFrontToBack()) {
        if (item.kind == DragItem::Kind::Container && id == item.container)
            continue;
        const ContainerRecord* rec = layout.container(id);
        if (rec && isShown(*rec) && QRectF(rec->geometry).contains(pos)) {
            target = rec;
            break;
        }
    }
    if (!target)
        return std::nullopt;

    const QRectF containerRect(target->geometry);

    if (target->isEmpty()) {
        DropPlan plan;
        plan.kind = DropPlan::Kind::SetRoot;
        plan.container = target->id;
        plan.zone = DropZone::Center;
        plan.previewRect = containerRect;
        return plan;
    }

    const NodeId areaId = areaUnder(layout, target->id, pos);
    const AreaNode* a = layout.area(areaId);

    if (item.kind == DragItem::Kind::Area && item.area == areaId)
        return std::nullopt;
    if (a && item.kind == DragItem::Kind::Widget && layout.areaOf(item.widgetId) == areaId && a->widgetIds.size() == 1)
        return std::nullopt;

    // A tab strip hit always inserts, even inside the container band.
    if (a && a->tabBarGeometry.contains(pos)) {
        if (!config.isZoneAllowed(DropZone::Center))
            return std::nullopt;

        DropPlan plan;
        plan.kind = DropPlan::Kind::TabInsert;
        plan.container = target->id;
        plan.targetArea = areaId;
        plan.zone = DropZone::Center;
        plan.tabIndex = tabInsertIndex(*a, pos);
        plan.previewRect = layout.node(areaId)->geometry;
        qCDebug(droplog).noquote() << "Resolved" << describe(plan);
        return plan;
    }

    // Outer band of the container wins over the area beneath it.
    const DropZone outerZone = classifyZone(containerRect, pos, config.containerEdgeFraction);
    if (outerZone != DropZone::Center && outerZone != DropZone::None)
        return containerPlan(layout, item, *target, containerRect, outerZone, config);

    if (!a)
        return containerPlan(layout, item, *target, containerRect, classifyZone(containerRect, pos, 0.5), config);

    const QRectF areaRect = layout.node(areaId)->geometry;

    DropPlan plan;
    plan.container = target->id;
    plan.targetArea = areaId;
    plan.zone = classifyZone(areaRect, pos, config.edgeFraction);
    plan.kind = plan.zone == DropZone::Center ? DropPlan::Kind::TabInsert : DropPlan::Kind::SplitArea;

    if (!config.isZoneAllowed(plan.zone))
        return std::nullopt;

    plan.previewRect = previewRect(areaRect, plan.zone);
    qCDebug(droplog).noquote() << "Resolved" << describe(plan);
    return plan;
}

QString toString(DropPlan::Kind kind)
{
    switch (kind) {
        case DropPlan::Kind::TabInsert: return u"tab-insert"_s;
        case DropPlan::Kind::SplitArea: return u"split-area"_s;
        case DropPlan::Kind::SplitContainer: return u"split-container"_s;
        case DropPlan::Kind::SetRoot: return u"set-root"_s;
    }
    return u"tab-insert"_s;
}

QString describe(const DropPlan& plan)
{
    return u"%1 container=%2 area=%3 zone=%4 tab=%5"_s.arg(toString(plan.kind),
                                                            plan.container.toString(),
                                                            plan.targetArea.toString(),
                                                            toString(plan.zone))
        .arg(plan.tabIndex);
}

} // namespace Docking
