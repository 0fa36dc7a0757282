// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QString>

#include <optional>

namespace Docking {

class DockLayout;
struct AreaNode;
struct DockConfig;

// What is being dragged: a single tab, a whole tab group or a floating window.
struct DOCKING_EXPORT DragItem final {
    enum class Kind { Widget, Area, Container };

    Kind kind = Kind::Widget;
    QString widgetId;
    NodeId area{};
    ContainerId container{};

    static DragItem widget(const QString& id)
    {
        DragItem item;
        item.kind = Kind::Widget;
        item.widgetId = id;
        return item;
    }

    static DragItem dockArea(NodeId id)
    {
        DragItem item;
        item.kind = Kind::Area;
        item.area = id;
        return item;
    }

    static DragItem floatingContainer(ContainerId id)
    {
        DragItem item;
        item.kind = Kind::Container;
        item.container = id;
        return item;
    }
};

struct DOCKING_EXPORT DropPlan final {
    enum class Kind {
        TabInsert,      // become tabs of targetArea at tabIndex (-1 appends)
        SplitArea,      // split targetArea on the zone side
        SplitContainer, // split the container root on the zone side
        SetRoot         // become the root of an empty container
    };

    Kind kind = Kind::TabInsert;
    ContainerId container{};
    NodeId targetArea{};
    DropZone zone = DropZone::None;
    int tabIndex = -1;
    QRectF previewRect;

    bool operator==(const DropPlan& other) const
    {
        return kind == other.kind && container == other.container && targetArea == other.targetArea
               && zone == other.zone && tabIndex == other.tabIndex && previewRect == other.previewRect;
    }
    bool operator!=(const DropPlan& other) const { return !(*this == other); }
};

// Picks the drop target under pos. Never mutates the layout.
DOCKING_EXPORT std::optional<DropPlan> resolveDrop(const DockLayout& layout,
                                                   const QPointF& pos,
                                                   const DragItem& item,
                                                   const DockConfig& config);

// Zone of rect under pos. The outer edgeFraction of each axis maps to the
// nearest edge; ties go left, right, top, bottom in that order.
DOCKING_EXPORT DropZone classifyZone(const QRectF& rect, const QPointF& pos, double edgeFraction);

// Index before the first tab whose horizontal center lies right of pos.
DOCKING_EXPORT int tabInsertIndex(const AreaNode& area, const QPointF& pos);

DOCKING_EXPORT QRectF previewRect(const QRectF& rect, DropZone zone);

DOCKING_EXPORT QString toString(DropPlan::Kind kind);
DOCKING_EXPORT QString describe(const DropPlan& plan);

} // namespace Docking
