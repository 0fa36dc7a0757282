// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QRect>
#include <QtCore/QRectF>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <variant>

namespace Docking {

// Tab group. Never empty while it is part of a tree.
struct AreaNode final {
    QStringList widgetIds;
    int activeIndex = -1;

    // Refreshed by the toolkit (or DockLayout::layoutContainer).
    QRectF tabBarGeometry;
    QVector<QRectF> tabGeometries;

    QString activeWidget() const
    {
        return (activeIndex >= 0 && activeIndex < widgetIds.size()) ? widgetIds.at(activeIndex) : QString();
    }
};

// At least two children, ratios parallel to children and summing to 1.
// No child splitter shares this orientation.
struct SplitterNode final {
    Qt::Orientation orientation = Qt::Horizontal;
    QVector<NodeId> children;
    QVector<double> ratios;
};

struct LayoutNode final {
    NodeId id{};
    NodeId parent{};
    ContainerId container{};

    // Sibling whose share this node took when it was split off. The share is
    // handed back to it on removal while the two stay adjacent.
    NodeId donor{};

    QRectF geometry;

    std::variant<AreaNode, SplitterNode> payload;

    bool isArea() const noexcept { return std::holds_alternative<AreaNode>(payload); }
    bool isSplitter() const noexcept { return std::holds_alternative<SplitterNode>(payload); }

    AreaNode* area() noexcept { return std::get_if<AreaNode>(&payload); }
    const AreaNode* area() const noexcept { return std::get_if<AreaNode>(&payload); }
    SplitterNode* splitter() noexcept { return std::get_if<SplitterNode>(&payload); }
    const SplitterNode* splitter() const noexcept { return std::get_if<SplitterNode>(&payload); }
};

struct ContainerRecord final {
    ContainerId id{};
    NodeId root{};
    bool floating = false;

    // Screen coordinates. Floating windows own theirs; the main container's
    // is pushed by the toolkit.
    QRect geometry;
    ContainerVisibility visibility = ContainerVisibility::Shown;

    // Larger is in front.
    quint64 zOrder = 0;

    bool isEmpty() const noexcept { return root.isNull(); }
};

} // namespace Docking
