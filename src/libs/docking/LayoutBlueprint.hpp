// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QRect>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>
#include <vector>

namespace Docking {

// Detached, value-type description of a layout. The serializer reads and
// writes blueprints; DockLayout captures and applies them. Nothing in here
// refers to live nodes.
struct DOCKING_EXPORT NodeBlueprint final {
    enum class Kind { Area, Splitter };

    Kind kind = Kind::Area;

    // Area
    QStringList widgetIds;
    int activeIndex = 0;

    // Splitter
    Qt::Orientation orientation = Qt::Horizontal;
    QVector<double> ratios;
    std::vector<NodeBlueprint> children;

    bool isArea() const noexcept { return kind == Kind::Area; }
    bool isSplitter() const noexcept { return kind == Kind::Splitter; }

    static NodeBlueprint area(QStringList ids, int active = 0);
    static NodeBlueprint splitter(Qt::Orientation orientation,
                                  std::vector<NodeBlueprint> children,
                                  QVector<double> ratios = {});
};

struct DOCKING_EXPORT ContainerBlueprint final {
    bool floating = false;
    QRect geometry;
    bool visible = true;
    std::optional<NodeBlueprint> root;
};

struct DOCKING_EXPORT LayoutBlueprint final {
    ContainerBlueprint main;
    QVector<ContainerBlueprint> floating;
};

// Brings a node into canonical form: drops empty areas, clamps active
// indices, collapses splitters with fewer than two children, flattens
// same-orientation children and normalizes ratios to sum 1. Returns nullopt
// when nothing survives.
DOCKING_EXPORT std::optional<NodeBlueprint> normalized(NodeBlueprint node);

DOCKING_EXPORT void collectWidgetIds(const NodeBlueprint& node, QStringList& out);

DOCKING_EXPORT bool fuzzyEquals(const NodeBlueprint& a, const NodeBlueprint& b, double tolerance = 1e-6);
DOCKING_EXPORT bool fuzzyEquals(const ContainerBlueprint& a, const ContainerBlueprint& b, double tolerance = 1e-6);
DOCKING_EXPORT bool fuzzyEquals(const LayoutBlueprint& a, const LayoutBlueprint& b, double tolerance = 1e-6);

// One-line text form, e.g. "H[0.5:A(x,*y) 0.5:V[0.5:A(z) 0.5:A(w)]]".
// The active tab carries a '*'.
DOCKING_EXPORT QString describe(const NodeBlueprint& node);
DOCKING_EXPORT QString describe(const LayoutBlueprint& layout);

} // namespace Docking
