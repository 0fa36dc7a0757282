// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <utils/StrongId.hpp>

#include <QtCore/QFlags>
#include <QtCore/QString>
#include <QtCore/Qt>

#include <optional>

namespace Docking {

struct NodeIdTag final {};
struct ContainerIdTag final {};

// Handle of a dock area or splitter in the layout arena.
using NodeId = Utils::StrongId<NodeIdTag>;

// Handle of a top-level container (main window or floating window).
using ContainerId = Utils::StrongId<ContainerIdTag>;

// Side of an existing element where a new element is placed.
enum class DockSide { Left, Right, Top, Bottom };

// Drop zones reported by the target resolver. Bit values so that a set of
// allowed zones can be configured.
enum class DropZone {
    None = 0x00,
    Left = 0x01,
    Right = 0x02,
    Top = 0x04,
    Bottom = 0x08,
    Center = 0x10,

    EdgeZones = Left | Right | Top | Bottom,
    AllZones = EdgeZones | Center
};
Q_DECLARE_FLAGS(DropZones, DropZone)

enum class DockWidgetFeature {
    NoFeatures = 0x0,
    Closable = 0x1,
    Movable = 0x2,
    Floatable = 0x4,
    AllFeatures = Closable | Movable | Floatable
};
Q_DECLARE_FLAGS(DockWidgetFeatures, DockWidgetFeature)

enum class DockWidgetState { Hidden, Docked, Floating };

enum class ContainerVisibility { Shown, Hidden };

inline Qt::Orientation orientationFor(DockSide side) noexcept
{
    switch (side) {
        case DockSide::Left:
        case DockSide::Right:
            return Qt::Horizontal;
        case DockSide::Top:
        case DockSide::Bottom:
            return Qt::Vertical;
    }
    return Qt::Horizontal;
}

// True when the new element goes after the existing one in splitter order.
inline bool insertsAfter(DockSide side) noexcept
{
    return side == DockSide::Right || side == DockSide::Bottom;
}

inline DropZone zoneForSide(DockSide side) noexcept
{
    switch (side) {
        case DockSide::Left: return DropZone::Left;
        case DockSide::Right: return DropZone::Right;
        case DockSide::Top: return DropZone::Top;
        case DockSide::Bottom: return DropZone::Bottom;
    }
    return DropZone::None;
}

inline std::optional<DockSide> sideForZone(DropZone zone) noexcept
{
    switch (zone) {
        case DropZone::Left: return DockSide::Left;
        case DropZone::Right: return DockSide::Right;
        case DropZone::Top: return DockSide::Top;
        case DropZone::Bottom: return DockSide::Bottom;
        default: break;
    }
    return std::nullopt;
}

DOCKING_EXPORT QString toString(DropZone zone);
DOCKING_EXPORT QString toString(DockSide side);
DOCKING_EXPORT QString toString(DockWidgetState state);
DOCKING_EXPORT QString orientationToString(Qt::Orientation orientation);
DOCKING_EXPORT std::optional<Qt::Orientation> orientationFromString(const QString& text);

} // namespace Docking

Q_DECLARE_OPERATORS_FOR_FLAGS(Docking::DropZones)
Q_DECLARE_OPERATORS_FOR_FLAGS(Docking::DockWidgetFeatures)
