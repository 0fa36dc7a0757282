// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockTypes.hpp"

namespace Docking {

using namespace Qt::StringLiterals;

QString toString(DropZone zone)
{
    switch (zone) {
        case DropZone::None: return u"none"_s;
        case DropZone::Left: return u"left"_s;
        case DropZone::Right: return u"right"_s;
        case DropZone::Top: return u"top"_s;
        case DropZone::Bottom: return u"bottom"_s;
        case DropZone::Center: return u"center"_s;
        default: break;
    }
    return u"none"_s;
}

QString toString(DockSide side)
{
    return toString(zoneForSide(side));
}

QString toString(DockWidgetState state)
{
    switch (state) {
        case DockWidgetState::Hidden: return u"hidden"_s;
        case DockWidgetState::Docked: return u"docked"_s;
        case DockWidgetState::Floating: return u"floating"_s;
    }
    return u"hidden"_s;
}

QString orientationToString(Qt::Orientation orientation)
{
    return orientation == Qt::Horizontal ? u"horizontal"_s : u"vertical"_s;
}

std::optional<Qt::Orientation> orientationFromString(const QString& text)
{
    const QString key = text.trimmed().toLower();
    if (key == u"horizontal"_s)
        return Qt::Horizontal;
    if (key == u"vertical"_s)
        return Qt::Vertical;
    return std::nullopt;
}

} // namespace Docking
