// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockResult.hpp"
#include "docking/DockTypes.hpp"

#include <QtCore/QPoint>
#include <QtCore/QPointF>
#include <QtCore/QRect>
#include <QtCore/QSize>
#include <QtCore/QVector>

namespace Docking {

class DockLayout;

// Promotion of areas and widgets into floating windows and back. The
// containers themselves live in DockLayout; this class adds the capability
// checks and the window-level operations.
class DOCKING_EXPORT FloatingContainerManager final
{
public:
    explicit FloatingContainerManager(DockLayout& layout);

    DockResult detach(NodeId area, const QPoint& screenPos, const QSize& size, ContainerId* out = nullptr);
    DockResult floatWidget(const QString& widgetId, const QPoint& screenPos, const QSize& size,
                           ContainerId* out = nullptr);

    // Merges the container into the container of targetArea. A null
    // targetArea drops onto the outer edge of the main container.
    DockResult reattach(ContainerId container, NodeId targetArea, DropZone zone, int tabIndex = -1);
    DockResult reattachToContainer(ContainerId container,
                                   ContainerId destination,
                                   NodeId targetArea,
                                   DropZone zone,
                                   int tabIndex = -1);

    DockResult destroyContainer(ContainerId container);

    DockResult setGeometry(ContainerId container, const QRect& geometry);
    DockResult show(ContainerId container);
    DockResult hide(ContainerId container);
    DockResult close(ContainerId container);
    DockResult raise(ContainerId container);

    QVector<ContainerId> containers() const;

    // Front-most shown container under pos, floating ones first.
    ContainerId containerAt(const QPointF& pos) const;

private:
    DockResult checkFloating(ContainerId container) const;

    DockLayout& m_layout;
};

} // namespace Docking
