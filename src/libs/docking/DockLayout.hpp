// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockResult.hpp"
#include "docking/LayoutBlueprint.hpp"
#include "docking/LayoutChangeSet.hpp"
#include "docking/LayoutNode.hpp"

#include <utils/StrongId.hpp>

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QSharedPointer>
#include <QtCore/QVector>

#include <optional>

namespace Docking {

class WidgetRegistry;

// The layout trees of every container, kept in one arena of nodes addressed
// by NodeId. Each node stores its parent handle and its container, so a
// handle from a destroyed node simply stops resolving.
//
// All mutating calls either succeed completely or leave the trees and the
// registry untouched. Signals are emitted after the mutation is complete.
//
// Geometry is in screen coordinates for every container so the drop resolver
// can hit-test across windows.
class DOCKING_EXPORT DockLayout final : public QObject
{
    Q_OBJECT

public:
    explicit DockLayout(WidgetRegistry& registry, QObject* parent = nullptr);
    ~DockLayout() override;

    WidgetRegistry& registry() noexcept { return m_registry; }
    const WidgetRegistry& registry() const noexcept { return m_registry; }

    // Containers
    ContainerId mainContainer() const noexcept { return m_main; }
    const ContainerRecord* container(ContainerId id) const;
    bool hasContainer(ContainerId id) const noexcept { return m_containers.contains(id); }

    // Main container first, then floating containers in creation order.
    QVector<ContainerId> containerIds() const;
    QVector<ContainerId> floatingContainerIds() const;

    // Floating containers by descending z-order, then the main container.
    QVector<ContainerId> containersFrontToBack() const;

    ContainerId createFloatingContainer(const QRect& geometry);

    // Only legal for an empty container. The main container is never destroyed.
    DockResult destroyContainer(ContainerId id);
    // Hides every widget of a floating container and destroys it in one mutation.
    DockResult closeContainer(ContainerId id);

    DockResult setContainerGeometry(ContainerId id, const QRect& geometry);
    DockResult setContainerVisibility(ContainerId id, ContainerVisibility visibility);
    DockResult raiseContainer(ContainerId id);

    // Nodes
    bool contains(NodeId id) const noexcept { return m_nodes.contains(id); }
    const LayoutNode* node(NodeId id) const;
    const AreaNode* area(NodeId id) const;
    const SplitterNode* splitter(NodeId id) const;
    bool isArea(NodeId id) const;

    NodeId rootOf(ContainerId id) const;
    ContainerId containerOf(NodeId id) const;

    // Dock areas of a container in depth-first order.
    QVector<NodeId> areas(ContainerId id) const;
    QVector<NodeId> allAreas() const;
    QStringList widgetsIn(ContainerId id) const;
    int nodeCount() const noexcept { return static_cast<int>(m_nodes.size()); }

    NodeId areaOf(const QString& widgetId) const;

    // Tab group edits
    DockResult insertWidget(const QString& widgetId, NodeId targetArea, int index = -1);
    DockResult removeWidget(const QString& widgetId);
    DockResult setActiveIndex(NodeId areaId, int index);
    DockResult moveTab(NodeId areaId, int from, int to);

    // Splits
    DockResult splitArea(NodeId targetArea, const QString& widgetId, DockSide side, NodeId* outArea = nullptr);

    // Places the widget in a new area at the edge of the container. An empty
    // container takes the new area as its root.
    DockResult addWidgetToContainer(const QString& widgetId,
                                    ContainerId containerId,
                                    DockSide side,
                                    NodeId* outArea = nullptr);

    // Moves a whole area. Center merges the area's widgets as tabs of
    // targetArea starting at tabIndex (-1 appends). A null targetArea splits
    // the destination root, or becomes the root of an empty destination.
    DockResult moveArea(NodeId areaId,
                        ContainerId destination,
                        NodeId targetArea,
                        DropZone zone,
                        int tabIndex = -1);

    // Moves the whole tree of a floating container into another container and
    // destroys the source.
    DockResult mergeContainer(ContainerId source,
                              ContainerId destination,
                              NodeId targetArea,
                              DropZone zone,
                              int tabIndex = -1);

    DockResult setSizeRatios(NodeId splitterId, const QVector<double>& ratios);

    // Geometry refresh from the toolkit.
    DockResult setNodeGeometry(NodeId id, const QRectF& geometry);
    DockResult setAreaTabGeometry(NodeId areaId, const QRectF& tabBar, const QVector<QRectF>& tabs);

    // Computes geometry for every node of a container from its ratios.
    DockResult layoutContainer(ContainerId id, const QRectF& rect, double tabBarHeight, double handleWidth = 0.0);

    // Snapshots
    LayoutBlueprint capture() const;
    std::optional<NodeBlueprint> captureNode(NodeId id) const;

    // Replaces every tree with the blueprint. The blueprint must be
    // normalized and reference registered widgets at most once; otherwise
    // nothing changes and InvariantViolation is returned. Registered widgets
    // missing from the blueprint become hidden.
    DockResult validateBlueprint(const LayoutBlueprint& blueprint) const;
    DockResult applyBlueprint(const LayoutBlueprint& blueprint);

    // Diagnostics
    bool checkInvariants(QString* error = nullptr) const;
    QString dump() const;

    // Runs checkInvariants() after every mutation and logs violations.
    void setInvariantChecksEnabled(bool enabled) noexcept { m_checkInvariants = enabled; }
    bool invariantChecksEnabled() const noexcept { return m_checkInvariants; }

signals:
    void layoutChanged(Docking::ContainerId container);
    void containerCreated(Docking::ContainerId container);
    void containerDestroyed(Docking::ContainerId container);
    void containerGeometryChanged(Docking::ContainerId container, const QRect& geometry);
    void containerVisibilityChanged(Docking::ContainerId container, Docking::ContainerVisibility visibility);
    void widgetStateChanged(const QString& widgetId, Docking::DockWidgetState state);
    void activeWidgetChanged(Docking::NodeId area, const QString& widgetId);

private:
    LayoutNode* mutableNode(NodeId id);
    ContainerRecord* mutableContainer(ContainerId id);

    NodeId createArea(ContainerId containerId);
    NodeId createSplitter(ContainerId containerId, Qt::Orientation orientation);
    void destroyNode(NodeId id);
    void destroySubtree(NodeId id);

    void setRoot(ContainerId containerId, NodeId root);
    void replaceInParent(NodeId oldChild, NodeId newChild);
    void detachFromParent(NodeId child);
    void removeChildAt(NodeId splitterId, int index);
    void collapseIfNeeded(NodeId splitterId);
    void spliceChild(NodeId splitterId, int index);
    void insertChild(NodeId splitterId, int index, NodeId child, double share);
    void insertBeside(NodeId subtree, NodeId target, DockSide side);
    void relabel(NodeId subtree, ContainerId containerId);

    void appendTabs(NodeId areaId, const QStringList& widgetIds, int index, const QString& activeId);
    void takeWidget(const QString& widgetId);
    void syncWidget(const QString& widgetId, NodeId areaId);
    void markActive(NodeId areaId);

    NodeId buildFromBlueprint(const NodeBlueprint& bp, ContainerId containerId);
    void layoutNode(NodeId id, const QRectF& rect, double tabBarHeight, double handleWidth);
    void dumpNode(NodeId id, int level, QString& out) const;
    bool checkNode(NodeId id, NodeId expectedParent, ContainerId containerId, QSet<QString>& seen,
                   int& visited, QString& error) const;

    DockResult failInvariant(const QString& message) const;
    void finishMutation();

    WidgetRegistry& m_registry;

    QHash<NodeId, QSharedPointer<LayoutNode>> m_nodes;
    QHash<ContainerId, ContainerRecord> m_containers;
    QVector<ContainerId> m_containerOrder;
    ContainerId m_main{};

    Utils::StrongIdAllocator<NodeId> m_nodeIds;
    Utils::StrongIdAllocator<ContainerId> m_containerIds;
    quint64 m_zCounter = 0;

    LayoutChangeSet m_changes;
    QVector<ContainerId> m_emptied;
    bool m_checkInvariants = false;
};

} // namespace Docking
