// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockLayout.hpp"

#include "docking/WidgetRegistry.hpp"

#include <QtCore/QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

namespace Docking {

namespace {

constexpr double kRatioTolerance = 1e-6;

void normalizeRatios(QVector<double>& ratios)
{
    double sum = 0.0;
    for (double r : ratios)
        sum += r;

    if (ratios.isEmpty())
        return;

    if (sum <= 0.0) {
        std::fill(ratios.begin(), ratios.end(), 1.0 / double(ratios.size()));
        return;
    }

    for (double& r : ratios)
        r /= sum;
}

QString nodeLabel(NodeId id)
{
    return QStringLiteral("#%1").arg(id.toString());
}

} // namespace

DockLayout::DockLayout(WidgetRegistry& registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
{
    ContainerRecord main;
    main.id = m_containerIds.next();
    main.floating = false;
    m_main = main.id;
    m_containers.insert(m_main, main);
    m_containerOrder.push_back(m_main);
}

DockLayout::~DockLayout()
{
    for (const QString& id : m_registry.ids()) {
        if (m_registry.location(id).isDocked())
            m_registry.clearLocation(id);
    }
}

// ---- Containers ------------------------------------------------------------

const ContainerRecord* DockLayout::container(ContainerId id) const
{
    auto it = m_containers.constFind(id);
    return it == m_containers.cend() ? nullptr : &it.value();
}

ContainerRecord* DockLayout::mutableContainer(ContainerId id)
{
    auto it = m_containers.find(id);
    return it == m_containers.end() ? nullptr : &it.value();
}

QVector<ContainerId> DockLayout::containerIds() const
{
    return m_containerOrder;
}

QVector<ContainerId> DockLayout::floatingContainerIds() const
{
    QVector<ContainerId> out;
    for (ContainerId id : m_containerOrder) {
        if (id != m_main)
            out.push_back(id);
    }
    return out;
}

QVector<ContainerId> DockLayout::containersFrontToBack() const
{
    QVector<ContainerId> out = floatingContainerIds();
    std::stable_sort(out.begin(), out.end(), [this](ContainerId a, ContainerId b) {
        return m_containers[a].zOrder > m_containers[b].zOrder;
    });
    out.push_back(m_main);
    return out;
}

ContainerId DockLayout::createFloatingContainer(const QRect& geometry)
{
    ContainerRecord rec;
    rec.id = m_containerIds.next();
    rec.floating = true;
    rec.geometry = geometry;
    rec.zOrder = ++m_zCounter;

    m_containers.insert(rec.id, rec);
    m_containerOrder.push_back(rec.id);
    m_changes.addCreated(rec.id);

    qCDebug(dockinglog) << "Created floating container" << rec.id.toString() << geometry;
    finishMutation();
    return rec.id;
}

DockResult DockLayout::destroyContainer(ContainerId id)
{
    const ContainerRecord* rec = container(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));
    if (id == m_main)
        return failInvariant(QStringLiteral("The main container cannot be destroyed."));
    if (!rec->isEmpty()) {
        return failInvariant(
            QStringLiteral("Container %1 still holds a layout and cannot be destroyed.").arg(id.toString()));
    }

    m_containers.remove(id);
    m_containerOrder.removeOne(id);
    m_emptied.removeAll(id);
    m_changes.addDestroyed(id);
    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::closeContainer(ContainerId id)
{
    const ContainerRecord* rec = container(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));
    if (!rec->floating)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("The main container cannot be closed."));

    for (const QString& widgetId : widgetsIn(id)) {
        m_changes.addWidgetTouched(widgetId, m_registry.state(widgetId));
        m_registry.clearLocation(widgetId);
    }

    destroySubtree(rec->root);
    setRoot(id, NodeId{});
    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::setContainerGeometry(ContainerId id, const QRect& geometry)
{
    ContainerRecord* rec = mutableContainer(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));

    if (rec->geometry == geometry)
        return DockResult::success();

    rec->geometry = geometry;
    emit containerGeometryChanged(id, geometry);
    return DockResult::success();
}

DockResult DockLayout::setContainerVisibility(ContainerId id, ContainerVisibility visibility)
{
    ContainerRecord* rec = mutableContainer(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));
    if (rec->visibility == visibility)
        return DockResult::success();

    rec->visibility = visibility;
    emit containerVisibilityChanged(id, visibility);
    return DockResult::success();
}

DockResult DockLayout::raiseContainer(ContainerId id)
{
    ContainerRecord* rec = mutableContainer(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));
    if (!rec->floating)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("Only floating containers can be raised."));

    rec->zOrder = ++m_zCounter;
    return DockResult::success();
}

// ---- Node queries ----------------------------------------------------------

const LayoutNode* DockLayout::node(NodeId id) const
{
    auto it = m_nodes.constFind(id);
    return it == m_nodes.cend() ? nullptr : it.value().data();
}

LayoutNode* DockLayout::mutableNode(NodeId id)
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : it.value().data();
}

const AreaNode* DockLayout::area(NodeId id) const
{
    const LayoutNode* n = node(id);
    return n ? n->area() : nullptr;
}

const SplitterNode* DockLayout::splitter(NodeId id) const
{
    const LayoutNode* n = node(id);
    return n ? n->splitter() : nullptr;
}

bool DockLayout::isArea(NodeId id) const
{
    const LayoutNode* n = node(id);
    return n && n->isArea();
}

NodeId DockLayout::rootOf(ContainerId id) const
{
    const ContainerRecord* rec = container(id);
    return rec ? rec->root : NodeId{};
}

ContainerId DockLayout::containerOf(NodeId id) const
{
    const LayoutNode* n = node(id);
    return n ? n->container : ContainerId{};
}

QVector<NodeId> DockLayout::areas(ContainerId id) const
{
    QVector<NodeId> out;
    const std::function<void(NodeId)> visit = [&](NodeId nodeId) {
        const LayoutNode* n = node(nodeId);
        if (!n)
            return;
        if (n->isArea()) {
            out.push_back(nodeId);
            return;
        }
        for (NodeId child : n->splitter()->children)
            visit(child);
    };

    visit(rootOf(id));
    return out;
}

QVector<NodeId> DockLayout::allAreas() const
{
    QVector<NodeId> out;
    for (ContainerId id : m_containerOrder)
        out += areas(id);
    return out;
}

QStringList DockLayout::widgetsIn(ContainerId id) const
{
    QStringList out;
    for (NodeId areaId : areas(id))
        out += area(areaId)->widgetIds;
    return out;
}

NodeId DockLayout::areaOf(const QString& widgetId) const
{
    return m_registry.location(widgetId).area;
}

// ---- Arena primitives ------------------------------------------------------

NodeId DockLayout::createArea(ContainerId containerId)
{
    auto n = QSharedPointer<LayoutNode>::create();
    n->id = m_nodeIds.next();
    n->container = containerId;
    n->payload = AreaNode{};
    m_nodes.insert(n->id, n);
    return n->id;
}

NodeId DockLayout::createSplitter(ContainerId containerId, Qt::Orientation orientation)
{
    auto n = QSharedPointer<LayoutNode>::create();
    n->id = m_nodeIds.next();
    n->container = containerId;
    SplitterNode s;
    s.orientation = orientation;
    n->payload = s;
    m_nodes.insert(n->id, n);
    return n->id;
}

void DockLayout::destroyNode(NodeId id)
{
    m_nodes.remove(id);
    m_changes.dropArea(id);
}

void DockLayout::destroySubtree(NodeId id)
{
    const LayoutNode* n = node(id);
    if (!n)
        return;
    if (n->isSplitter()) {
        const QVector<NodeId> children = n->splitter()->children;
        for (NodeId child : children)
            destroySubtree(child);
    }
    destroyNode(id);
}

void DockLayout::setRoot(ContainerId containerId, NodeId root)
{
    ContainerRecord* rec = mutableContainer(containerId);
    if (!rec)
        return;

    rec->root = root;
    m_changes.addChanged(containerId);

    if (LayoutNode* n = mutableNode(root)) {
        n->parent = NodeId{};
        n->container = containerId;
    }
    else if (rec->floating && !m_emptied.contains(containerId)) {
        m_emptied.push_back(containerId);
    }
}

void DockLayout::replaceInParent(NodeId oldChild, NodeId newChild)
{
    LayoutNode* oldNode = mutableNode(oldChild);
    LayoutNode* newNode = mutableNode(newChild);
    if (!oldNode || !newNode)
        return;

    newNode->container = oldNode->container;
    m_changes.addChanged(oldNode->container);

    if (LayoutNode* parent = mutableNode(oldNode->parent)) {
        SplitterNode* s = parent->splitter();
        const int index = int(s->children.indexOf(oldChild));
        s->children[index] = newChild;
        newNode->parent = parent->id;
    }
    else if (ContainerRecord* rec = mutableContainer(oldNode->container)) {
        if (rec->root == oldChild)
            rec->root = newChild;
        newNode->parent = NodeId{};
    }

    oldNode->parent = NodeId{};
}

void DockLayout::detachFromParent(NodeId child)
{
    LayoutNode* n = mutableNode(child);
    if (!n)
        return;

    const NodeId parentId = n->parent;
    if (LayoutNode* parent = mutableNode(parentId)) {
        const int index = int(parent->splitter()->children.indexOf(child));
        removeChildAt(parentId, index);
        collapseIfNeeded(parentId);
    }
    else {
        const ContainerRecord* rec = container(n->container);
        if (rec && rec->root == child)
            setRoot(n->container, NodeId{});
    }

    n->parent = NodeId{};
    n->donor = NodeId{};
}

void DockLayout::removeChildAt(NodeId splitterId, int index)
{
    LayoutNode* parent = mutableNode(splitterId);
    SplitterNode* s = parent->splitter();
    const NodeId childId = s->children.at(index);
    const double share = s->ratios.at(index);

    // The freed share goes back to the sibling it was taken from while the
    // two are still neighbours, otherwise to the previous sibling.
    int recipient = -1;
    if (const LayoutNode* child = node(childId); child && child->donor.isValid()) {
        const int donorIndex = int(s->children.indexOf(child->donor));
        if (donorIndex == index - 1 || donorIndex == index + 1)
            recipient = donorIndex;
    }
    if (recipient < 0 && s->children.size() > 1)
        recipient = index > 0 ? index - 1 : index + 1;
    if (recipient >= 0)
        s->ratios[recipient] += share;

    s->children.removeAt(index);
    s->ratios.removeAt(index);
    normalizeRatios(s->ratios);

    if (LayoutNode* child = mutableNode(childId))
        child->parent = NodeId{};

    m_changes.addChanged(parent->container);
}

void DockLayout::collapseIfNeeded(NodeId splitterId)
{
    LayoutNode* sn = mutableNode(splitterId);
    if (!sn || !sn->isSplitter())
        return;

    SplitterNode* s = sn->splitter();
    if (s->children.size() >= 2)
        return;

    if (s->children.isEmpty()) {
        detachFromParent(splitterId);
        destroyNode(splitterId);
        return;
    }

    const NodeId only = s->children.first();
    LayoutNode* onlyNode = mutableNode(only);
    onlyNode->donor = sn->donor;
    s->children.clear();
    s->ratios.clear();

    replaceInParent(splitterId, only);
    destroyNode(splitterId);

    LayoutNode* parent = mutableNode(onlyNode->parent);
    if (parent && onlyNode->isSplitter() && onlyNode->splitter()->orientation == parent->splitter()->orientation)
        spliceChild(parent->id, int(parent->splitter()->children.indexOf(only)));
}

void DockLayout::spliceChild(NodeId splitterId, int index)
{
    LayoutNode* parent = mutableNode(splitterId);
    SplitterNode* s = parent->splitter();
    const NodeId childId = s->children.at(index);
    const double share = s->ratios.at(index);

    s->children.removeAt(index);
    s->ratios.removeAt(index);
    insertChild(splitterId, index, childId, share);
}

void DockLayout::insertChild(NodeId splitterId, int index, NodeId child, double share)
{
    LayoutNode* parent = mutableNode(splitterId);
    LayoutNode* childNode = mutableNode(child);
    SplitterNode* s = parent->splitter();

    if (childNode->isSplitter() && childNode->splitter()->orientation == s->orientation) {
        const SplitterNode inner = *childNode->splitter();
        for (int j = 0; j < inner.children.size(); ++j) {
            s->children.insert(index + j, inner.children.at(j));
            s->ratios.insert(index + j, share * inner.ratios.at(j));
            if (LayoutNode* grandChild = mutableNode(inner.children.at(j))) {
                grandChild->parent = splitterId;
                grandChild->container = parent->container;
            }
        }
        destroyNode(child);
        m_changes.addChanged(parent->container);
        return;
    }

    s->children.insert(index, child);
    s->ratios.insert(index, share);
    childNode->parent = splitterId;
    childNode->container = parent->container;
    m_changes.addChanged(parent->container);
}

void DockLayout::insertBeside(NodeId subtree, NodeId target, DockSide side)
{
    const Qt::Orientation orientation = orientationFor(side);
    const bool after = insertsAfter(side);

    LayoutNode* t = mutableNode(target);

    // Outer insertion next to a splitter root that already runs this way:
    // the newcomer gets 1/(n+1) and the others keep their proportions.
    if (t->isSplitter() && t->splitter()->orientation == orientation) {
        SplitterNode* s = t->splitter();
        const int n = int(s->children.size());
        for (double& r : s->ratios)
            r *= double(n) / double(n + 1);
        insertChild(target, after ? n : 0, subtree, 1.0 / double(n + 1));
        normalizeRatios(mutableNode(target)->splitter()->ratios);
        return;
    }

    LayoutNode* parent = mutableNode(t->parent);
    if (parent && parent->splitter()->orientation == orientation) {
        SplitterNode* s = parent->splitter();
        const int index = int(s->children.indexOf(target));
        const double share = s->ratios.at(index) / 2.0;
        s->ratios[index] = share;
        mutableNode(subtree)->donor = target;
        insertChild(parent->id, after ? index + 1 : index, subtree, share);
        normalizeRatios(parent->splitter()->ratios);
        return;
    }

    const NodeId splitterId = createSplitter(t->container, orientation);
    LayoutNode* sn = mutableNode(splitterId);
    sn->donor = t->donor;
    t->donor = NodeId{};
    replaceInParent(target, splitterId);

    SplitterNode* s = sn->splitter();
    s->children = {target};
    s->ratios = {0.5};
    t->parent = splitterId;

    mutableNode(subtree)->donor = target;
    insertChild(splitterId, after ? 1 : 0, subtree, 0.5);
    normalizeRatios(sn->splitter()->ratios);
}

void DockLayout::relabel(NodeId subtree, ContainerId containerId)
{
    LayoutNode* n = mutableNode(subtree);
    if (!n)
        return;

    n->container = containerId;
    m_changes.addChanged(containerId);

    if (n->isArea()) {
        const QStringList ids = n->area()->widgetIds;
        for (const QString& id : ids)
            syncWidget(id, subtree);
        return;
    }

    const QVector<NodeId> children = n->splitter()->children;
    for (NodeId child : children)
        relabel(child, containerId);
}

// ---- Widget bookkeeping ----------------------------------------------------

void DockLayout::syncWidget(const QString& widgetId, NodeId areaId)
{
    const LayoutNode* n = node(areaId);
    const ContainerRecord* rec = n ? container(n->container) : nullptr;
    if (!rec)
        return;

    m_changes.addWidgetTouched(widgetId, m_registry.state(widgetId));
    m_registry.setLocation(widgetId, areaId, rec->id, rec->floating);
}

void DockLayout::markActive(NodeId areaId)
{
    if (const AreaNode* a = area(areaId))
        m_changes.addActiveChanged(areaId, a->activeWidget());
}

void DockLayout::appendTabs(NodeId areaId, const QStringList& widgetIds, int index, const QString& activeId)
{
    LayoutNode* n = mutableNode(areaId);
    AreaNode* a = n->area();

    int at = (index < 0 || index > a->widgetIds.size()) ? int(a->widgetIds.size()) : index;
    const int first = at;
    for (const QString& id : widgetIds)
        a->widgetIds.insert(at++, id);

    const int active = int(a->widgetIds.indexOf(activeId));
    a->activeIndex = active >= 0 ? active : first;

    for (const QString& id : widgetIds)
        syncWidget(id, areaId);

    markActive(areaId);
    m_changes.addChanged(n->container);
}

void DockLayout::takeWidget(const QString& widgetId)
{
    const WidgetRegistry::Location loc = m_registry.location(widgetId);
    LayoutNode* n = mutableNode(loc.area);
    if (!n || !n->isArea())
        return;

    m_changes.addWidgetTouched(widgetId, m_registry.state(widgetId));
    m_changes.addChanged(n->container);

    AreaNode* a = n->area();
    const int index = int(a->widgetIds.indexOf(widgetId));
    const bool wasActive = index == a->activeIndex;
    a->widgetIds.removeAt(index);

    if (a->widgetIds.isEmpty()) {
        detachFromParent(loc.area);
        destroyNode(loc.area);
    }
    else {
        if (index < a->activeIndex)
            --a->activeIndex;
        else if (wasActive)
            a->activeIndex = std::min(index, int(a->widgetIds.size()) - 1);
        if (wasActive)
            markActive(loc.area);
    }

    m_registry.clearLocation(widgetId);
}

// ---- Tab group edits -------------------------------------------------------

DockResult DockLayout::insertWidget(const QString& widgetId, NodeId targetArea, int index)
{
    if (!m_registry.contains(widgetId))
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(widgetId));

    const AreaNode* target = area(targetArea);
    if (!target)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area %1.").arg(nodeLabel(targetArea)));

    const WidgetRegistry::Location loc = m_registry.location(widgetId);
    if (loc.area == targetArea) {
        const int from = int(target->widgetIds.indexOf(widgetId));
        const int last = int(target->widgetIds.size()) - 1;
        // index counts positions in the list that still holds the widget.
        int to = index < 0 ? last : (index > from ? index - 1 : index);
        to = std::min(to, last);
        return moveTab(targetArea, from, to);
    }

    if (loc.isDocked())
        takeWidget(widgetId);

    appendTabs(targetArea, QStringList{widgetId}, index, widgetId);
    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::removeWidget(const QString& widgetId)
{
    if (!m_registry.contains(widgetId))
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(widgetId));
    if (!m_registry.location(widgetId).isDocked())
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget '%1' is not docked.").arg(widgetId));

    takeWidget(widgetId);
    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::setActiveIndex(NodeId areaId, int index)
{
    LayoutNode* n = mutableNode(areaId);
    if (!n || !n->isArea())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area %1.").arg(nodeLabel(areaId)));

    AreaNode* a = n->area();
    if (index < 0 || index >= a->widgetIds.size()) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Tab index %1 out of range for area %2.").arg(index).arg(nodeLabel(areaId)));
    }

    if (a->activeIndex == index)
        return DockResult::success();

    a->activeIndex = index;
    markActive(areaId);
    m_changes.addChanged(n->container);
    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::moveTab(NodeId areaId, int from, int to)
{
    LayoutNode* n = mutableNode(areaId);
    if (!n || !n->isArea())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area %1.").arg(nodeLabel(areaId)));

    AreaNode* a = n->area();
    const int count = int(a->widgetIds.size());
    if (from < 0 || from >= count || to < 0 || to >= count) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Tab move %1 -> %2 out of range for area %3.")
                                       .arg(from)
                                       .arg(to)
                                       .arg(nodeLabel(areaId)));
    }

    a->widgetIds.move(from, to);
    a->activeIndex = to;
    markActive(areaId);
    m_changes.addChanged(n->container);
    finishMutation();
    return DockResult::success();
}

// ---- Splits ----------------------------------------------------------------

DockResult DockLayout::splitArea(NodeId targetArea, const QString& widgetId, DockSide side, NodeId* outArea)
{
    if (!m_registry.contains(widgetId))
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(widgetId));

    const AreaNode* target = area(targetArea);
    if (!target)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area %1.").arg(nodeLabel(targetArea)));

    const WidgetRegistry::Location loc = m_registry.location(widgetId);
    if (loc.area == targetArea && target->widgetIds.size() == 1) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Cannot split area %1 with its only widget '%2'.")
                                       .arg(nodeLabel(targetArea), widgetId));
    }

    if (loc.isDocked())
        takeWidget(widgetId);

    const NodeId created = createArea(containerOf(targetArea));
    appendTabs(created, QStringList{widgetId}, -1, widgetId);
    insertBeside(created, targetArea, side);

    if (outArea)
        *outArea = created;

    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::addWidgetToContainer(const QString& widgetId,
                                            ContainerId containerId,
                                            DockSide side,
                                            NodeId* outArea)
{
    if (!m_registry.contains(widgetId))
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(widgetId));
    if (!hasContainer(containerId)) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Container not found: %1").arg(containerId.toString()));
    }

    if (m_registry.location(widgetId).isDocked())
        takeWidget(widgetId);

    const NodeId created = createArea(containerId);
    appendTabs(created, QStringList{widgetId}, -1, widgetId);

    const NodeId root = rootOf(containerId);
    if (root.isNull())
        setRoot(containerId, created);
    else
        insertBeside(created, root, side);

    if (outArea)
        *outArea = created;

    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::moveArea(NodeId areaId, ContainerId destination, NodeId targetArea, DropZone zone, int tabIndex)
{
    const AreaNode* source = area(areaId);
    if (!source)
        return DockResult::failure(DockError::NotFound, QStringLiteral("No dock area %1.").arg(nodeLabel(areaId)));
    if (!hasContainer(destination)) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Container not found: %1").arg(destination.toString()));
    }
    if (zone == DropZone::None)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No drop zone given."));

    if (targetArea.isValid()) {
        if (targetArea == areaId)
            return DockResult::failure(DockError::InvalidTarget, QStringLiteral("An area cannot be dropped onto itself."));
        if (!isArea(targetArea) || containerOf(targetArea) != destination) {
            return DockResult::failure(DockError::InvalidTarget,
                                       QStringLiteral("Area %1 is not part of container %2.")
                                           .arg(nodeLabel(targetArea), destination.toString()));
        }
    }

    const NodeId destinationRoot = rootOf(destination);
    if (!targetArea.isValid()) {
        if (zone == DropZone::Center && destinationRoot.isValid()) {
            return DockResult::failure(DockError::InvalidTarget,
                                       QStringLiteral("A center drop into a non-empty container needs a target area."));
        }
        if (destinationRoot == areaId)
            return DockResult::success();
    }

    if (zone == DropZone::Center && targetArea.isValid()) {
        const QStringList ids = source->widgetIds;
        const QString active = source->activeWidget();
        const ContainerId from = containerOf(areaId);

        detachFromParent(areaId);
        destroyNode(areaId);
        m_changes.addChanged(from);

        appendTabs(targetArea, ids, tabIndex, active);
        finishMutation();
        return DockResult::success();
    }

    detachFromParent(areaId);
    relabel(areaId, destination);

    const NodeId anchor = targetArea.isValid() ? targetArea : rootOf(destination);
    const std::optional<DockSide> side = sideForZone(zone);
    if (anchor.isNull() || !side)
        setRoot(destination, areaId);
    else
        insertBeside(areaId, anchor, *side);

    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::mergeContainer(ContainerId source,
                                      ContainerId destination,
                                      NodeId targetArea,
                                      DropZone zone,
                                      int tabIndex)
{
    const ContainerRecord* src = container(source);
    if (!src)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(source.toString()));
    if (!src->floating)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("The main container cannot be merged."));
    if (source == destination)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("A container cannot be merged into itself."));
    if (src->isEmpty())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("Container %1 is empty.").arg(source.toString()));
    if (!hasContainer(destination)) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Container not found: %1").arg(destination.toString()));
    }
    if (zone == DropZone::None)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No drop zone given."));
    if (targetArea.isValid() && (!isArea(targetArea) || containerOf(targetArea) != destination)) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("Area %1 is not part of container %2.")
                                       .arg(nodeLabel(targetArea), destination.toString()));
    }
    if (!targetArea.isValid() && zone == DropZone::Center && rootOf(destination).isValid()) {
        return DockResult::failure(DockError::InvalidTarget,
                                   QStringLiteral("A center drop into a non-empty container needs a target area."));
    }

    const NodeId root = src->root;

    if (zone == DropZone::Center && targetArea.isValid()) {
        QStringList ids;
        for (NodeId a : areas(source))
            ids += area(a)->widgetIds;
        const QString active = isArea(root) ? area(root)->activeWidget() : ids.value(0);

        setRoot(source, NodeId{});
        destroySubtree(root);
        appendTabs(targetArea, ids, tabIndex, active);
    }
    else {
        setRoot(source, NodeId{});
        relabel(root, destination);

        const NodeId anchor = targetArea.isValid() ? targetArea : rootOf(destination);
        const std::optional<DockSide> side = sideForZone(zone);
        if (anchor.isNull() || !side)
            setRoot(destination, root);
        else
            insertBeside(root, anchor, *side);
    }

    m_containers.remove(source);
    m_containerOrder.removeOne(source);
    m_emptied.removeAll(source);
    m_changes.addDestroyed(source);

    finishMutation();
    return DockResult::success();
}

DockResult DockLayout::setSizeRatios(NodeId splitterId, const QVector<double>& ratios)
{
    LayoutNode* n = mutableNode(splitterId);
    if (!n || !n->isSplitter())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No splitter %1.").arg(nodeLabel(splitterId)));

    SplitterNode* s = n->splitter();
    if (ratios.size() != s->children.size()) {
        return failInvariant(QStringLiteral("Splitter %1 has %2 children but %3 ratios were given.")
                                 .arg(nodeLabel(splitterId))
                                 .arg(s->children.size())
                                 .arg(ratios.size()));
    }

    double sum = 0.0;
    for (double r : ratios) {
        if (!std::isfinite(r) || r < 0.0)
            return failInvariant(QStringLiteral("Splitter ratios must be finite and non-negative."));
        sum += r;
    }
    if (sum <= 0.0)
        return failInvariant(QStringLiteral("Splitter ratios must not all be zero."));

    s->ratios = ratios;
    normalizeRatios(s->ratios);
    m_changes.addChanged(n->container);
    finishMutation();
    return DockResult::success();
}

// ---- Geometry --------------------------------------------------------------

DockResult DockLayout::setNodeGeometry(NodeId id, const QRectF& geometry)
{
    LayoutNode* n = mutableNode(id);
    if (!n)
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No node %1.").arg(nodeLabel(id)));

    n->geometry = geometry;
    return DockResult::success();
}

DockResult DockLayout::setAreaTabGeometry(NodeId areaId, const QRectF& tabBar, const QVector<QRectF>& tabs)
{
    LayoutNode* n = mutableNode(areaId);
    if (!n || !n->isArea())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("No dock area %1.").arg(nodeLabel(areaId)));

    n->area()->tabBarGeometry = tabBar;
    n->area()->tabGeometries = tabs;
    return DockResult::success();
}

DockResult DockLayout::layoutContainer(ContainerId id, const QRectF& rect, double tabBarHeight, double handleWidth)
{
    ContainerRecord* rec = mutableContainer(id);
    if (!rec)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Container not found: %1").arg(id.toString()));

    rec->geometry = rect.toAlignedRect();
    if (rec->root.isValid())
        layoutNode(rec->root, rect, tabBarHeight, handleWidth);
    return DockResult::success();
}

void DockLayout::layoutNode(NodeId id, const QRectF& rect, double tabBarHeight, double handleWidth)
{
    LayoutNode* n = mutableNode(id);
    if (!n)
        return;

    n->geometry = rect;

    if (AreaNode* a = n->area()) {
        const QRectF bar(rect.x(), rect.y(), rect.width(), std::min(tabBarHeight, rect.height()));
        a->tabBarGeometry = bar;
        a->tabGeometries.clear();
        const double tabWidth = a->widgetIds.isEmpty() ? 0.0 : bar.width() / double(a->widgetIds.size());
        for (int i = 0; i < a->widgetIds.size(); ++i)
            a->tabGeometries.push_back(QRectF(bar.x() + i * tabWidth, bar.y(), tabWidth, bar.height()));
        return;
    }

    const SplitterNode s = *n->splitter();
    const bool horizontal = s.orientation == Qt::Horizontal;
    const double handles = handleWidth * double(std::max<qsizetype>(0, s.children.size() - 1));
    const double total = std::max(0.0, (horizontal ? rect.width() : rect.height()) - handles);

    double pos = horizontal ? rect.x() : rect.y();
    for (int i = 0; i < s.children.size(); ++i) {
        const double extent = total * s.ratios.at(i);
        const QRectF childRect = horizontal ? QRectF(pos, rect.y(), extent, rect.height())
                                            : QRectF(rect.x(), pos, rect.width(), extent);
        layoutNode(s.children.at(i), childRect, tabBarHeight, handleWidth);
        pos += extent + handleWidth;
    }
}

// ---- Snapshots -------------------------------------------------------------

std::optional<NodeBlueprint> DockLayout::captureNode(NodeId id) const
{
    const LayoutNode* n = node(id);
    if (!n)
        return std::nullopt;

    if (const AreaNode* a = n->area())
        return NodeBlueprint::area(a->widgetIds, a->activeIndex);

    const SplitterNode* s = n->splitter();
    std::vector<NodeBlueprint> children;
    children.reserve(size_t(s->children.size()));
    for (NodeId child : s->children) {
        if (std::optional<NodeBlueprint> c = captureNode(child))
            children.push_back(std::move(*c));
    }
    return NodeBlueprint::splitter(s->orientation, std::move(children), s->ratios);
}

LayoutBlueprint DockLayout::capture() const
{
    LayoutBlueprint out;
    for (ContainerId id : m_containerOrder) {
        const ContainerRecord& rec = m_containers[id];

        ContainerBlueprint c;
        c.floating = rec.floating;
        c.geometry = rec.geometry;
        c.visible = rec.visibility == ContainerVisibility::Shown;
        c.root = captureNode(rec.root);

        if (id == m_main)
            out.main = std::move(c);
        else
            out.floating.push_back(std::move(c));
    }
    return out;
}

NodeId DockLayout::buildFromBlueprint(const NodeBlueprint& bp, ContainerId containerId)
{
    if (bp.isArea()) {
        const NodeId id = createArea(containerId);
        AreaNode* a = mutableNode(id)->area();
        a->widgetIds = bp.widgetIds;
        a->activeIndex = bp.activeIndex;
        for (const QString& widgetId : bp.widgetIds)
            syncWidget(widgetId, id);
        markActive(id);
        return id;
    }

    const NodeId id = createSplitter(containerId, bp.orientation);
    for (const NodeBlueprint& childBp : bp.children) {
        const NodeId child = buildFromBlueprint(childBp, containerId);
        mutableNode(child)->parent = id;
        mutableNode(id)->splitter()->children.push_back(child);
    }

    SplitterNode* s = mutableNode(id)->splitter();
    s->ratios = bp.ratios;
    normalizeRatios(s->ratios);
    return id;
}

DockResult DockLayout::validateBlueprint(const LayoutBlueprint& blueprint) const
{
    QStringList errors;
    QSet<QString> seen;

    const std::function<void(const NodeBlueprint&, std::optional<Qt::Orientation>, const QString&)> validate =
        [&](const NodeBlueprint& n, std::optional<Qt::Orientation> parentOrientation, const QString& path) {
            if (n.isArea()) {
                if (n.widgetIds.isEmpty())
                    errors.push_back(QStringLiteral("%1: dock area is empty.").arg(path));
                else if (n.activeIndex < 0 || n.activeIndex >= n.widgetIds.size())
                    errors.push_back(QStringLiteral("%1: active index %2 out of range.").arg(path).arg(n.activeIndex));

                for (const QString& id : n.widgetIds) {
                    if (!m_registry.contains(id))
                        errors.push_back(QStringLiteral("%1: dock widget not registered: '%2'.").arg(path, id));
                    else if (seen.contains(id))
                        errors.push_back(QStringLiteral("%1: dock widget placed twice: '%2'.").arg(path, id));
                    seen.insert(id);
                }
                return;
            }

            if (n.children.size() < 2)
                errors.push_back(QStringLiteral("%1: splitter has fewer than two children.").arg(path));
            if (n.ratios.size() != qsizetype(n.children.size()))
                errors.push_back(QStringLiteral("%1: ratio count does not match child count.").arg(path));
            if (parentOrientation && *parentOrientation == n.orientation)
                errors.push_back(QStringLiteral("%1: splitter has the orientation of its parent.").arg(path));

            double sum = 0.0;
            for (double r : n.ratios) {
                if (!std::isfinite(r) || r < 0.0)
                    errors.push_back(QStringLiteral("%1: invalid ratio %2.").arg(path).arg(r));
                else
                    sum += r;
            }
            if (!n.ratios.isEmpty() && sum <= 0.0)
                errors.push_back(QStringLiteral("%1: ratios sum to zero.").arg(path));

            for (size_t i = 0; i < n.children.size(); ++i)
                validate(n.children[i], n.orientation, QStringLiteral("%1/%2").arg(path).arg(i));
        };

    if (blueprint.main.floating)
        errors.push_back(QStringLiteral("main: the main container cannot be floating."));
    if (blueprint.main.root)
        validate(*blueprint.main.root, std::nullopt, QStringLiteral("main"));

    for (qsizetype i = 0; i < blueprint.floating.size(); ++i) {
        const ContainerBlueprint& c = blueprint.floating.at(i);
        const QString path = QStringLiteral("floating[%1]").arg(i);
        if (!c.floating)
            errors.push_back(QStringLiteral("%1: container is not marked floating.").arg(path));
        if (!c.root)
            errors.push_back(QStringLiteral("%1: floating container is empty.").arg(path));
        else
            validate(*c.root, std::nullopt, path);
    }

    if (!errors.isEmpty()) {
        qCWarning(dockinglog).noquote() << "Rejected layout blueprint:" << errors.join(QStringLiteral("; "));
        return DockResult::failure(DockError::InvariantViolation, errors);
    }
    return DockResult::success();
}

DockResult DockLayout::applyBlueprint(const LayoutBlueprint& blueprint)
{
    const DockResult valid = validateBlueprint(blueprint);
    if (!valid)
        return valid;

    // Tear down every tree.
    for (const QString& id : m_registry.ids()) {
        if (!m_registry.location(id).isDocked())
            continue;
        m_changes.addWidgetTouched(id, m_registry.state(id));
        m_registry.clearLocation(id);
    }

    for (ContainerId id : floatingContainerIds()) {
        m_containers.remove(id);
        m_containerOrder.removeOne(id);
        m_changes.addDestroyed(id);
    }
    m_emptied.clear();
    m_nodes.clear();
    m_changes.addChanged(m_main);

    // Rebuild.
    ContainerRecord& main = m_containers[m_main];
    main.root = NodeId{};
    main.visibility = blueprint.main.visible ? ContainerVisibility::Shown : ContainerVisibility::Hidden;
    if (blueprint.main.root)
        main.root = buildFromBlueprint(*blueprint.main.root, m_main);

    for (const ContainerBlueprint& c : blueprint.floating) {
        ContainerRecord rec;
        rec.id = m_containerIds.next();
        rec.floating = true;
        rec.geometry = c.geometry;
        rec.visibility = c.visible ? ContainerVisibility::Shown : ContainerVisibility::Hidden;
        rec.zOrder = ++m_zCounter;
        m_containers.insert(rec.id, rec);
        m_containerOrder.push_back(rec.id);
        m_changes.addCreated(rec.id);

        m_containers[rec.id].root = buildFromBlueprint(*c.root, rec.id);
    }

    qCDebug(dockinglog).noquote() << "Applied layout" << describe(blueprint);
    finishMutation();
    return DockResult::success();
}

// ---- Diagnostics -----------------------------------------------------------

bool DockLayout::checkNode(NodeId id,
                           NodeId expectedParent,
                           ContainerId containerId,
                           QSet<QString>& seen,
                           int& visited,
                           QString& error) const
{
    const LayoutNode* n = node(id);
    if (!n) {
        error = QStringLiteral("Dangling node reference %1.").arg(nodeLabel(id));
        return false;
    }

    ++visited;
    if (n->parent != expectedParent) {
        error = QStringLiteral("Node %1 has parent %2, expected %3.")
                    .arg(nodeLabel(id), nodeLabel(n->parent), nodeLabel(expectedParent));
        return false;
    }
    if (n->container != containerId) {
        error = QStringLiteral("Node %1 is labelled with container %2, expected %3.")
                    .arg(nodeLabel(id), n->container.toString(), containerId.toString());
        return false;
    }

    if (const AreaNode* a = n->area()) {
        if (a->widgetIds.isEmpty()) {
            error = QStringLiteral("Dock area %1 is empty.").arg(nodeLabel(id));
            return false;
        }
        if (a->activeIndex < 0 || a->activeIndex >= a->widgetIds.size()) {
            error = QStringLiteral("Dock area %1 has active index %2 out of range.").arg(nodeLabel(id)).arg(a->activeIndex);
            return false;
        }
        for (const QString& widgetId : a->widgetIds) {
            if (seen.contains(widgetId)) {
                error = QStringLiteral("Dock widget '%1' appears more than once.").arg(widgetId);
                return false;
            }
            seen.insert(widgetId);
            if (m_registry.location(widgetId).area != id) {
                error = QStringLiteral("Registry location of '%1' does not point at area %2.").arg(widgetId, nodeLabel(id));
                return false;
            }
        }
        return true;
    }

    const SplitterNode* s = n->splitter();
    if (s->children.size() < 2) {
        error = QStringLiteral("Splitter %1 has %2 children.").arg(nodeLabel(id)).arg(s->children.size());
        return false;
    }
    if (s->ratios.size() != s->children.size()) {
        error = QStringLiteral("Splitter %1 ratios do not match its children.").arg(nodeLabel(id));
        return false;
    }

    double sum = 0.0;
    for (double r : s->ratios) {
        if (!std::isfinite(r) || r < 0.0) {
            error = QStringLiteral("Splitter %1 has an invalid ratio.").arg(nodeLabel(id));
            return false;
        }
        sum += r;
    }
    if (std::abs(sum - 1.0) > kRatioTolerance) {
        error = QStringLiteral("Splitter %1 ratios sum to %2.").arg(nodeLabel(id)).arg(sum);
        return false;
    }

    for (NodeId child : s->children) {
        const SplitterNode* inner = splitter(child);
        if (inner && inner->orientation == s->orientation) {
            error = QStringLiteral("Splitter %1 nests %2 with the same orientation.").arg(nodeLabel(id), nodeLabel(child));
            return false;
        }
        if (!checkNode(child, id, containerId, seen, visited, error))
            return false;
    }
    return true;
}

bool DockLayout::checkInvariants(QString* error) const
{
    QString message;
    QSet<QString> seen;
    int visited = 0;

    const auto fail = [&](const QString& text) {
        if (error)
            *error = text;
        return false;
    };

    if (!m_containers.contains(m_main) || m_containers[m_main].floating)
        return fail(QStringLiteral("The main container is missing or floating."));

    for (ContainerId id : m_containerOrder) {
        const ContainerRecord& rec = m_containers[id];
        if (id != m_main && !rec.floating)
            return fail(QStringLiteral("Container %1 is a second main container.").arg(id.toString()));
        if (rec.root.isNull())
            continue;
        if (!checkNode(rec.root, NodeId{}, id, seen, visited, message))
            return fail(message);
    }

    if (visited != m_nodes.size())
        return fail(QStringLiteral("%1 nodes are not reachable from any container.").arg(m_nodes.size() - visited));

    for (const QString& id : m_registry.ids()) {
        const WidgetRegistry::Location loc = m_registry.location(id);
        if (!loc.isDocked()) {
            if (seen.contains(id))
                return fail(QStringLiteral("Dock widget '%1' is in a tree but recorded as hidden.").arg(id));
            if (m_registry.state(id) != DockWidgetState::Hidden)
                return fail(QStringLiteral("Dock widget '%1' has no area but is not hidden.").arg(id));
            continue;
        }

        if (!seen.contains(id))
            return fail(QStringLiteral("Dock widget '%1' points at an area that does not hold it.").arg(id));

        const ContainerRecord* rec = container(loc.container);
        if (!rec || containerOf(loc.area) != loc.container)
            return fail(QStringLiteral("Dock widget '%1' records the wrong container.").arg(id));

        const DockWidgetState expected = rec->floating ? DockWidgetState::Floating : DockWidgetState::Docked;
        if (m_registry.state(id) != expected)
            return fail(QStringLiteral("Dock widget '%1' has state %2, expected %3.")
                            .arg(id, toString(m_registry.state(id)), toString(expected)));
    }

    return true;
}

void DockLayout::dumpNode(NodeId id, int level, QString& out) const
{
    const LayoutNode* n = node(id);
    if (!n)
        return;

    const QString indent(level * 2, QLatin1Char(' '));
    if (const AreaNode* a = n->area()) {
        QStringList tabs;
        for (int i = 0; i < a->widgetIds.size(); ++i)
            tabs.push_back(i == a->activeIndex ? QStringLiteral("*") + a->widgetIds.at(i) : a->widgetIds.at(i));
        out += QStringLiteral("%1Area %2 [%3]\n").arg(indent, nodeLabel(id), tabs.join(QStringLiteral(", ")));
        return;
    }

    const SplitterNode* s = n->splitter();
    QStringList ratios;
    for (double r : s->ratios)
        ratios.push_back(QString::number(r, 'f', 3));
    out += QStringLiteral("%1Splitter %2 %3 [%4]\n")
               .arg(indent, nodeLabel(id), orientationToString(s->orientation), ratios.join(QLatin1Char(' ')));
    for (NodeId child : s->children)
        dumpNode(child, level + 1, out);
}

QString DockLayout::dump() const
{
    QString out;
    for (ContainerId id : m_containerOrder) {
        const ContainerRecord& rec = m_containers[id];
        const QRect& g = rec.geometry;
        out += QStringLiteral("Container %1 (%2) %3,%4 %5x%6\n")
                   .arg(id.toString(), rec.floating ? QStringLiteral("floating") : QStringLiteral("main"))
                   .arg(g.x())
                   .arg(g.y())
                   .arg(g.width())
                   .arg(g.height());
        if (rec.root.isNull())
            out += QStringLiteral("  <empty>\n");
        else
            dumpNode(rec.root, 1, out);
    }
    return out;
}

DockResult DockLayout::failInvariant(const QString& message) const
{
    qCCritical(dockinglog).noquote() << message;
    return DockResult::failure(DockError::InvariantViolation, message);
}

void DockLayout::finishMutation()
{
    // Floating containers whose tree emptied during this mutation go away.
    for (ContainerId id : std::as_const(m_emptied)) {
        const ContainerRecord* rec = container(id);
        if (!rec || !rec->floating || !rec->isEmpty())
            continue;
        m_containers.remove(id);
        m_containerOrder.removeOne(id);
        m_changes.addDestroyed(id);
        qCDebug(dockinglog) << "Destroyed empty floating container" << id.toString();
    }
    m_emptied.clear();

    if (m_checkInvariants) {
        QString error;
        if (!checkInvariants(&error))
            qCCritical(dockinglog).noquote() << "Layout invariant violated:" << error << '\n' << dump();
    }

    if (m_changes.empty())
        return;

    const LayoutChangeSet changes = m_changes;
    m_changes.clear();

    if (!changes.changedContainers().isEmpty())
        qCDebug(dockinglog).noquote() << "Layout after mutation:\n" << dump();

    for (ContainerId id : changes.createdContainers()) {
        if (hasContainer(id))
            emit containerCreated(id);
    }

    for (const QString& id : changes.touchedWidgets()) {
        if (!m_registry.contains(id))
            continue;
        const DockWidgetState now = m_registry.state(id);
        if (now != changes.stateBefore(id))
            emit widgetStateChanged(id, now);
    }

    for (const LayoutChangeSet::ActiveChange& change : changes.activeChanges()) {
        if (const AreaNode* a = area(change.area))
            emit activeWidgetChanged(change.area, a->activeWidget());
    }

    for (ContainerId id : changes.changedContainers()) {
        if (hasContainer(id))
            emit layoutChanged(id);
    }

    for (ContainerId id : changes.destroyedContainers())
        emit containerDestroyed(id);
}

} // namespace Docking
