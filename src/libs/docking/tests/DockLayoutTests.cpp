// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/DockLayout.hpp"
#include "docking/WidgetRegistry.hpp"

using namespace Docking;
using Docking::Tests::describeMain;
using Docking::Tests::layoutIsConsistent;
using Docking::Tests::registerWidgets;

namespace {

NodeId dockFirst(DockLayout& layout, const QString& id)
{
    NodeId area;
    EXPECT_TRUE(layout.addWidgetToContainer(id, layout.mainContainer(), DockSide::Right, &area).ok);
    return area;
}

} // namespace

TEST(DockLayoutTests, FirstWidgetBecomesRootArea)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");

    EXPECT_EQ(layout.rootOf(layout.mainContainer()), area);
    EXPECT_EQ(layout.area(area)->widgetIds, QStringList{"a"});
    EXPECT_EQ(registry.state("a"), DockWidgetState::Docked);
    EXPECT_EQ(layout.areaOf("a"), area);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, CenterInsertAppendsAndActivates)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.insertWidget("b", area).ok);
    ASSERT_TRUE(layout.insertWidget("c", area).ok);

    const AreaNode* a = layout.area(area);
    EXPECT_EQ(a->widgetIds, (QStringList{"a", "b", "c"}));
    EXPECT_EQ(a->activeIndex, 2);
    EXPECT_EQ(a->activeWidget(), QStringLiteral("c"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, InsertAtIndexClampsAndActivates)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.insertWidget("b", area, 0).ok);
    ASSERT_TRUE(layout.insertWidget("c", area, 99).ok);

    EXPECT_EQ(layout.area(area)->widgetIds, (QStringList{"b", "a", "c"}));
    EXPECT_EQ(layout.area(area)->activeIndex, 2);
}

TEST(DockLayoutTests, InsertIntoOwnAreaReorders)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.insertWidget("b", area).ok);
    ASSERT_TRUE(layout.insertWidget("c", area).ok);

    // Insert before position 2 of [a, b, c].
    ASSERT_TRUE(layout.insertWidget("a", area, 2).ok);
    EXPECT_EQ(layout.area(area)->widgetIds, (QStringList{"b", "a", "c"}));
    EXPECT_EQ(layout.area(area)->activeIndex, 1);

    ASSERT_TRUE(layout.moveTab(area, 0, 2).ok);
    EXPECT_EQ(layout.area(area)->widgetIds, (QStringList{"a", "c", "b"}));
    EXPECT_EQ(layout.area(area)->activeWidget(), QStringLiteral("b"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, SplitWrapsAreaInFiftyFiftySplitter)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    NodeId created;
    ASSERT_TRUE(layout.splitArea(area, "b", DockSide::Right, &created).ok);

    const NodeId root = layout.rootOf(layout.mainContainer());
    const SplitterNode* s = layout.splitter(root);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->orientation, Qt::Horizontal);
    EXPECT_EQ(s->children, (QVector<NodeId>{area, created}));
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.500:A(*b)]"));
    EXPECT_EQ(layout.node(area)->parent, root);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, SplitTopPlacesNewAreaFirst)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.splitArea(area, "b", DockSide::Top).ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("V[0.500:A(*b) 0.500:A(*a)]"));
}

TEST(DockLayoutTests, SplitInsideSameOrientationHalvesTargetShare)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(area, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.splitArea(bArea, "c", DockSide::Right).ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.250:A(*b) 0.250:A(*c)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, SplitThenRemoveRestoresRatios)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c", "d"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.setSizeRatios(layout.rootOf(layout.mainContainer()), {0.7, 0.3}).ok);

    const std::optional<NodeBlueprint> before = layout.captureNode(layout.rootOf(layout.mainContainer()));
    ASSERT_TRUE(before.has_value());

    ASSERT_TRUE(layout.splitArea(aArea, "c", DockSide::Left).ok);
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.350:A(*c) 0.350:A(*a) 0.300:A(*b)]"));
    ASSERT_TRUE(layout.removeWidget("c").ok);
    EXPECT_TRUE(fuzzyEquals(*layout.captureNode(layout.rootOf(layout.mainContainer())), *before));

    ASSERT_TRUE(layout.splitArea(bArea, "d", DockSide::Bottom).ok);
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.700:A(*a) 0.300:V[0.500:A(*b) 0.500:A(*d)]]"));
    ASSERT_TRUE(layout.removeWidget("d").ok);
    EXPECT_TRUE(fuzzyEquals(*layout.captureNode(layout.rootOf(layout.mainContainer())), *before));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, RemovingLastWidgetCollapsesSplitter)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    const NodeId splitterId = layout.rootOf(layout.mainContainer());

    ASSERT_TRUE(layout.removeWidget("b").ok);

    EXPECT_EQ(layout.rootOf(layout.mainContainer()), aArea);
    EXPECT_FALSE(layout.contains(bArea));
    EXPECT_FALSE(layout.contains(splitterId));
    EXPECT_EQ(layout.nodeCount(), 1);
    EXPECT_FALSE(layout.node(aArea)->parent.isValid());
    EXPECT_EQ(registry.state("b"), DockWidgetState::Hidden);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, RemovingActiveTabActivatesItsSuccessor)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.insertWidget("b", area).ok);
    ASSERT_TRUE(layout.insertWidget("c", area).ok);
    ASSERT_TRUE(layout.setActiveIndex(area, 1).ok);

    ASSERT_TRUE(layout.removeWidget("b").ok);
    EXPECT_EQ(layout.area(area)->activeWidget(), QStringLiteral("c"));

    ASSERT_TRUE(layout.removeWidget("c").ok);
    EXPECT_EQ(layout.area(area)->activeWidget(), QStringLiteral("a"));
}

TEST(DockLayoutTests, CollapseFlattensSameOrientationChild)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c", "d"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    NodeId cArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.splitArea(bArea, "c", DockSide::Bottom, &cArea).ok);
    ASSERT_TRUE(layout.splitArea(cArea, "d", DockSide::Right).ok);
    EXPECT_EQ(describeMain(layout),
              QStringLiteral("H[0.500:A(*a) 0.500:V[0.500:A(*b) 0.500:H[0.500:A(*c) 0.500:A(*d)]]]"));

    ASSERT_TRUE(layout.removeWidget("b").ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.250:A(*c) 0.250:A(*d)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, OuterInsertionSharesContainerEdge)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c", "d"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right).ok);

    ASSERT_TRUE(layout.addWidgetToContainer("c", layout.mainContainer(), DockSide::Right).ok);
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.333:A(*a) 0.333:A(*b) 0.333:A(*c)]"));

    ASSERT_TRUE(layout.addWidgetToContainer("d", layout.mainContainer(), DockSide::Bottom).ok);
    EXPECT_EQ(describeMain(layout),
              QStringLiteral("V[0.500:H[0.333:A(*a) 0.333:A(*b) 0.333:A(*c)] 0.500:A(*d)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, MoveAreaCenterMergesTabsAndKeepsActive)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.insertWidget("c", bArea).ok);
    ASSERT_TRUE(layout.setActiveIndex(bArea, 0).ok);

    ASSERT_TRUE(layout.moveArea(bArea, layout.mainContainer(), aArea, DropZone::Center).ok);

    EXPECT_FALSE(layout.contains(bArea));
    EXPECT_EQ(layout.rootOf(layout.mainContainer()), aArea);
    EXPECT_EQ(layout.area(aArea)->widgetIds, (QStringList{"a", "b", "c"}));
    EXPECT_EQ(layout.area(aArea)->activeWidget(), QStringLiteral("b"));
    EXPECT_EQ(layout.areaOf("c"), aArea);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, MoveAreaToEdgeOfSibling)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    NodeId cArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.splitArea(bArea, "c", DockSide::Right, &cArea).ok);

    ASSERT_TRUE(layout.moveArea(cArea, layout.mainContainer(), aArea, DropZone::Bottom).ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:V[0.500:A(*a) 0.500:A(*c)] 0.500:A(*b)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, MoveAreaValidatesBeforeMutating)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    const QString before = describeMain(layout);

    EXPECT_EQ(layout.moveArea(aArea, layout.mainContainer(), aArea, DropZone::Left).error, DockError::InvalidTarget);
    EXPECT_EQ(layout.moveArea(aArea, layout.mainContainer(), bArea, DropZone::None).error, DockError::InvalidTarget);
    EXPECT_EQ(layout.moveArea(aArea, layout.mainContainer(), NodeId{}, DropZone::Center).error,
              DockError::InvalidTarget);
    EXPECT_EQ(layout.moveArea(NodeId(999), layout.mainContainer(), bArea, DropZone::Left).error, DockError::NotFound);

    EXPECT_EQ(describeMain(layout), before);
}

TEST(DockLayoutTests, ErrorsLeaveLayoutUntouched)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "hidden"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right).ok);
    const QString before = describeMain(layout);

    EXPECT_EQ(layout.insertWidget("ghost", aArea).error, DockError::NotFound);
    EXPECT_EQ(layout.insertWidget("hidden", NodeId(999)).error, DockError::InvalidTarget);
    EXPECT_EQ(layout.removeWidget("hidden").error, DockError::NotFound);
    EXPECT_EQ(layout.removeWidget("ghost").error, DockError::NotFound);
    EXPECT_EQ(layout.splitArea(aArea, "a", DockSide::Left).error, DockError::InvalidTarget);
    EXPECT_EQ(layout.setActiveIndex(aArea, 3).error, DockError::InvalidTarget);
    EXPECT_EQ(layout.moveTab(aArea, 0, 1).error, DockError::InvalidTarget);

    const NodeId root = layout.rootOf(layout.mainContainer());
    EXPECT_EQ(layout.setSizeRatios(root, {1.0}).error, DockError::InvariantViolation);
    EXPECT_EQ(layout.setSizeRatios(root, {-1.0, 2.0}).error, DockError::InvariantViolation);
    EXPECT_EQ(layout.setSizeRatios(root, {0.0, 0.0}).error, DockError::InvariantViolation);
    EXPECT_EQ(layout.setSizeRatios(aArea, {1.0}).error, DockError::InvalidTarget);

    EXPECT_EQ(describeMain(layout), before);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, SetSizeRatiosNormalizes)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right).ok);

    ASSERT_TRUE(layout.setSizeRatios(layout.rootOf(layout.mainContainer()), {3.0, 1.0}).ok);
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.750:A(*a) 0.250:A(*b)]"));
}

TEST(DockLayoutTests, FloatingContainerIsDestroyedWhenEmptied)
{
    Docking::Tests::ensureCoreApp();

    WidgetRegistry registry;
    registerWidgets(registry, {"a", "f"});
    DockLayout layout(registry);
    dockFirst(layout, "a");

    QVector<ContainerId> destroyed;
    QObject::connect(&layout, &DockLayout::containerDestroyed, [&](ContainerId id) { destroyed.push_back(id); });

    const ContainerId floating = layout.createFloatingContainer(QRect(10, 10, 300, 200));
    ASSERT_TRUE(layout.addWidgetToContainer("f", floating, DockSide::Right).ok);
    EXPECT_EQ(registry.state("f"), DockWidgetState::Floating);
    EXPECT_EQ(layout.floatingContainerIds(), QVector<ContainerId>{floating});

    ASSERT_TRUE(layout.removeWidget("f").ok);

    EXPECT_FALSE(layout.hasContainer(floating));
    EXPECT_EQ(destroyed, QVector<ContainerId>{floating});
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, MergeContainerMovesWholeTree)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "x", "y"});
    DockLayout layout(registry);
    const NodeId aArea = dockFirst(layout, "a");

    const ContainerId floating = layout.createFloatingContainer(QRect(0, 0, 200, 100));
    NodeId xArea;
    ASSERT_TRUE(layout.addWidgetToContainer("x", floating, DockSide::Right, &xArea).ok);
    ASSERT_TRUE(layout.splitArea(xArea, "y", DockSide::Right).ok);

    ASSERT_TRUE(layout.mergeContainer(floating, layout.mainContainer(), aArea, DropZone::Right).ok);

    EXPECT_FALSE(layout.hasContainer(floating));
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.250:A(*x) 0.250:A(*y)]"));
    EXPECT_EQ(registry.state("x"), DockWidgetState::Docked);
    EXPECT_EQ(registry.location("y").container, layout.mainContainer());
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, MainContainerCannotBeDestroyed)
{
    WidgetRegistry registry;
    DockLayout layout(registry);

    EXPECT_EQ(layout.destroyContainer(layout.mainContainer()).error, DockError::InvariantViolation);
    EXPECT_TRUE(layout.hasContainer(layout.mainContainer()));
    EXPECT_EQ(layout.closeContainer(layout.mainContainer()).error, DockError::InvalidTarget);
    EXPECT_TRUE(layout.hasContainer(layout.mainContainer()));
}

TEST(DockLayoutTests, SignalsFollowTheMutation)
{
    Docking::Tests::ensureCoreApp();

    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);

    QStringList states;
    QStringList actives;
    int changes = 0;
    QObject::connect(&layout, &DockLayout::widgetStateChanged, [&](const QString& id, DockWidgetState state) {
        states.push_back(id + QLatin1Char(':') + toString(state));
    });
    QObject::connect(&layout, &DockLayout::activeWidgetChanged,
                     [&](NodeId, const QString& id) { actives.push_back(id); });
    QObject::connect(&layout, &DockLayout::layoutChanged, [&](ContainerId) { ++changes; });

    const NodeId area = dockFirst(layout, "a");
    ASSERT_TRUE(layout.insertWidget("b", area).ok);
    ASSERT_TRUE(layout.removeWidget("b").ok);

    EXPECT_EQ(states, (QStringList{"a:docked", "b:docked", "b:hidden"}));
    EXPECT_EQ(actives, (QStringList{"a", "b", "a"}));
    EXPECT_EQ(changes, 3);
}

TEST(DockLayoutTests, LayoutContainerComputesGeometryFromRatios)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right, &bArea).ok);
    ASSERT_TRUE(layout.insertWidget("c", aArea).ok);

    ASSERT_TRUE(layout.layoutContainer(layout.mainContainer(), QRectF(0, 0, 204, 100), 24.0, 4.0).ok);

    EXPECT_EQ(layout.node(aArea)->geometry, QRectF(0, 0, 100, 100));
    EXPECT_EQ(layout.node(bArea)->geometry, QRectF(104, 0, 100, 100));
    EXPECT_EQ(layout.area(aArea)->tabBarGeometry, QRectF(0, 0, 100, 24));
    ASSERT_EQ(layout.area(aArea)->tabGeometries.size(), 2);
    EXPECT_EQ(layout.area(aArea)->tabGeometries.at(1), QRectF(50, 0, 50, 24));
    EXPECT_EQ(layout.container(layout.mainContainer())->geometry, QRect(0, 0, 204, 100));
}

TEST(DockLayoutTests, CaptureAndApplyBlueprint)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b", "c", "f"});
    DockLayout layout(registry);

    const NodeId aArea = dockFirst(layout, "a");
    NodeId bArea;
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Bottom, &bArea).ok);
    ASSERT_TRUE(layout.insertWidget("c", bArea, 0).ok);
    const ContainerId floating = layout.createFloatingContainer(QRect(5, 6, 70, 80));
    ASSERT_TRUE(layout.addWidgetToContainer("f", floating, DockSide::Right).ok);

    const LayoutBlueprint captured = layout.capture();

    WidgetRegistry otherRegistry;
    registerWidgets(otherRegistry, {"a", "b", "c", "f"});
    DockLayout other(otherRegistry);
    ASSERT_TRUE(other.applyBlueprint(captured).ok);

    EXPECT_TRUE(fuzzyEquals(other.capture(), captured)) << qPrintable(describe(other.capture()));
    EXPECT_EQ(other.floatingContainerIds().size(), 1);
    EXPECT_EQ(otherRegistry.state("f"), DockWidgetState::Floating);
    EXPECT_TRUE(layoutIsConsistent(other));
}

TEST(DockLayoutTests, ValidateBlueprintLeavesLayoutAlone)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);
    dockFirst(layout, "a");
    const QString before = describeMain(layout);

    LayoutBlueprint unknown;
    unknown.main.root = NodeBlueprint::area({"ghost"});
    const DockResult rejected = layout.validateBlueprint(unknown);
    EXPECT_EQ(rejected.error, DockError::InvariantViolation);
    EXPECT_EQ(rejected.errors.size(), 1);

    LayoutBlueprint onlyB;
    onlyB.main.root = NodeBlueprint::area({"b"});
    EXPECT_TRUE(layout.validateBlueprint(onlyB).ok);

    EXPECT_EQ(describeMain(layout), before);
    EXPECT_EQ(registry.state("b"), DockWidgetState::Hidden);
}

TEST(DockLayoutTests, ApplyBlueprintRejectsInvalidInput)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);
    dockFirst(layout, "a");
    const QString before = describeMain(layout);

    LayoutBlueprint duplicate;
    duplicate.main.root = NodeBlueprint::splitter(Qt::Horizontal,
                                                  {NodeBlueprint::area({"a"}), NodeBlueprint::area({"a", "b"})});
    EXPECT_EQ(layout.applyBlueprint(duplicate).error, DockError::InvariantViolation);

    LayoutBlueprint unknown;
    unknown.main.root = NodeBlueprint::area({"ghost"});
    EXPECT_EQ(layout.applyBlueprint(unknown).error, DockError::InvariantViolation);

    LayoutBlueprint nested;
    nested.main.root = NodeBlueprint::splitter(
        Qt::Horizontal,
        {NodeBlueprint::area({"a"}),
         NodeBlueprint::splitter(Qt::Horizontal, {NodeBlueprint::area({"b"}), NodeBlueprint::area({"b"})})});
    EXPECT_EQ(layout.applyBlueprint(nested).error, DockError::InvariantViolation);

    EXPECT_EQ(describeMain(layout), before);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, ApplyBlueprintHidesMissingWidgets)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "b"});
    DockLayout layout(registry);
    const NodeId aArea = dockFirst(layout, "a");
    ASSERT_TRUE(layout.splitArea(aArea, "b", DockSide::Right).ok);

    LayoutBlueprint onlyB;
    onlyB.main.root = NodeBlueprint::area({"b"});
    ASSERT_TRUE(layout.applyBlueprint(onlyB).ok);

    EXPECT_EQ(registry.state("a"), DockWidgetState::Hidden);
    EXPECT_EQ(registry.state("b"), DockWidgetState::Docked);
    EXPECT_EQ(describeMain(layout), QStringLiteral("A(*b)"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST(DockLayoutTests, DumpNamesEveryContainer)
{
    WidgetRegistry registry;
    registerWidgets(registry, {"a", "f"});
    DockLayout layout(registry);
    dockFirst(layout, "a");
    const ContainerId floating = layout.createFloatingContainer(QRect(1, 2, 3, 4));
    ASSERT_TRUE(layout.addWidgetToContainer("f", floating, DockSide::Right).ok);

    const QString text = layout.dump();
    EXPECT_TRUE(text.contains(QStringLiteral("(main)")));
    EXPECT_TRUE(text.contains(QStringLiteral("(floating) 1,2 3x4")));
    EXPECT_TRUE(text.contains(QStringLiteral("[*a]")));
    EXPECT_TRUE(text.contains(QStringLiteral("[*f]")));
}
