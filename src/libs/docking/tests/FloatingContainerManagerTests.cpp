// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/DockLayout.hpp"
#include "docking/FloatingContainerManager.hpp"
#include "docking/WidgetRegistry.hpp"

using namespace Docking;
using Docking::Tests::describeContainer;
using Docking::Tests::describeMain;
using Docking::Tests::layoutIsConsistent;
using Docking::Tests::registerWidgets;

namespace {

// Main container holding H[a | b].
class FloatingContainerManagerTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registerWidgets(registry, {"a", "b", "c", "x", "y"});
        ASSERT_TRUE(layout.addWidgetToContainer("a", layout.mainContainer(), DockSide::Right, &areaA).ok);
        ASSERT_TRUE(layout.splitArea(areaA, "b", DockSide::Right, &areaB).ok);
    }

    // Floating window holding H[x | y].
    ContainerId floatPair()
    {
        ContainerId created;
        EXPECT_TRUE(floating.floatWidget("x", QPoint(500, 0), QSize(200, 100), &created).ok);
        EXPECT_TRUE(layout.splitArea(layout.areaOf("x"), "y", DockSide::Right).ok);
        return created;
    }

    WidgetRegistry registry;
    DockLayout layout{registry};
    FloatingContainerManager floating{layout};
    NodeId areaA;
    NodeId areaB;
};

} // namespace

TEST_F(FloatingContainerManagerTests, DetachMovesAreaIntoNewWindow)
{
    ContainerId created;
    ASSERT_TRUE(floating.detach(areaB, QPoint(100, 120), QSize(300, 200), &created).ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("A(*a)"));
    ASSERT_TRUE(layout.hasContainer(created));
    EXPECT_TRUE(layout.container(created)->floating);
    EXPECT_EQ(layout.container(created)->geometry, QRect(100, 120, 300, 200));
    EXPECT_EQ(layout.rootOf(created), areaB);
    EXPECT_EQ(registry.state("b"), DockWidgetState::Floating);
    EXPECT_EQ(floating.containers(), QVector<ContainerId>{created});
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST_F(FloatingContainerManagerTests, DetachOfWholeWindowOnlyMovesIt)
{
    ContainerId first;
    ASSERT_TRUE(floating.detach(areaB, QPoint(100, 120), QSize(300, 200), &first).ok);

    ContainerId second;
    ASSERT_TRUE(floating.detach(areaB, QPoint(40, 40), QSize(250, 150), &second).ok);

    EXPECT_EQ(first, second);
    EXPECT_EQ(floating.containers().size(), 1);
    EXPECT_EQ(layout.container(first)->geometry, QRect(40, 40, 250, 150));
}

TEST_F(FloatingContainerManagerTests, NonFloatableWidgetsStayDocked)
{
    registry.widget("b")->setFeature(DockWidgetFeature::Floatable, false);
    const QString before = describeMain(layout);

    EXPECT_EQ(floating.detach(areaB, QPoint(0, 0), QSize(100, 100)).error, DockError::InvalidTarget);
    EXPECT_EQ(floating.floatWidget("b", QPoint(0, 0), QSize(100, 100)).error, DockError::InvalidTarget);

    EXPECT_EQ(describeMain(layout), before);
    EXPECT_TRUE(floating.containers().isEmpty());
}

TEST_F(FloatingContainerManagerTests, UnknownItemsAreNotFound)
{
    EXPECT_EQ(floating.detach(NodeId{}, QPoint(0, 0), QSize(100, 100)).error, DockError::NotFound);
    EXPECT_EQ(floating.floatWidget("nope", QPoint(0, 0), QSize(100, 100)).error, DockError::NotFound);
    EXPECT_EQ(floating.show(ContainerId{}).error, DockError::NotFound);
    EXPECT_TRUE(floating.containers().isEmpty());
}

TEST_F(FloatingContainerManagerTests, FloatWidgetTakesOneTab)
{
    ASSERT_TRUE(layout.insertWidget("c", areaA).ok);

    ContainerId created;
    ASSERT_TRUE(floating.floatWidget("c", QPoint(10, 10), QSize(200, 100), &created).ok);

    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.500:A(*b)]"));
    EXPECT_EQ(describeContainer(layout, created), QStringLiteral("A(*c)"));
    EXPECT_EQ(registry.state("c"), DockWidgetState::Floating);

    // Floating the sole widget of a window again just moves the window.
    ContainerId again;
    ASSERT_TRUE(floating.floatWidget("c", QPoint(60, 60), QSize(200, 100), &again).ok);
    EXPECT_EQ(again, created);
    EXPECT_EQ(layout.container(created)->geometry, QRect(60, 60, 200, 100));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST_F(FloatingContainerManagerTests, ReattachCenterMergesTabs)
{
    ContainerId created;
    ASSERT_TRUE(floating.detach(areaB, QPoint(100, 120), QSize(300, 200), &created).ok);

    ASSERT_TRUE(floating.reattach(created, areaA, DropZone::Center).ok);

    EXPECT_FALSE(layout.hasContainer(created));
    EXPECT_EQ(describeMain(layout), QStringLiteral("A(a,*b)"));
    EXPECT_EQ(registry.state("b"), DockWidgetState::Docked);
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST_F(FloatingContainerManagerTests, ReattachOnOuterEdgeFlattens)
{
    const ContainerId created = floatPair();
    ASSERT_EQ(describeContainer(layout, created), QStringLiteral("H[0.500:A(*x) 0.500:A(*y)]"));

    ASSERT_TRUE(floating.reattach(created, NodeId{}, DropZone::Right).ok);

    EXPECT_FALSE(layout.hasContainer(created));
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.333:A(*a) 0.333:A(*b) 0.167:A(*x) 0.167:A(*y)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST_F(FloatingContainerManagerTests, ReattachRejectsMainAndCenterWithoutTarget)
{
    const ContainerId created = floatPair();

    EXPECT_EQ(floating.reattach(layout.mainContainer(), areaA, DropZone::Center).error, DockError::InvalidTarget);
    EXPECT_EQ(floating.reattach(created, NodeId{}, DropZone::Center).error, DockError::InvalidTarget);
    EXPECT_TRUE(layout.hasContainer(created));
}

TEST_F(FloatingContainerManagerTests, DestroyNeedsAnEmptyFloatingWindow)
{
    const ContainerId created = floatPair();
    EXPECT_EQ(floating.destroyContainer(created).error, DockError::InvariantViolation);
    EXPECT_EQ(floating.destroyContainer(layout.mainContainer()).error, DockError::InvalidTarget);

    const ContainerId empty = layout.createFloatingContainer(QRect(0, 0, 50, 50));
    EXPECT_TRUE(floating.destroyContainer(empty).ok);
    EXPECT_FALSE(layout.hasContainer(empty));
}

TEST_F(FloatingContainerManagerTests, CloseHidesEveryWidget)
{
    const ContainerId created = floatPair();

    ASSERT_TRUE(floating.close(created).ok);

    EXPECT_FALSE(layout.hasContainer(created));
    EXPECT_EQ(registry.state("x"), DockWidgetState::Hidden);
    EXPECT_EQ(registry.state("y"), DockWidgetState::Hidden);
    EXPECT_EQ(describeMain(layout), QStringLiteral("H[0.500:A(*a) 0.500:A(*b)]"));
    EXPECT_TRUE(layoutIsConsistent(layout));
}

TEST_F(FloatingContainerManagerTests, CloseSignalsOnlyTheFinalState)
{
    Docking::Tests::ensureCoreApp();
    const ContainerId created = floatPair();

    QStringList states;
    bool sawHalfClosedWindow = false;
    int visibilityChanges = 0;
    int destroyed = 0;
    QObject::connect(&layout, &DockLayout::widgetStateChanged, [&](const QString& id, DockWidgetState state) {
        states.push_back(id + QLatin1Char(':') + toString(state));
        if (layout.hasContainer(created))
            sawHalfClosedWindow = true;
    });
    QObject::connect(&layout, &DockLayout::layoutChanged, [&](ContainerId id) {
        if (id == created)
            sawHalfClosedWindow = true;
    });
    QObject::connect(&layout, &DockLayout::containerVisibilityChanged,
                     [&](ContainerId, ContainerVisibility) { ++visibilityChanges; });
    QObject::connect(&layout, &DockLayout::containerDestroyed, [&](ContainerId id) {
        if (id == created)
            ++destroyed;
    });

    ASSERT_TRUE(floating.close(created).ok);

    EXPECT_EQ(states, (QStringList{"x:hidden", "y:hidden"}));
    EXPECT_FALSE(sawHalfClosedWindow);
    EXPECT_EQ(visibilityChanges, 0);
    EXPECT_EQ(destroyed, 1);
}

TEST_F(FloatingContainerManagerTests, CloseRefusesNonClosableWidgets)
{
    const ContainerId created = floatPair();
    registry.widget("y")->setFeature(DockWidgetFeature::Closable, false);

    EXPECT_EQ(floating.close(created).error, DockError::InvalidTarget);
    ASSERT_TRUE(layout.hasContainer(created));
    EXPECT_EQ(layout.container(created)->visibility, ContainerVisibility::Shown);
    EXPECT_EQ(registry.state("x"), DockWidgetState::Floating);
}

TEST_F(FloatingContainerManagerTests, ContainerAtFollowsStackingAndVisibility)
{
    ASSERT_TRUE(layout.setContainerGeometry(layout.mainContainer(), QRect(0, 0, 400, 300)).ok);

    ContainerId first;
    ContainerId second;
    ASSERT_TRUE(floating.floatWidget("x", QPoint(100, 100), QSize(100, 100), &first).ok);
    ASSERT_TRUE(floating.floatWidget("y", QPoint(100, 100), QSize(100, 100), &second).ok);

    EXPECT_EQ(floating.containerAt(QPointF(150, 150)), second);

    ASSERT_TRUE(floating.raise(first).ok);
    EXPECT_EQ(floating.containerAt(QPointF(150, 150)), first);

    ASSERT_TRUE(floating.hide(first).ok);
    EXPECT_EQ(floating.containerAt(QPointF(150, 150)), second);

    ASSERT_TRUE(floating.show(first).ok);
    EXPECT_EQ(floating.containerAt(QPointF(150, 150)), first);

    EXPECT_EQ(floating.containerAt(QPointF(20, 20)), layout.mainContainer());
    EXPECT_TRUE(floating.containerAt(QPointF(900, 900)).isNull());

    EXPECT_EQ(floating.raise(layout.mainContainer()).error, DockError::InvalidTarget);
    EXPECT_EQ(floating.hide(layout.mainContainer()).error, DockError::InvalidTarget);
}
