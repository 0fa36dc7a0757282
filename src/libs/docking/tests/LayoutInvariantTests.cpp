// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "DockingTestSupport.hpp"

#include "docking/DockLayout.hpp"
#include "docking/WidgetRegistry.hpp"

#include <random>

using namespace Docking;
using Docking::Tests::layoutIsConsistent;
using Docking::Tests::registerWidgets;

namespace {

constexpr int kWidgetCount = 12;
constexpr int kSteps = 600;

const DockSide kSides[] = {DockSide::Left, DockSide::Right, DockSide::Top, DockSide::Bottom};
const DropZone kZones[] = {DropZone::Left, DropZone::Right, DropZone::Top, DropZone::Bottom, DropZone::Center};

class RandomLayoutDriver final
{
public:
    RandomLayoutDriver(DockLayout& layout, unsigned seed)
        : m_layout(layout)
        , m_rng(seed)
    {}

    void step()
    {
        const QStringList& ids = m_layout.registry().ids();
        const QString widget = ids.at(pick(int(ids.size())));
        const QVector<NodeId> areas = m_layout.allAreas();
        const NodeId target = areas.isEmpty() ? NodeId{} : areas.at(pick(int(areas.size())));

        DockResult r;
        switch (pick(7)) {
            case 0:
                r = target.isValid() ? m_layout.insertWidget(widget, target, pick(4) - 1)
                                     : m_layout.addWidgetToContainer(widget, m_layout.mainContainer(), side());
                break;
            case 1:
                r = target.isValid() ? m_layout.splitArea(target, widget, side())
                                     : m_layout.addWidgetToContainer(widget, m_layout.mainContainer(), side());
                break;
            case 2:
                r = m_layout.removeWidget(widget);
                break;
            case 3: {
                const NodeId source = areas.isEmpty() ? NodeId{} : areas.at(pick(int(areas.size())));
                const ContainerId destination = target.isValid() ? m_layout.containerOf(target) : m_layout.mainContainer();
                r = m_layout.moveArea(source, destination, target, zone());
                break;
            }
            case 4: {
                const ContainerId floating = m_layout.createFloatingContainer(QRect(pick(500), pick(500), 200, 150));
                r = m_layout.addWidgetToContainer(widget, floating, side());
                if (!r)
                    r = m_layout.destroyContainer(floating);
                break;
            }
            case 5: {
                const QVector<ContainerId> floating = m_layout.floatingContainerIds();
                if (floating.isEmpty())
                    break;
                const ContainerId source = floating.at(pick(int(floating.size())));
                const NodeId mainTarget = m_layout.areas(m_layout.mainContainer()).value(0);
                r = m_layout.mergeContainer(source, m_layout.mainContainer(), mainTarget, zone());
                break;
            }
            case 6:
                r = m_layout.addWidgetToContainer(widget, m_layout.mainContainer(), side());
                break;
        }

        // Rejections are fine; corrupting the layout is not.
        EXPECT_NE(r.error, DockError::InvariantViolation) << r.message().toStdString();
    }

private:
    int pick(int n) { return std::uniform_int_distribution<int>(0, n - 1)(m_rng); }
    DockSide side() { return kSides[pick(4)]; }
    DropZone zone() { return kZones[pick(5)]; }

    DockLayout& m_layout;
    std::mt19937 m_rng;
};

QStringList widgetIds()
{
    QStringList ids;
    for (int i = 0; i < kWidgetCount; ++i)
        ids.push_back(QStringLiteral("w%1").arg(i));
    return ids;
}

void expectNoEmptyAreasOrThinSplitters(const DockLayout& layout)
{
    for (NodeId id : layout.allAreas())
        EXPECT_FALSE(layout.area(id)->widgetIds.isEmpty());

    for (ContainerId c : layout.containerIds()) {
        QVector<NodeId> pending{layout.rootOf(c)};
        while (!pending.isEmpty()) {
            const NodeId id = pending.takeLast();
            const SplitterNode* s = layout.splitter(id);
            if (!s)
                continue;
            EXPECT_GE(s->children.size(), 2);
            for (NodeId child : s->children) {
                const SplitterNode* inner = layout.splitter(child);
                if (inner)
                    EXPECT_NE(inner->orientation, s->orientation);
                pending.push_back(child);
            }
        }
    }
}

} // namespace

TEST(LayoutInvariantTests, RandomEditsKeepTreesWellFormed)
{
    for (unsigned seed : {1u, 7u, 42u, 1234u}) {
        WidgetRegistry registry;
        registerWidgets(registry, widgetIds());
        DockLayout layout(registry);
        RandomLayoutDriver driver(layout, seed);

        for (int i = 0; i < kSteps; ++i) {
            driver.step();
            ASSERT_TRUE(layoutIsConsistent(layout)) << "seed " << seed << " step " << i;
        }
        expectNoEmptyAreasOrThinSplitters(layout);

        // Every floating container still holds a tree.
        for (ContainerId id : layout.floatingContainerIds())
            EXPECT_FALSE(layout.container(id)->isEmpty());
    }
}

TEST(LayoutInvariantTests, CaptureApplyIsStableAfterRandomEdits)
{
    WidgetRegistry registry;
    registerWidgets(registry, widgetIds());
    DockLayout layout(registry);
    RandomLayoutDriver driver(layout, 99u);

    for (int i = 0; i < 200; ++i)
        driver.step();

    const LayoutBlueprint captured = layout.capture();
    ASSERT_TRUE(layout.applyBlueprint(captured).ok);
    EXPECT_TRUE(fuzzyEquals(layout.capture(), captured)) << qPrintable(describe(captured));
    EXPECT_TRUE(layoutIsConsistent(layout));
}
