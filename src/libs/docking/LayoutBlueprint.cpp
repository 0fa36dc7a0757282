// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/LayoutBlueprint.hpp"

#include <algorithm>
#include <cmath>

namespace Docking {

namespace {

QVector<double> normalizedRatios(QVector<double> ratios, qsizetype count)
{
    if (ratios.size() != count)
        ratios = QVector<double>(count, 1.0);

    double sum = 0.0;
    for (double& r : ratios) {
        if (!std::isfinite(r) || r < 0.0)
            r = 0.0;
        sum += r;
    }

    if (sum <= 0.0) {
        std::fill(ratios.begin(), ratios.end(), count > 0 ? 1.0 / double(count) : 0.0);
        return ratios;
    }

    for (double& r : ratios)
        r /= sum;
    return ratios;
}

} // namespace

NodeBlueprint NodeBlueprint::area(QStringList ids, int active)
{
    NodeBlueprint n;
    n.kind = Kind::Area;
    n.widgetIds = std::move(ids);
    n.activeIndex = active;
    return n;
}

NodeBlueprint NodeBlueprint::splitter(Qt::Orientation orientation,
                                      std::vector<NodeBlueprint> children,
                                      QVector<double> ratios)
{
    NodeBlueprint n;
    n.kind = Kind::Splitter;
    n.orientation = orientation;
    if (ratios.isEmpty())
        ratios = QVector<double>(qsizetype(children.size()), 1.0);
    n.ratios = std::move(ratios);
    n.children = std::move(children);
    return n;
}

std::optional<NodeBlueprint> normalized(NodeBlueprint node)
{
    if (node.isArea()) {
        if (node.widgetIds.isEmpty())
            return std::nullopt;
        node.activeIndex = std::clamp(node.activeIndex, 0, int(node.widgetIds.size()) - 1);
        node.ratios.clear();
        node.children.clear();
        return node;
    }

    const QVector<double> inRatios = normalizedRatios(node.ratios, qsizetype(node.children.size()));

    std::vector<NodeBlueprint> outChildren;
    QVector<double> outRatios;
    for (size_t i = 0; i < node.children.size(); ++i) {
        std::optional<NodeBlueprint> child = normalized(std::move(node.children[i]));
        if (!child)
            continue;

        const double share = inRatios.at(qsizetype(i));
        if (child->isSplitter() && child->orientation == node.orientation) {
            for (size_t j = 0; j < child->children.size(); ++j) {
                outChildren.push_back(std::move(child->children[j]));
                outRatios.push_back(share * child->ratios.at(qsizetype(j)));
            }
            continue;
        }

        outChildren.push_back(std::move(*child));
        outRatios.push_back(share);
    }

    if (outChildren.empty())
        return std::nullopt;
    if (outChildren.size() == 1)
        return std::move(outChildren.front());

    node.children = std::move(outChildren);
    node.ratios = normalizedRatios(std::move(outRatios), qsizetype(node.children.size()));
    node.widgetIds.clear();
    node.activeIndex = 0;
    return node;
}

void collectWidgetIds(const NodeBlueprint& node, QStringList& out)
{
    if (node.isArea()) {
        out.append(node.widgetIds);
        return;
    }
    for (const NodeBlueprint& child : node.children)
        collectWidgetIds(child, out);
}

bool fuzzyEquals(const NodeBlueprint& a, const NodeBlueprint& b, double tolerance)
{
    if (a.kind != b.kind)
        return false;

    if (a.isArea())
        return a.widgetIds == b.widgetIds && a.activeIndex == b.activeIndex;

    if (a.orientation != b.orientation || a.children.size() != b.children.size()
        || a.ratios.size() != b.ratios.size())
        return false;

    for (qsizetype i = 0; i < a.ratios.size(); ++i) {
        if (std::abs(a.ratios.at(i) - b.ratios.at(i)) > tolerance)
            return false;
    }

    for (size_t i = 0; i < a.children.size(); ++i) {
        if (!fuzzyEquals(a.children[i], b.children[i], tolerance))
            return false;
    }
    return true;
}

bool fuzzyEquals(const ContainerBlueprint& a, const ContainerBlueprint& b, double tolerance)
{
    if (a.floating != b.floating || a.visible != b.visible)
        return false;
    if (a.floating && a.geometry != b.geometry)
        return false;
    if (a.root.has_value() != b.root.has_value())
        return false;
    return !a.root || fuzzyEquals(*a.root, *b.root, tolerance);
}

bool fuzzyEquals(const LayoutBlueprint& a, const LayoutBlueprint& b, double tolerance)
{
    if (!fuzzyEquals(a.main, b.main, tolerance) || a.floating.size() != b.floating.size())
        return false;

    for (qsizetype i = 0; i < a.floating.size(); ++i) {
        if (!fuzzyEquals(a.floating.at(i), b.floating.at(i), tolerance))
            return false;
    }
    return true;
}

QString describe(const NodeBlueprint& node)
{
    if (node.isArea()) {
        QStringList tabs;
        for (int i = 0; i < node.widgetIds.size(); ++i)
            tabs.push_back(i == node.activeIndex ? QStringLiteral("*") + node.widgetIds.at(i) : node.widgetIds.at(i));
        return QStringLiteral("A(%1)").arg(tabs.join(QLatin1Char(',')));
    }

    QStringList parts;
    for (size_t i = 0; i < node.children.size(); ++i) {
        const double ratio = qsizetype(i) < node.ratios.size() ? node.ratios.at(qsizetype(i)) : 0.0;
        parts.push_back(QStringLiteral("%1:%2").arg(ratio, 0, 'f', 3).arg(describe(node.children[i])));
    }
    return QStringLiteral("%1[%2]")
        .arg(node.orientation == Qt::Horizontal ? QStringLiteral("H") : QStringLiteral("V"))
        .arg(parts.join(QLatin1Char(' ')));
}

QString describe(const LayoutBlueprint& layout)
{
    QStringList parts;
    parts.push_back(QStringLiteral("main=%1").arg(layout.main.root ? describe(*layout.main.root) : QStringLiteral("-")));
    for (const ContainerBlueprint& c : layout.floating) {
        parts.push_back(QStringLiteral("float(%1,%2 %3x%4)=%5")
                            .arg(c.geometry.x())
                            .arg(c.geometry.y())
                            .arg(c.geometry.width())
                            .arg(c.geometry.height())
                            .arg(c.root ? describe(*c.root) : QStringLiteral("-")));
    }
    return parts.join(QLatin1Char(' '));
}

} // namespace Docking
