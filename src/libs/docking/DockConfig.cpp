// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockConfig.hpp"

#include <QtCore/QSettings>

#include <algorithm>
#include <cmath>

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

const QString kEdgeFractionKey = u"docking/edgeFraction"_s;
const QString kContainerEdgeFractionKey = u"docking/containerEdgeFraction"_s;
const QString kTabBarHeightKey = u"docking/tabBarHeight"_s;
const QString kSplitterHandleWidthKey = u"docking/splitterHandleWidth"_s;
const QString kAllowedZonesKey = u"docking/allowedZones"_s;
const QString kFloatingWidthKey = u"docking/defaultFloatingWidth"_s;
const QString kFloatingHeightKey = u"docking/defaultFloatingHeight"_s;
const QString kCheckInvariantsKey = u"docking/checkInvariants"_s;

constexpr double kMaxEdgeFraction = 0.5;
constexpr int kMinFloatingExtent = 50;

bool nearlyEqual(double a, double b)
{
    return std::abs(a - b) <= 1e-6;
}

double readDouble(const QSettings& settings, const QString& key, double fallback, double lo, double hi)
{
    if (!settings.contains(key))
        return fallback;

    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok || !std::isfinite(value))
        return fallback;
    return std::clamp(value, lo, hi);
}

} // namespace

DockConfig DockConfig::load(const QSettings& settings, const DockConfig& fallback)
{
    DockConfig config = fallback;

    config.edgeFraction = readDouble(settings, kEdgeFractionKey, fallback.edgeFraction, 0.0, kMaxEdgeFraction);
    config.containerEdgeFraction =
        readDouble(settings, kContainerEdgeFractionKey, fallback.containerEdgeFraction, 0.0, kMaxEdgeFraction);
    config.tabBarHeight = readDouble(settings, kTabBarHeightKey, fallback.tabBarHeight, 0.0, 200.0);
    config.splitterHandleWidth = readDouble(settings, kSplitterHandleWidthKey, fallback.splitterHandleWidth, 0.0, 50.0);

    if (settings.contains(kAllowedZonesKey)) {
        bool ok = false;
        const int bits = settings.value(kAllowedZonesKey).toInt(&ok);
        if (ok)
            config.allowedZones = DropZones::fromInt(bits & int(DropZone::AllZones));
    }

    const int width = settings.value(kFloatingWidthKey, fallback.defaultFloatingSize.width()).toInt();
    const int height = settings.value(kFloatingHeightKey, fallback.defaultFloatingSize.height()).toInt();
    config.defaultFloatingSize = QSize(std::max(width, kMinFloatingExtent), std::max(height, kMinFloatingExtent));

    config.checkInvariantsAfterMutation =
        settings.value(kCheckInvariantsKey, fallback.checkInvariantsAfterMutation).toBool();

    return config;
}

void DockConfig::save(QSettings& settings) const
{
    settings.setValue(kEdgeFractionKey, edgeFraction);
    settings.setValue(kContainerEdgeFractionKey, containerEdgeFraction);
    settings.setValue(kTabBarHeightKey, tabBarHeight);
    settings.setValue(kSplitterHandleWidthKey, splitterHandleWidth);
    settings.setValue(kAllowedZonesKey, int(allowedZones.toInt()));
    settings.setValue(kFloatingWidthKey, defaultFloatingSize.width());
    settings.setValue(kFloatingHeightKey, defaultFloatingSize.height());
    settings.setValue(kCheckInvariantsKey, checkInvariantsAfterMutation);
}

bool configEquals(const DockConfig& a, const DockConfig& b)
{
    return nearlyEqual(a.edgeFraction, b.edgeFraction)
           && nearlyEqual(a.containerEdgeFraction, b.containerEdgeFraction)
           && nearlyEqual(a.tabBarHeight, b.tabBarHeight)
           && nearlyEqual(a.splitterHandleWidth, b.splitterHandleWidth) && a.allowedZones == b.allowedZones
           && a.defaultFloatingSize == b.defaultFloatingSize
           && a.checkInvariantsAfterMutation == b.checkInvariantsAfterMutation;
}

} // namespace Docking
