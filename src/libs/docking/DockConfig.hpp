// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QSize>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace Docking {

// Tunables of the drop resolver and of headless layout. Values read from
// settings are clamped to sane ranges.
struct DOCKING_EXPORT DockConfig final {
    // Outer fraction of an area, per axis, that splits instead of tabbing.
    double edgeFraction = 0.25;

    // Outer band of a container that splits the container root even when the
    // pointer is over an area.
    double containerEdgeFraction = 0.10;

    double tabBarHeight = 24.0;
    double splitterHandleWidth = 4.0;
    DropZones allowedZones = DropZone::AllZones;
    QSize defaultFloatingSize{400, 300};

#ifdef QT_DEBUG
    bool checkInvariantsAfterMutation = true;
#else
    bool checkInvariantsAfterMutation = false;
#endif

    bool isZoneAllowed(DropZone zone) const noexcept { return allowedZones.testFlag(zone); }

    static DockConfig defaults() { return DockConfig{}; }
    static DockConfig load(const QSettings& settings, const DockConfig& fallback = DockConfig{});
    void save(QSettings& settings) const;
};

DOCKING_EXPORT bool configEquals(const DockConfig& a, const DockConfig& b);

} // namespace Docking
