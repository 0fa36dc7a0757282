// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockResult.hpp"
#include "docking/LayoutBlueprint.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QStringList>

#include <functional>

namespace Docking {

// JSON form of a LayoutBlueprint.
//
//   { "version": 2,
//     "main": { "root": Node | null },
//     "floating": [ { "geometry": {"x","y","width","height"}, "visible": bool, "root": Node } ] }
//
//   Node := { "kind": "area", "widgetIds": [..], "activeIndex": int }
//         | { "kind": "splitter", "orientation": "horizontal"|"vertical", "ratios": [..], "children": [..] }
//
// Version 1 documents are upgraded on load.
class DOCKING_EXPORT LayoutSerializer final
{
public:
    static constexpr int kCurrentVersion = 2;

    // Decides which widget ids survive a load. Ids it rejects are dropped
    // from their area; areas and splitters left empty are collapsed.
    using WidgetFilter = std::function<bool(const QString&)>;

    static QJsonObject serialize(const LayoutBlueprint& layout);
    static QByteArray toBytes(const LayoutBlueprint& layout);

    // Parses and validates the whole document before returning anything.
    // The blueprint comes back normalized. Dropped ids are reported through
    // outDropped when given.
    static DockResult deserialize(const QJsonObject& json,
                                  const WidgetFilter& accept,
                                  LayoutBlueprint& out,
                                  QStringList* outDropped = nullptr);

    static DockResult fromBytes(const QByteArray& bytes,
                                const WidgetFilter& accept,
                                LayoutBlueprint& out,
                                QStringList* outDropped = nullptr);

    // Rewrites a version 1 document in the current shape. Problems that make
    // the document unusable are appended to errors.
    static QJsonObject upgradeFromV1(const QJsonObject& json, QStringList& errors);
};

} // namespace Docking
