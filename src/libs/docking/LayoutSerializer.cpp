// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/LayoutSerializer.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QJsonValue>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSet>

#include <cmath>
#include <limits>

Q_LOGGING_CATEGORY(serializerlog, "docking.serializer")

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

const QString kVersionKey = u"version"_s;
const QString kMainKey = u"main"_s;
const QString kFloatingKey = u"floating"_s;
const QString kRootKey = u"root"_s;
const QString kGeometryKey = u"geometry"_s;
const QString kVisibleKey = u"visible"_s;
const QString kKindKey = u"kind"_s;
const QString kWidgetIdsKey = u"widgetIds"_s;
const QString kActiveIndexKey = u"activeIndex"_s;
const QString kOrientationKey = u"orientation"_s;
const QString kRatiosKey = u"ratios"_s;
const QString kChildrenKey = u"children"_s;

const QString kAreaKind = u"area"_s;
const QString kSplitterKind = u"splitter"_s;

bool isInteger(const QJsonValue& value)
{
    if (!value.isDouble())
        return false;
    const double d = value.toDouble();
    return std::isfinite(d) && std::floor(d) == d && d >= double(std::numeric_limits<int>::min())
           && d <= double(std::numeric_limits<int>::max());
}

QJsonObject geometryObject(const QRect& rect)
{
    QJsonObject obj;
    obj.insert(u"x"_s, rect.x());
    obj.insert(u"y"_s, rect.y());
    obj.insert(u"width"_s, rect.width());
    obj.insert(u"height"_s, rect.height());
    return obj;
}

bool parseGeometry(const QJsonValue& value, QRect& out)
{
    if (!value.isObject())
        return false;
    const QJsonObject obj = value.toObject();
    const QJsonValue x = obj.value(u"x"_s);
    const QJsonValue y = obj.value(u"y"_s);
    const QJsonValue w = obj.value(u"width"_s);
    const QJsonValue h = obj.value(u"height"_s);
    if (!isInteger(x) || !isInteger(y) || !isInteger(w) || !isInteger(h))
        return false;
    if (w.toInt() < 0 || h.toInt() < 0)
        return false;
    out = QRect(x.toInt(), y.toInt(), w.toInt(), h.toInt());
    return true;
}

QJsonObject nodeObject(const NodeBlueprint& node)
{
    QJsonObject obj;
    if (node.isArea()) {
        obj.insert(kKindKey, kAreaKind);
        obj.insert(kWidgetIdsKey, QJsonArray::fromStringList(node.widgetIds));
        obj.insert(kActiveIndexKey, node.activeIndex);
        return obj;
    }

    QJsonArray ratios;
    for (double r : node.ratios)
        ratios.push_back(r);

    QJsonArray children;
    for (const NodeBlueprint& child : node.children)
        children.push_back(nodeObject(child));

    obj.insert(kKindKey, kSplitterKind);
    obj.insert(kOrientationKey, orientationToString(node.orientation));
    obj.insert(kRatiosKey, ratios);
    obj.insert(kChildrenKey, children);
    return obj;
}

struct ParseContext final {
    const LayoutSerializer::WidgetFilter& accept;
    QStringList errors;
    QStringList dropped;
    QSet<QString> seen;
};

// Returns nullopt both for malformed nodes (an error is recorded) and for
// nodes left without widgets, whether listed empty or filtered out.
std::optional<NodeBlueprint> parseNode(const QJsonValue& value, const QString& path, ParseContext& ctx)
{
    if (!value.isObject()) {
        ctx.errors.push_back(QStringLiteral("%1 must be an object.").arg(path));
        return std::nullopt;
    }

    const QJsonObject obj = value.toObject();
    const QString kind = obj.value(kKindKey).toString();

    if (kind == kAreaKind) {
        const QJsonValue idsValue = obj.value(kWidgetIdsKey);
        if (!idsValue.isArray()) {
            ctx.errors.push_back(QStringLiteral("%1.widgetIds must be an array.").arg(path));
            return std::nullopt;
        }

        QStringList ids;
        const QJsonArray idsArray = idsValue.toArray();
        for (int i = 0; i < idsArray.size(); ++i) {
            const QString id = idsArray.at(i).toString();
            if (!idsArray.at(i).isString() || id.isEmpty()) {
                ctx.errors.push_back(QStringLiteral("%1.widgetIds[%2] must be a non-empty string.").arg(path).arg(i));
                return std::nullopt;
            }
            if (ctx.seen.contains(id)) {
                ctx.errors.push_back(QStringLiteral("%1: widget id '%2' appears more than once.").arg(path, id));
                return std::nullopt;
            }
            ctx.seen.insert(id);
            ids.push_back(id);
        }

        if (ids.isEmpty())
            return std::nullopt;

        const QJsonValue activeValue = obj.value(kActiveIndexKey);
        if (!isInteger(activeValue) || activeValue.toInt() < 0 || activeValue.toInt() >= ids.size()) {
            ctx.errors.push_back(QStringLiteral("%1.activeIndex is missing or out of range.").arg(path));
            return std::nullopt;
        }
        const int active = activeValue.toInt();

        // Keep the active widget if it survives, else the next survivor at
        // its position, else the last survivor.
        QStringList kept;
        int keptActive = -1;
        for (int i = 0; i < ids.size(); ++i) {
            if (!ctx.accept || ctx.accept(ids.at(i))) {
                if (i >= active && keptActive < 0)
                    keptActive = int(kept.size());
                kept.push_back(ids.at(i));
            }
            else {
                ctx.dropped.push_back(ids.at(i));
            }
        }

        if (kept.isEmpty())
            return std::nullopt;
        if (keptActive < 0)
            keptActive = int(kept.size()) - 1;
        return NodeBlueprint::area(kept, keptActive);
    }

    if (kind == kSplitterKind) {
        const std::optional<Qt::Orientation> orientation = orientationFromString(obj.value(kOrientationKey).toString());
        if (!orientation) {
            ctx.errors.push_back(QStringLiteral("%1.orientation must be \"horizontal\" or \"vertical\".").arg(path));
            return std::nullopt;
        }

        const QJsonValue ratiosValue = obj.value(kRatiosKey);
        const QJsonValue childrenValue = obj.value(kChildrenKey);
        if (!ratiosValue.isArray() || !childrenValue.isArray()) {
            ctx.errors.push_back(QStringLiteral("%1 must carry ratios and children arrays.").arg(path));
            return std::nullopt;
        }

        const QJsonArray ratiosArray = ratiosValue.toArray();
        const QJsonArray childrenArray = childrenValue.toArray();
        if (ratiosArray.size() != childrenArray.size() || childrenArray.isEmpty()) {
            ctx.errors.push_back(QStringLiteral("%1: %2 ratios for %3 children.")
                                     .arg(path)
                                     .arg(ratiosArray.size())
                                     .arg(childrenArray.size()));
            return std::nullopt;
        }

        std::vector<NodeBlueprint> children;
        QVector<double> ratios;
        for (int i = 0; i < childrenArray.size(); ++i) {
            const QJsonValue r = ratiosArray.at(i);
            if (!r.isDouble() || !std::isfinite(r.toDouble()) || r.toDouble() < 0.0) {
                ctx.errors.push_back(QStringLiteral("%1.ratios[%2] must be a non-negative number.").arg(path).arg(i));
                return std::nullopt;
            }

            const qsizetype errorsBefore = ctx.errors.size();
            std::optional<NodeBlueprint> child =
                parseNode(childrenArray.at(i), QStringLiteral("%1.children[%2]").arg(path).arg(i), ctx);
            if (ctx.errors.size() != errorsBefore)
                return std::nullopt;
            if (!child)
                continue;

            children.push_back(std::move(*child));
            ratios.push_back(r.toDouble());
        }

        if (children.empty())
            return std::nullopt;
        return NodeBlueprint::splitter(*orientation, std::move(children), ratios);
    }

    ctx.errors.push_back(QStringLiteral("%1.kind must be \"area\" or \"splitter\".").arg(path));
    return std::nullopt;
}

std::optional<NodeBlueprint> parseRoot(const QJsonValue& value, const QString& path, ParseContext& ctx)
{
    std::optional<NodeBlueprint> node = parseNode(value, path, ctx);
    if (!node)
        return std::nullopt;
    return normalized(std::move(*node));
}

// Version 1 node: {"type":"Splitter","orientation":"-"|"|","sizes":[..],"children":[..]}
//              or {"type":"Area","widgets":[..],"current":"id"}
QJsonValue upgradeNodeV1(const QJsonValue& value, const QString& path, QStringList& errors)
{
    if (!value.isObject()) {
        errors.push_back(QStringLiteral("%1 must be an object.").arg(path));
        return QJsonValue();
    }

    const QJsonObject obj = value.toObject();
    const QString type = obj.value(u"type"_s).toString();

    if (type == u"Area"_s) {
        const QJsonArray widgets = obj.value(u"widgets"_s).toArray();
        const QString current = obj.value(u"current"_s).toString();

        int active = 0;
        for (int i = 0; i < widgets.size(); ++i) {
            if (widgets.at(i).toString() == current)
                active = i;
        }

        QJsonObject out;
        out.insert(kKindKey, kAreaKind);
        out.insert(kWidgetIdsKey, widgets);
        out.insert(kActiveIndexKey, active);
        return out;
    }

    if (type == u"Splitter"_s) {
        const QString orientation = obj.value(u"orientation"_s).toString();
        if (orientation != u"-"_s && orientation != u"|"_s) {
            errors.push_back(QStringLiteral("%1.orientation must be \"-\" or \"|\".").arg(path));
            return QJsonValue();
        }

        // Pixel sizes become ratios; the loader normalizes them.
        QJsonArray ratios;
        for (const QJsonValue& size : obj.value(u"sizes"_s).toArray())
            ratios.push_back(size.toDouble(-1.0));

        QJsonArray children;
        const QJsonArray v1Children = obj.value(u"children"_s).toArray();
        for (int i = 0; i < v1Children.size(); ++i)
            children.push_back(upgradeNodeV1(v1Children.at(i), QStringLiteral("%1.children[%2]").arg(path).arg(i), errors));

        QJsonObject out;
        out.insert(kKindKey, kSplitterKind);
        out.insert(kOrientationKey, orientationToString(orientation == u"-"_s ? Qt::Horizontal : Qt::Vertical));
        out.insert(kRatiosKey, ratios);
        out.insert(kChildrenKey, children);
        return out;
    }

    errors.push_back(QStringLiteral("%1.type must be \"Area\" or \"Splitter\".").arg(path));
    return QJsonValue();
}

} // namespace

QJsonObject LayoutSerializer::serialize(const LayoutBlueprint& layout)
{
    QJsonObject main;
    main.insert(kRootKey, layout.main.root ? QJsonValue(nodeObject(*layout.main.root)) : QJsonValue(QJsonValue::Null));

    QJsonArray floating;
    for (const ContainerBlueprint& c : layout.floating) {
        if (!c.root)
            continue;
        QJsonObject obj;
        obj.insert(kGeometryKey, geometryObject(c.geometry));
        obj.insert(kVisibleKey, c.visible);
        obj.insert(kRootKey, nodeObject(*c.root));
        floating.push_back(obj);
    }

    QJsonObject json;
    json.insert(kVersionKey, kCurrentVersion);
    json.insert(kMainKey, main);
    json.insert(kFloatingKey, floating);
    return json;
}

QByteArray LayoutSerializer::toBytes(const LayoutBlueprint& layout)
{
    return QJsonDocument(serialize(layout)).toJson(QJsonDocument::Compact);
}

QJsonObject LayoutSerializer::upgradeFromV1(const QJsonObject& json, QStringList& errors)
{
    const QJsonValue containersValue = json.value(u"containers"_s);
    if (!containersValue.isArray()) {
        errors.push_back(QStringLiteral("containers must be an array."));
        return {};
    }

    QJsonObject main;
    main.insert(kRootKey, QJsonValue(QJsonValue::Null));
    bool haveMain = false;
    QJsonArray floating;

    const QJsonArray containers = containersValue.toArray();
    for (int i = 0; i < containers.size(); ++i) {
        const QString path = QStringLiteral("containers[%1]").arg(i);
        const QJsonObject c = containers.at(i).toObject();
        const QJsonValue rootValue = c.value(kRootKey);
        const QJsonValue root = rootValue.isNull() || rootValue.isUndefined()
                                    ? QJsonValue(QJsonValue::Null)
                                    : upgradeNodeV1(rootValue, path + u".root"_s, errors);

        if (!c.value(u"floating"_s).toBool()) {
            if (haveMain) {
                errors.push_back(QStringLiteral("%1: more than one main container.").arg(path));
                continue;
            }
            haveMain = true;
            main.insert(kRootKey, root);
            continue;
        }

        const QJsonArray g = c.value(kGeometryKey).toArray();
        if (g.size() != 4) {
            errors.push_back(QStringLiteral("%1.geometry must be [x, y, w, h].").arg(path));
            continue;
        }
        if (root.isNull())
            continue;

        QJsonObject out;
        out.insert(kGeometryKey,
                   geometryObject(QRect(g.at(0).toInt(), g.at(1).toInt(), g.at(2).toInt(), g.at(3).toInt())));
        out.insert(kVisibleKey, true);
        out.insert(kRootKey, root);
        floating.push_back(out);
    }

    QJsonObject upgraded;
    upgraded.insert(kVersionKey, kCurrentVersion);
    upgraded.insert(kMainKey, main);
    upgraded.insert(kFloatingKey, floating);
    return upgraded;
}

DockResult LayoutSerializer::deserialize(const QJsonObject& json,
                                         const WidgetFilter& accept,
                                         LayoutBlueprint& out,
                                         QStringList* outDropped)
{
    // Compared as a double so that versions beyond int still read as newer.
    const QJsonValue versionValue = json.value(kVersionKey);
    const double versionNumber = versionValue.toDouble();
    if (!versionValue.isDouble() || !std::isfinite(versionNumber) || std::floor(versionNumber) != versionNumber
        || versionNumber < 1.0)
        return DockResult::failure(DockError::CorruptLayout, QStringLiteral("version must be a positive integer."));

    if (versionNumber > double(kCurrentVersion)) {
        qCWarning(serializerlog) << "Layout version" << versionNumber << "is newer than" << kCurrentVersion;
        return DockResult::failure(DockError::UnsupportedVersion,
                                   QStringLiteral("Unsupported layout version: %1 (newest known is %2).")
                                       .arg(versionNumber, 0, 'f', 0)
                                       .arg(kCurrentVersion));
    }
    const int version = int(versionNumber);

    QJsonObject doc = json;
    if (version == 1) {
        QStringList errors;
        doc = upgradeFromV1(json, errors);
        if (!errors.isEmpty())
            return DockResult::failure(DockError::CorruptLayout, errors);
        qCInfo(serializerlog) << "Upgraded layout document from version 1";
    }

    ParseContext ctx{accept, {}, {}, {}};
    LayoutBlueprint layout;

    const QJsonValue mainValue = doc.value(kMainKey);
    if (!mainValue.isObject()) {
        ctx.errors.push_back(QStringLiteral("main must be an object."));
    }
    else {
        const QJsonValue rootValue = mainValue.toObject().value(kRootKey);
        if (!rootValue.isNull() && !rootValue.isUndefined())
            layout.main.root = parseRoot(rootValue, u"main.root"_s, ctx);
    }

    const QJsonValue floatingValue = doc.value(kFloatingKey);
    if (!floatingValue.isUndefined() && !floatingValue.isArray()) {
        ctx.errors.push_back(QStringLiteral("floating must be an array."));
    }
    else {
        const QJsonArray floating = floatingValue.toArray();
        for (int i = 0; i < floating.size(); ++i) {
            const QString path = QStringLiteral("floating[%1]").arg(i);
            const QJsonObject obj = floating.at(i).toObject();

            ContainerBlueprint c;
            c.floating = true;
            if (!parseGeometry(obj.value(kGeometryKey), c.geometry)) {
                ctx.errors.push_back(QStringLiteral("%1.geometry must hold integer x, y, width and height.").arg(path));
                continue;
            }

            const QJsonValue visible = obj.value(kVisibleKey);
            if (!visible.isUndefined() && !visible.isBool()) {
                ctx.errors.push_back(QStringLiteral("%1.visible must be a boolean.").arg(path));
                continue;
            }
            c.visible = visible.toBool(true);

            const QJsonValue rootValue = obj.value(kRootKey);
            if (rootValue.isNull() || rootValue.isUndefined()) {
                ctx.errors.push_back(QStringLiteral("%1.root is missing.").arg(path));
                continue;
            }

            c.root = parseRoot(rootValue, path + u".root"_s, ctx);
            if (c.root)
                layout.floating.push_back(std::move(c));
        }
    }

    if (!ctx.errors.isEmpty()) {
        qCWarning(serializerlog).noquote() << "Corrupt layout:" << ctx.errors.join(u"; "_s);
        return DockResult::failure(DockError::CorruptLayout, ctx.errors);
    }

    if (!ctx.dropped.isEmpty())
        qCWarning(serializerlog) << "Dropped unknown dock widgets from layout:" << ctx.dropped;

    if (outDropped)
        *outDropped = ctx.dropped;
    out = std::move(layout);
    return DockResult::success();
}

DockResult LayoutSerializer::fromBytes(const QByteArray& bytes,
                                       const WidgetFilter& accept,
                                       LayoutBlueprint& out,
                                       QStringList* outDropped)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return DockResult::failure(DockError::CorruptLayout,
                                   QStringLiteral("Layout is not valid JSON: %1 at offset %2.")
                                       .arg(parseError.errorString())
                                       .arg(parseError.offset));
    }
    if (!doc.isObject())
        return DockResult::failure(DockError::CorruptLayout, QStringLiteral("Layout document must be a JSON object."));

    return deserialize(doc.object(), accept, out, outDropped);
}

} // namespace Docking
