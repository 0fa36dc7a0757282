// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockManager.hpp"

#include "docking/LayoutSerializer.hpp"

#include <utils/Macros.hpp>

#include <QtCore/QLoggingCategory>
#include <QtCore/QSettings>

Q_LOGGING_CATEGORY(managerlog, "docking.manager")

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

const QString kPerspectivesGroup = u"Perspectives"_s;
const QString kPerspectiveNameKey = u"Name"_s;
const QString kPerspectiveStateKey = u"State"_s;

} // namespace

DockManager::DockManager(QObject* parent)
    : DockManager(DockConfig{}, parent)
{}

DockManager::DockManager(const DockConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_layout(m_registry)
    , m_floating(m_layout)
    , m_drag(m_layout, m_floating, m_config)
{
    m_layout.setInvariantChecksEnabled(m_config.checkInvariantsAfterMutation);
}

DockManager::~DockManager() = default;

void DockManager::setConfig(const DockConfig& config)
{
    m_config = config;
    m_layout.setInvariantChecksEnabled(m_config.checkInvariantsAfterMutation);
}

DockResult DockManager::registerWidget(const DockWidgetSpec& spec)
{
    const DockResult r = m_registry.add(spec);
    if (!r)
        qCWarning(managerlog).noquote() << r.message();
    return r;
}

DockResult DockManager::unregisterWidget(const QString& id)
{
    if (!m_registry.contains(id))
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(id));

    if (m_registry.location(id).isDocked())
        UTILS_TRY(m_layout.removeWidget(id));
    return m_registry.remove(id);
}

DockResult DockManager::addWidget(const QString& id, DockSide side, NodeId targetArea, NodeId* outArea)
{
    if (targetArea.isNull())
        return m_layout.addWidgetToContainer(id, m_layout.mainContainer(), side, outArea);
    return m_layout.splitArea(targetArea, id, side, outArea);
}

DockResult DockManager::addWidgetTab(const QString& id, NodeId targetArea, int index)
{
    return m_layout.insertWidget(id, targetArea, index);
}

DockResult DockManager::showWidget(const QString& id)
{
    const DockWidget* w = m_registry.widget(id);
    if (!w)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(id));

    const WidgetRegistry::Location loc = m_registry.location(id);
    if (loc.isDocked()) {
        const ContainerRecord* rec = m_layout.container(loc.container);
        if (rec && rec->floating && rec->visibility != ContainerVisibility::Shown)
            return m_floating.show(loc.container);
        return DockResult::success();
    }

    if (m_layout.isArea(w->lastArea()))
        return m_layout.insertWidget(id, w->lastArea());
    return m_layout.addWidgetToContainer(id, m_layout.mainContainer(), DockSide::Right);
}

DockResult DockManager::hideWidget(const QString& id)
{
    const DockWidget* w = m_registry.widget(id);
    if (!w)
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(id));
    if (!m_registry.location(id).isDocked())
        return DockResult::success();
    if (!w->isClosable())
        return DockResult::failure(DockError::InvalidTarget, QStringLiteral("Dock widget '%1' is not closable.").arg(id));

    return m_layout.removeWidget(id);
}

DockResult DockManager::floatWidget(const QString& id, const QPoint& screenPos, const QSize& size)
{
    return m_floating.floatWidget(id, screenPos, size.isEmpty() ? m_config.defaultFloatingSize : size);
}

NodeId DockManager::currentArea(const QString& id) const
{
    return m_registry.location(id).area;
}

DockWidgetState DockManager::widgetState(const QString& id) const
{
    return m_registry.state(id);
}

DockResult DockManager::updateContainerGeometry(ContainerId container, const QRect& geometry)
{
    UTILS_TRY(m_layout.setContainerGeometry(container, geometry));
    return m_layout.layoutContainer(container, QRectF(geometry), m_config.tabBarHeight, m_config.splitterHandleWidth);
}

QByteArray DockManager::saveLayout() const
{
    return LayoutSerializer::toBytes(m_layout.capture());
}

DockResult DockManager::restoreLayout(const QByteArray& bytes)
{
    LayoutBlueprint blueprint;
    const auto isRegistered = [this](const QString& id) { return m_registry.contains(id); };

    const DockResult parsed = LayoutSerializer::fromBytes(bytes, isRegistered, blueprint);
    if (!parsed) {
        qCWarning(managerlog).noquote() << "Layout restore rejected:" << parsed.message();
        return parsed;
    }

    const DockResult valid = m_layout.validateBlueprint(blueprint);
    if (!valid)
        return valid;

    emit restoringState();
    const DockResult applied = m_layout.applyBlueprint(blueprint);
    if (!applied) {
        emit stateRestored();
        return applied;
    }

    // Floating windows come back with the stored geometry; lay them out.
    for (ContainerId id : m_layout.floatingContainerIds()) {
        const ContainerRecord* rec = m_layout.container(id);
        const DockResult r =
            m_layout.layoutContainer(id, QRectF(rec->geometry), m_config.tabBarHeight, m_config.splitterHandleWidth);
        if (!r)
            qCWarning(managerlog).noquote() << r.message();
    }

    qCInfo(managerlog) << "Restored layout with" << m_layout.allAreas().size() << "dock areas";
    emit stateRestored();
    return DockResult::success();
}

DockResult DockManager::addPerspective(const QString& name)
{
    if (name.trimmed().isEmpty())
        return DockResult::failure(DockError::InvalidId, QStringLiteral("Perspective name must not be empty."));

    m_perspectives.insert(name, saveLayout());
    qCInfo(managerlog) << "Saved perspective" << name;
    emit perspectiveListChanged();
    return DockResult::success();
}

void DockManager::removePerspective(const QString& name)
{
    removePerspectives(QStringList{name});
}

void DockManager::removePerspectives(const QStringList& names)
{
    int removed = 0;
    for (const QString& name : names)
        removed += int(m_perspectives.remove(name));

    if (removed > 0)
        emit perspectiveListChanged();
}

QStringList DockManager::perspectiveNames() const
{
    return m_perspectives.keys();
}

DockResult DockManager::openPerspective(const QString& name)
{
    auto it = m_perspectives.constFind(name);
    if (it == m_perspectives.cend())
        return DockResult::failure(DockError::NotFound, QStringLiteral("No perspective named '%1'.").arg(name));

    emit openingPerspective(name);
    UTILS_TRY(restoreLayout(it.value()));
    emit perspectiveOpened(name);
    return DockResult::success();
}

void DockManager::savePerspectives(QSettings& settings) const
{
    settings.beginWriteArray(kPerspectivesGroup, int(m_perspectives.size()));
    int i = 0;
    for (auto it = m_perspectives.cbegin(); it != m_perspectives.cend(); ++it, ++i) {
        settings.setArrayIndex(i);
        settings.setValue(kPerspectiveNameKey, it.key());
        settings.setValue(kPerspectiveStateKey, it.value());
    }
    settings.endArray();
}

void DockManager::loadPerspectives(QSettings& settings)
{
    m_perspectives.clear();

    const int count = settings.beginReadArray(kPerspectivesGroup);
    for (int i = 0; i < count; ++i) {
        settings.setArrayIndex(i);
        const QString name = settings.value(kPerspectiveNameKey).toString();
        const QByteArray state = settings.value(kPerspectiveStateKey).toByteArray();
        if (name.isEmpty() || state.isEmpty()) {
            qCWarning(managerlog) << "Skipping incomplete perspective entry" << i;
            continue;
        }
        m_perspectives.insert(name, state);
    }
    settings.endArray();

    qCInfo(managerlog) << "Loaded" << m_perspectives.size() << "perspectives";
    emit perspectiveListChanged();
}

} // namespace Docking
