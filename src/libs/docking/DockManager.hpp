// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockConfig.hpp"
#include "docking/DockLayout.hpp"
#include "docking/DockResult.hpp"
#include "docking/DockWidget.hpp"
#include "docking/DragController.hpp"
#include "docking/FloatingContainerManager.hpp"
#include "docking/WidgetRegistry.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QMap>
#include <QtCore/QObject>
#include <QtCore/QStringList>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace Docking {

// Application entry point. Owns the widget registry, the layout trees, the
// floating windows, the drag state machine and the named perspectives.
class DOCKING_EXPORT DockManager final : public QObject
{
    Q_OBJECT

public:
    explicit DockManager(QObject* parent = nullptr);
    explicit DockManager(const DockConfig& config, QObject* parent = nullptr);
    ~DockManager() override;

    const DockConfig& config() const noexcept { return m_config; }
    void setConfig(const DockConfig& config);

    WidgetRegistry& registry() noexcept { return m_registry; }
    const WidgetRegistry& registry() const noexcept { return m_registry; }
    DockLayout& layout() noexcept { return m_layout; }
    const DockLayout& layout() const noexcept { return m_layout; }
    FloatingContainerManager& floating() noexcept { return m_floating; }
    DragController& drag() noexcept { return m_drag; }

    // Widgets
    DockResult registerWidget(const DockWidgetSpec& spec);

    // Undocks the widget first when needed.
    DockResult unregisterWidget(const QString& id);

    // Docks the widget in a new area beside targetArea, or at the edge of
    // the main container when targetArea is null.
    DockResult addWidget(const QString& id, DockSide side, NodeId targetArea = {}, NodeId* outArea = nullptr);
    DockResult addWidgetTab(const QString& id, NodeId targetArea, int index = -1);

    // A hidden widget returns to its last area if that area still exists,
    // otherwise to a new area on the right edge of the main container.
    DockResult showWidget(const QString& id);
    DockResult hideWidget(const QString& id);

    // An empty size falls back to the configured default.
    DockResult floatWidget(const QString& id, const QPoint& screenPos, const QSize& size = {});

    NodeId currentArea(const QString& id) const;
    DockWidgetState widgetState(const QString& id) const;

    // Pushes new container geometry from the toolkit and recomputes the
    // node rectangles of that container.
    DockResult updateContainerGeometry(ContainerId container, const QRect& geometry);

    // Persistence
    QByteArray saveLayout() const;
    DockResult restoreLayout(const QByteArray& bytes);

    // Perspectives
    DockResult addPerspective(const QString& name);
    void removePerspective(const QString& name);
    void removePerspectives(const QStringList& names);
    QStringList perspectiveNames() const;
    DockResult openPerspective(const QString& name);
    void savePerspectives(QSettings& settings) const;
    void loadPerspectives(QSettings& settings);

signals:
    void restoringState();
    void stateRestored();
    void perspectiveListChanged();
    void openingPerspective(const QString& name);
    void perspectiveOpened(const QString& name);

private:
    DockConfig m_config;
    WidgetRegistry m_registry;
    DockLayout m_layout;
    FloatingContainerManager m_floating;
    DragController m_drag;

    QMap<QString, QByteArray> m_perspectives;
};

} // namespace Docking
