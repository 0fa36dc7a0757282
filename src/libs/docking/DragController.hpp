// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockResult.hpp"
#include "docking/DropTargetResolver.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>

#include <optional>

namespace Docking {

class DockLayout;
class FloatingContainerManager;
struct DockConfig;

// Drag gesture state machine: Idle, or Dragging an item with the plan last
// resolved under the pointer. Every lifecycle call ends in Idle except
// dragStart and dragMove.
class DOCKING_EXPORT DragController final : public QObject
{
    Q_OBJECT

public:
    enum class State { Idle, Dragging };

    DragController(DockLayout& layout,
                   FloatingContainerManager& floating,
                   const DockConfig& config,
                   QObject* parent = nullptr);

    State state() const noexcept { return m_state; }
    bool isDragging() const noexcept { return m_state == State::Dragging; }
    const DragItem& item() const noexcept { return m_item; }
    const std::optional<DropPlan>& lastPlan() const noexcept { return m_lastPlan; }
    QPointF lastPos() const noexcept { return m_lastPos; }

    DockResult dragStart(const DragItem& item, const QPointF& pos = {});
    std::optional<DropPlan> dragMove(const QPointF& pos);
    DockResult dragRelease();
    void dragCancel();

signals:
    void dragStateChanged(bool dragging);
    void dropPlanChanged(const Docking::DropPlan& plan);
    void dropPlanCleared();

private:
    DockResult validateItem(const DragItem& item) const;
    DockResult commit(const DragItem& item, const DropPlan& plan);
    DockResult floatItem(const DragItem& item, const QPointF& pos);
    void reset();

    DockLayout& m_layout;
    FloatingContainerManager& m_floating;
    const DockConfig& m_config;

    State m_state = State::Idle;
    DragItem m_item;
    std::optional<DropPlan> m_lastPlan;
    QPointF m_lastPos;
};

} // namespace Docking
