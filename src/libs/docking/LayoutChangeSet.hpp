// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <algorithm>

namespace Docking {

// Changes collected while one layout mutation runs. DockLayout turns them
// into signals once the tree and the registry agree again, so observers never
// see an intermediate state.
class LayoutChangeSet final {
public:
    struct ActiveChange final {
        NodeId area{};
        QString widgetId;
    };

    bool empty() const noexcept
    {
        return m_changedContainers.isEmpty() && m_createdContainers.isEmpty()
               && m_destroyedContainers.isEmpty() && m_stateBefore.isEmpty() && m_activeChanges.isEmpty();
    }

    void clear()
    {
        m_changedContainers.clear();
        m_createdContainers.clear();
        m_destroyedContainers.clear();
        m_stateBefore.clear();
        m_stateOrder.clear();
        m_activeChanges.clear();
    }

    void addChanged(ContainerId id)
    {
        if (id.isValid() && !m_changedContainers.contains(id))
            m_changedContainers.push_back(id);
    }

    void addCreated(ContainerId id)
    {
        m_createdContainers.push_back(id);
        addChanged(id);
    }

    void addDestroyed(ContainerId id)
    {
        m_destroyedContainers.push_back(id);
        m_changedContainers.removeAll(id);
    }

    // First call per widget wins: it records the state before the mutation.
    void addWidgetTouched(const QString& id, DockWidgetState before)
    {
        if (m_stateBefore.contains(id))
            return;
        m_stateBefore.insert(id, before);
        m_stateOrder.push_back(id);
    }

    void addActiveChanged(NodeId area, const QString& widgetId)
    {
        auto it = std::find_if(m_activeChanges.begin(), m_activeChanges.end(),
                               [area](const ActiveChange& c) { return c.area == area; });
        if (it != m_activeChanges.end())
            it->widgetId = widgetId;
        else
            m_activeChanges.push_back(ActiveChange{area, widgetId});
    }

    void dropArea(NodeId area)
    {
        m_activeChanges.erase(std::remove_if(m_activeChanges.begin(), m_activeChanges.end(),
                                             [area](const ActiveChange& c) { return c.area == area; }),
                              m_activeChanges.end());
    }

    const QVector<ContainerId>& changedContainers() const noexcept { return m_changedContainers; }
    const QVector<ContainerId>& createdContainers() const noexcept { return m_createdContainers; }
    const QVector<ContainerId>& destroyedContainers() const noexcept { return m_destroyedContainers; }
    const QVector<QString>& touchedWidgets() const noexcept { return m_stateOrder; }
    DockWidgetState stateBefore(const QString& id) const { return m_stateBefore.value(id, DockWidgetState::Hidden); }
    const QVector<ActiveChange>& activeChanges() const noexcept { return m_activeChanges; }

private:
    QVector<ContainerId> m_changedContainers;
    QVector<ContainerId> m_createdContainers;
    QVector<ContainerId> m_destroyedContainers;
    QHash<QString, DockWidgetState> m_stateBefore;
    QVector<QString> m_stateOrder;
    QVector<ActiveChange> m_activeChanges;
};

} // namespace Docking
