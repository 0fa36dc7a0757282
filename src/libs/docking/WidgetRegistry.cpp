// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/WidgetRegistry.hpp"

namespace Docking {

bool WidgetRegistry::isValidId(const QString& id)
{
    if (id.trimmed().isEmpty() || id.trimmed() != id)
        return false;

    for (const QChar c : id) {
        if (!(c.isLetterOrNumber() || c == '_' || c == '-' || c == '.' || c == ':' || c == '/'))
            return false;
    }
    return true;
}

DockResult WidgetRegistry::add(const DockWidgetSpec& spec)
{
    if (!isValidId(spec.id)) {
        return DockResult::failure(DockError::InvalidId,
                                   QStringLiteral("Dock widget id is invalid: '%1'. Use [A-Za-z0-9_.:/-] and non-empty.")
                                       .arg(spec.id));
    }

    if (m_entries.contains(spec.id)) {
        return DockResult::failure(DockError::DuplicateId,
                                   QStringLiteral("Dock widget id already registered: '%1'.").arg(spec.id));
    }

    Entry e;
    e.widget = DockWidget(spec);
    m_entries.insert(spec.id, std::move(e));
    m_order.push_back(spec.id);
    return DockResult::success();
}

DockResult WidgetRegistry::remove(const QString& id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end())
        return DockResult::failure(DockError::NotFound, QStringLiteral("Dock widget not registered: '%1'.").arg(id));

    if (it->location.isDocked()) {
        return DockResult::failure(DockError::InvariantViolation,
                                   QStringLiteral("Dock widget '%1' is still docked and cannot be unregistered.").arg(id));
    }

    m_entries.erase(it);
    m_order.removeOne(id);
    return DockResult::success();
}

DockWidget* WidgetRegistry::widget(const QString& id)
{
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : &it->widget;
}

const DockWidget* WidgetRegistry::widget(const QString& id) const
{
    auto it = m_entries.constFind(id);
    return it == m_entries.constEnd() ? nullptr : &it->widget;
}

WidgetRegistry::Location WidgetRegistry::location(const QString& id) const
{
    auto it = m_entries.constFind(id);
    return it == m_entries.constEnd() ? Location{} : it->location;
}

DockWidgetState WidgetRegistry::state(const QString& id) const
{
    const DockWidget* w = widget(id);
    return w ? w->state() : DockWidgetState::Hidden;
}

bool WidgetRegistry::setLocation(const QString& id, NodeId area, ContainerId container, bool floating)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end())
        return false;

    it->location = Location{area, container};
    const DockWidgetState next = floating ? DockWidgetState::Floating : DockWidgetState::Docked;
    const bool changed = it->widget.m_state != next;
    it->widget.m_state = next;
    it->widget.m_lastArea = area;
    return changed;
}

bool WidgetRegistry::clearLocation(const QString& id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end())
        return false;

    it->location = Location{};
    const bool changed = it->widget.m_state != DockWidgetState::Hidden;
    it->widget.m_state = DockWidgetState::Hidden;
    return changed;
}

} // namespace Docking
