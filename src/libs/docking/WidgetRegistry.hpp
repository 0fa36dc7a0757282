// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockResult.hpp"
#include "docking/DockWidget.hpp"

#include <QtCore/QHash>
#include <QtCore/QStringList>

namespace Docking {

// Process-wide table of dock widgets: id -> (widget, owning area, owning
// container). Owned by the dock manager and handed by reference to the
// layout, which is the only code that moves widgets between areas.
//
// Pointers returned by widget() stay valid until the next add() or remove().
class DOCKING_EXPORT WidgetRegistry final
{
public:
    struct Location {
        NodeId area{};
        ContainerId container{};

        bool isDocked() const noexcept { return area.isValid(); }
    };

    WidgetRegistry() = default;
    WidgetRegistry(const WidgetRegistry&) = delete;
    WidgetRegistry& operator=(const WidgetRegistry&) = delete;

    DockResult add(const DockWidgetSpec& spec);

    // The widget must not be docked any more. Removing a docked widget would
    // leave a dangling id in its area.
    DockResult remove(const QString& id);

    bool contains(const QString& id) const noexcept { return m_entries.contains(id); }
    int size() const noexcept { return static_cast<int>(m_entries.size()); }

    // Registration order.
    const QStringList& ids() const noexcept { return m_order; }

    DockWidget* widget(const QString& id);
    const DockWidget* widget(const QString& id) const;

    Location location(const QString& id) const;
    DockWidgetState state(const QString& id) const;

    // Layout bookkeeping. Returns true when the visibility state changed.
    bool setLocation(const QString& id, NodeId area, ContainerId container, bool floating);
    bool clearLocation(const QString& id);

    static bool isValidId(const QString& id);

private:
    struct Entry {
        DockWidget widget;
        Location location;
    };

    QHash<QString, Entry> m_entries;
    QStringList m_order;
};

} // namespace Docking
