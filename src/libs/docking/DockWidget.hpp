// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockTypes.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>

namespace Docking {

struct DockWidgetSpec
{
    // Required, stable id. Unique across the main window and every floating window.
    QString id;

    // Tab caption. Empty means "use id".
    QString title;

    // Application content. Referenced, never owned or touched by the engine.
    QPointer<QObject> content;

    DockWidgetFeatures features = DockWidgetFeature::AllFeatures;
};

class DOCKING_EXPORT DockWidget final
{
public:
    DockWidget() = default;
    explicit DockWidget(const DockWidgetSpec& spec);

    const QString& id() const noexcept { return m_id; }

    QString title() const { return m_title.isEmpty() ? m_id : m_title; }
    void setTitle(const QString& title) { m_title = title; }

    QObject* content() const noexcept { return m_content.data(); }
    void setContent(QObject* content) { m_content = content; }

    DockWidgetFeatures features() const noexcept { return m_features; }
    void setFeatures(DockWidgetFeatures features) noexcept { m_features = features; }
    void setFeature(DockWidgetFeature feature, bool on = true) noexcept { m_features.setFlag(feature, on); }
    bool hasFeature(DockWidgetFeature feature) const noexcept { return m_features.testFlag(feature); }

    bool isClosable() const noexcept { return hasFeature(DockWidgetFeature::Closable); }
    bool isMovable() const noexcept { return hasFeature(DockWidgetFeature::Movable); }
    bool isFloatable() const noexcept { return hasFeature(DockWidgetFeature::Floatable); }

    DockWidgetState state() const noexcept { return m_state; }
    bool isHidden() const noexcept { return m_state == DockWidgetState::Hidden; }
    bool isFloating() const noexcept { return m_state == DockWidgetState::Floating; }

    // Area the widget lived in before it was last hidden. May be stale.
    NodeId lastArea() const noexcept { return m_lastArea; }

private:
    friend class WidgetRegistry;

    QString m_id;
    QString m_title;
    QPointer<QObject> m_content;
    DockWidgetFeatures m_features = DockWidgetFeature::AllFeatures;
    DockWidgetState m_state = DockWidgetState::Hidden;
    NodeId m_lastArea{};
};

} // namespace Docking
