// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockWidget.hpp"

namespace Docking {

DockWidget::DockWidget(const DockWidgetSpec& spec)
    : m_id(spec.id.trimmed())
    , m_title(spec.title)
    , m_content(spec.content)
    , m_features(spec.features)
{}

} // namespace Docking
