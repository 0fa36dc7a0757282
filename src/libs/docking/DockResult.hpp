// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <utility>

namespace Docking {

enum class DockError {
    None,
    // Widget or area is not part of any live tree (or not registered).
    NotFound,
    // Target belongs to a foreign or stale tree, or cannot take the drop.
    InvalidTarget,
    // Programming error inside the engine or its caller. Never partial.
    InvariantViolation,
    UnsupportedVersion,
    CorruptLayout,
    DuplicateId,
    InvalidId
};

struct DockResult {
    bool ok = true;
    DockError error = DockError::None;
    QStringList errors;

    static DockResult success() { return DockResult{}; }

    static DockResult failure(DockError error, const QString& msg)
    {
        DockResult r;
        r.ok = false;
        r.error = error;
        r.errors.push_back(msg);
        return r;
    }

    static DockResult failure(DockError error, QStringList msgs)
    {
        DockResult r;
        r.ok = false;
        r.error = error;
        r.errors = std::move(msgs);
        return r;
    }

    QString message() const { return errors.join(QLatin1Char('\n')); }

    explicit operator bool() const { return ok; }
};

inline const char* errorName(DockError error) noexcept
{
    switch (error) {
        case DockError::None: return "None";
        case DockError::NotFound: return "NotFound";
        case DockError::InvalidTarget: return "InvalidTarget";
        case DockError::InvariantViolation: return "InvariantViolation";
        case DockError::UnsupportedVersion: return "UnsupportedVersion";
        case DockError::CorruptLayout: return "CorruptLayout";
        case DockError::DuplicateId: return "DuplicateId";
        case DockError::InvalidId: return "InvalidId";
    }
    return "None";
}

} // namespace Docking
