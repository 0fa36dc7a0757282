// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

// Shared early-return idioms. Keep this list short; a macro only lands here
// once several files would otherwise spell the same pattern by hand.

// Propagates a failed result object (anything with explicit operator bool).
#ifndef UTILS_TRY
#	define UTILS_TRY(expr) do { auto _utils_try_result = (expr); if (!_utils_try_result) return _utils_try_result; } while (false)
#endif
