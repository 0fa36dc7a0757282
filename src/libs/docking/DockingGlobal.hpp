// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(DOCKING_BUILD_SHARED) && (DOCKING_BUILD_SHARED == 1)
#	if defined(DOCKING_LIBRARY)
#		define DOCKING_EXPORT Q_DECL_EXPORT
#	else
#		define DOCKING_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define DOCKING_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(dockinglog)
