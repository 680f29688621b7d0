// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#if defined(TANDEMUTILS_BUILD_SHARED) && (TANDEMUTILS_BUILD_SHARED == 1)
#	if defined(TANDEMUTILS_LIBRARY)
#		define TANDEMUTILS_EXPORT Q_DECL_EXPORT
#	else
#		define TANDEMUTILS_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define TANDEMUTILS_EXPORT
#endif
