// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(TANDEM_BUILD_SHARED) && (TANDEM_BUILD_SHARED == 1)
#	if defined(TANDEM_LIBRARY)
#		define TANDEM_EXPORT Q_DECL_EXPORT
#	else
#		define TANDEM_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define TANDEM_EXPORT
#endif

Q_DECLARE_EXPORTED_LOGGING_CATEGORY(tandemgesturelog, TANDEM_EXPORT)
Q_DECLARE_EXPORTED_LOGGING_CATEGORY(tandempresencelog, TANDEM_EXPORT)
Q_DECLARE_EXPORTED_LOGGING_CATEGORY(tandemdocumentlog, TANDEM_EXPORT)
Q_DECLARE_EXPORTED_LOGGING_CATEGORY(tandemsettingslog, TANDEM_EXPORT)
