// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/TandemGlobal.hpp"

Q_LOGGING_CATEGORY(tandemgesturelog, "tandem.gesture")
Q_LOGGING_CATEGORY(tandempresencelog, "tandem.presence")
Q_LOGGING_CATEGORY(tandemdocumentlog, "tandem.document")
Q_LOGGING_CATEGORY(tandemsettingslog, "tandem.settings")
