// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

TANDEMUTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                            const QJsonObject& object,
                                            QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// Missing files report ResultCode::MissingItem so callers can fall back to defaults.
TANDEMUTILS_EXPORT Result readObject(const QString& path, QJsonObject& out);

} // namespace Utils::JsonFileUtils
