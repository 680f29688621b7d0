// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString target = path.trimmed();
    if (target.isEmpty())
        return Result::failure(ResultCode::InvalidArgument, QStringLiteral("JSON output path is empty."));

    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result::failure(ResultCode::IoError,
                               QStringLiteral("Cannot open %1 for writing (%2)").arg(target, file.errorString()));
    }

    if (file.write(QJsonDocument(object).toJson(format)) < 0) {
        const QString why = file.errorString();
        file.cancelWriting();
        return Result::failure(ResultCode::IoError, QStringLiteral("Cannot write %1 (%2)").arg(target, why));
    }

    if (!file.commit()) {
        return Result::failure(ResultCode::IoError,
                               QStringLiteral("Cannot commit %1 (%2)").arg(target, file.errorString()));
    }
    return Result::success();
}

Result readObject(const QString& path, QJsonObject& out)
{
    out = QJsonObject{};

    const QString source = path.trimmed();
    if (source.isEmpty())
        return Result::failure(ResultCode::InvalidArgument, QStringLiteral("JSON input path is empty."));
    if (!QFileInfo::exists(source))
        return Result::failure(ResultCode::MissingItem, QStringLiteral("No such file: %1").arg(source));

    QFile file(source);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result::failure(ResultCode::IoError,
                               QStringLiteral("Cannot open %1 (%2)").arg(source, file.errorString()));
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result::failure(ResultCode::InvalidArgument,
                               QStringLiteral("Cannot parse %1 (%2)").arg(source, parseError.errorString()));
    }
    if (!doc.isObject()) {
        return Result::failure(ResultCode::InvalidArgument,
                               QStringLiteral("%1 does not hold a JSON object").arg(source));
    }

    out = doc.object();
    return Result::success();
}

} // namespace Utils::JsonFileUtils
