// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

using namespace Utils;

TEST(JsonFileUtilsTests, WriteThenReadObject)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    const QString path = QDir(temp.path()).filePath(QStringLiteral("settings.json"));
    QJsonObject obj;
    obj.insert(QStringLiteral("threshold"), 6.0);
    obj.insert(QStringLiteral("name"), QStringLiteral("canvas"));

    ASSERT_TRUE(JsonFileUtils::writeObjectAtomic(path, obj).ok);

    QJsonObject loaded;
    const Result r = JsonFileUtils::readObject(path, loaded);
    ASSERT_TRUE(r.ok) << r.message().toStdString();
    EXPECT_EQ(loaded, obj);
}

TEST(JsonFileUtilsTests, MissingFileReportsMissingItem)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    QJsonObject loaded;
    loaded.insert(QStringLiteral("stale"), true);
    const Result r = JsonFileUtils::readObject(QDir(temp.path()).filePath(QStringLiteral("none.json")), loaded);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ResultCode::MissingItem);
    EXPECT_TRUE(loaded.isEmpty());
}

TEST(JsonFileUtilsTests, RejectsMalformedAndNonObjectDocuments)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    QDir dir(temp.path());

    const QString broken = dir.filePath(QStringLiteral("broken.json"));
    {
        QFile f(broken);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("{ \"a\": ");
    }
    const QString array = dir.filePath(QStringLiteral("array.json"));
    {
        QFile f(array);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("[1, 2]");
    }

    QJsonObject out;
    EXPECT_EQ(JsonFileUtils::readObject(broken, out).code, ResultCode::InvalidArgument);
    EXPECT_EQ(JsonFileUtils::readObject(array, out).code, ResultCode::InvalidArgument);
}

TEST(JsonFileUtilsTests, EmptyPathIsInvalid)
{
    QJsonObject out;
    EXPECT_EQ(JsonFileUtils::writeObjectAtomic(QStringLiteral("  "), QJsonObject{}).code,
              ResultCode::InvalidArgument);
    EXPECT_EQ(JsonFileUtils::readObject(QString(), out).code, ResultCode::InvalidArgument);
}
