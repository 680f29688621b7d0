// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "tandem/TandemSettings.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonObject>
#include <QtCore/QTemporaryDir>

using namespace Tandem;
using namespace Qt::StringLiterals;

TEST(TandemSettingsTests, DefaultsMatchInteractionConstants)
{
    const TandemSettings s = settingsDefaults();
    EXPECT_DOUBLE_EQ(s.dragThreshold(false), 6.0);
    EXPECT_DOUBLE_EQ(s.dragThreshold(true), 12.0);
    EXPECT_EQ(s.suppressBackgroundClearMs, 150);
    EXPECT_DOUBLE_EQ(s.clampShapeSize(5.0), 20.0);
    EXPECT_DOUBLE_EQ(s.clampShapeSize(5000.0), 1200.0);
    EXPECT_EQ(s.grid.columns, 3);
}

TEST(TandemSettingsTests, FromJsonOverridesAndValidates)
{
    QJsonObject grid;
    grid.insert(u"columns"_s, 0);
    grid.insert(u"cellWidth"_s, 250.0);

    QJsonObject obj;
    obj.insert(u"dragThresholdPx"_s, 10.0);
    obj.insert(u"interactiveThresholdFactor"_s, -1.0);
    obj.insert(u"grid"_s, grid);

    const TandemSettings fallback = settingsDefaults();
    const TandemSettings s = settingsFromJson(obj, fallback);

    EXPECT_DOUBLE_EQ(s.dragThresholdPx, 10.0);
    EXPECT_DOUBLE_EQ(s.interactiveThresholdFactor, fallback.interactiveThresholdFactor);
    EXPECT_EQ(s.grid.columns, fallback.grid.columns);
    EXPECT_DOUBLE_EQ(s.grid.cellWidth, 250.0);
}

TEST(TandemSettingsTests, InvertedBoundsKeepFallback)
{
    QJsonObject obj;
    obj.insert(u"shapeMinSize"_s, 500.0);
    obj.insert(u"shapeMaxSize"_s, 100.0);

    const TandemSettings s = settingsFromJson(obj, settingsDefaults());
    EXPECT_DOUBLE_EQ(s.shapeMinSize, 20.0);
    EXPECT_DOUBLE_EQ(s.shapeMaxSize, 1200.0);
}

TEST(TandemSettingsTests, SaveAndLoad)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(u"tandem.json"_s);

    TandemSettings s = settingsDefaults();
    s.dragThresholdPx = 4.0;
    s.grid.columns = 5;
    s.textMaxWidth = 900.0;
    ASSERT_TRUE(saveSettings(path, s).ok);

    Utils::Result r = Utils::Result::failure(Utils::ResultCode::Unknown, u"unset"_s);
    const TandemSettings loaded = loadSettings(path, settingsDefaults(), &r);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(settingsEqual(loaded, s));
    EXPECT_FALSE(settingsEqual(loaded, settingsDefaults()));
}

TEST(TandemSettingsTests, MissingFileFallsBackWithoutError)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());

    Utils::Result r = Utils::Result::failure(Utils::ResultCode::Unknown, u"unset"_s);
    const TandemSettings loaded = loadSettings(QDir(temp.path()).filePath(u"absent.json"_s), settingsDefaults(), &r);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(settingsEqual(loaded, settingsDefaults()));
}

TEST(TandemSettingsTests, CorruptFileReportsError)
{
    QTemporaryDir temp;
    ASSERT_TRUE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(u"bad.json"_s);
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("not json");
    }

    Utils::Result r;
    const TandemSettings loaded = loadSettings(path, settingsDefaults(), &r);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, Utils::ResultCode::InvalidArgument);
    EXPECT_TRUE(settingsEqual(loaded, settingsDefaults()));
}
