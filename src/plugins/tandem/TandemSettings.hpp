// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemConstants.hpp"
#include "tandem/TandemGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Tandem {

struct TANDEM_EXPORT GridLayoutConfig final {
	int columns = Constants::kGridColumns;
	double padding = Constants::kGridPadding;
	double cellWidth = Constants::kGridCellWidth;
	double cellHeight = Constants::kGridCellHeight;
	double gapX = Constants::kGridGapX;
	double gapY = Constants::kGridGapY;
};

struct TANDEM_EXPORT TandemSettings final {
	double dragThresholdPx = Constants::kDragThresholdPx;
	double interactiveThresholdFactor = Constants::kInteractiveDragThresholdFactor;
	int suppressBackgroundClearMs = Constants::kSuppressBackgroundClearMs;

	double shapeMinSize = Constants::kShapeMinSize;
	double shapeMaxSize = Constants::kShapeMaxSize;
	double textMinWidth = Constants::kTextMinWidth;
	double textMaxWidth = Constants::kTextMaxWidth;
	double resizeMinRatio = Constants::kResizeMinRatio;

	GridLayoutConfig grid;
	double groupOutlinePadding = Constants::kGroupOutlinePadding;
	double emptyGroupSize = Constants::kEmptyGroupSize;
	double unmeasuredChildExtent = Constants::kUnmeasuredChildExtent;

	double clampShapeSize(double size) const;
	double clampTextWidth(double width) const;
	double dragThreshold(bool interactiveStart) const;
};

TANDEM_EXPORT TandemSettings settingsDefaults();
TANDEM_EXPORT TandemSettings settingsFromJson(const QJsonObject& obj, const TandemSettings& fallback);
TANDEM_EXPORT QJsonObject settingsToJson(const TandemSettings& settings);
TANDEM_EXPORT bool settingsEqual(const TandemSettings& a, const TandemSettings& b);

// A missing file is not an error: the fallback is returned and `ok` stays true.
TANDEM_EXPORT TandemSettings loadSettings(const QString& path,
										  const TandemSettings& fallback,
										  Utils::Result* result = nullptr);
TANDEM_EXPORT Utils::Result saveSettings(const QString& path, const TandemSettings& settings);

} // namespace Tandem
