// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/TandemSettings.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonValue>

#include <algorithm>
#include <cmath>

namespace Tandem {

namespace {

using namespace Qt::StringLiterals;

const QString kDragThresholdKey = u"dragThresholdPx"_s;
const QString kInteractiveFactorKey = u"interactiveThresholdFactor"_s;
const QString kSuppressClearKey = u"suppressBackgroundClearMs"_s;
const QString kShapeMinKey = u"shapeMinSize"_s;
const QString kShapeMaxKey = u"shapeMaxSize"_s;
const QString kTextMinKey = u"textMinWidth"_s;
const QString kTextMaxKey = u"textMaxWidth"_s;
const QString kResizeMinRatioKey = u"resizeMinRatio"_s;
const QString kGridKey = u"grid"_s;
const QString kGridColumnsKey = u"columns"_s;
const QString kGridPaddingKey = u"padding"_s;
const QString kGridCellWidthKey = u"cellWidth"_s;
const QString kGridCellHeightKey = u"cellHeight"_s;
const QString kGridGapXKey = u"gapX"_s;
const QString kGridGapYKey = u"gapY"_s;
const QString kOutlinePaddingKey = u"groupOutlinePadding"_s;
const QString kEmptyGroupKey = u"emptyGroupSize"_s;
const QString kUnmeasuredKey = u"unmeasuredChildExtent"_s;

bool nearlyEqual(double a, double b)
{
	return std::abs(a - b) <= 1e-6;
}

double readPositive(const QJsonObject& obj, const QString& key, double fallback)
{
	if (!obj.contains(key))
		return fallback;
	const double value = obj.value(key).toDouble(fallback);
	if (!std::isfinite(value) || value <= 0.0) {
		qCWarning(tandemsettingslog) << "ignoring non-positive setting" << key << value;
		return fallback;
	}
	return value;
}

double readNonNegative(const QJsonObject& obj, const QString& key, double fallback)
{
	if (!obj.contains(key))
		return fallback;
	const double value = obj.value(key).toDouble(fallback);
	if (!std::isfinite(value) || value < 0.0) {
		qCWarning(tandemsettingslog) << "ignoring negative setting" << key << value;
		return fallback;
	}
	return value;
}

GridLayoutConfig gridFromJson(const QJsonObject& obj, const GridLayoutConfig& fallback)
{
	GridLayoutConfig grid = fallback;
	if (obj.contains(kGridColumnsKey)) {
		const int columns = obj.value(kGridColumnsKey).toInt(grid.columns);
		if (columns > 0)
			grid.columns = columns;
		else
			qCWarning(tandemsettingslog) << "ignoring grid column count" << columns;
	}
	grid.padding = readNonNegative(obj, kGridPaddingKey, grid.padding);
	grid.cellWidth = readPositive(obj, kGridCellWidthKey, grid.cellWidth);
	grid.cellHeight = readPositive(obj, kGridCellHeightKey, grid.cellHeight);
	grid.gapX = readNonNegative(obj, kGridGapXKey, grid.gapX);
	grid.gapY = readNonNegative(obj, kGridGapYKey, grid.gapY);
	return grid;
}

QJsonObject gridToJson(const GridLayoutConfig& grid)
{
	QJsonObject obj;
	obj.insert(kGridColumnsKey, grid.columns);
	obj.insert(kGridPaddingKey, grid.padding);
	obj.insert(kGridCellWidthKey, grid.cellWidth);
	obj.insert(kGridCellHeightKey, grid.cellHeight);
	obj.insert(kGridGapXKey, grid.gapX);
	obj.insert(kGridGapYKey, grid.gapY);
	return obj;
}

} // namespace

double TandemSettings::clampShapeSize(double size) const
{
	return std::clamp(size, shapeMinSize, shapeMaxSize);
}

double TandemSettings::clampTextWidth(double width) const
{
	return std::clamp(width, textMinWidth, textMaxWidth);
}

double TandemSettings::dragThreshold(bool interactiveStart) const
{
	return interactiveStart ? dragThresholdPx * interactiveThresholdFactor : dragThresholdPx;
}

TandemSettings settingsDefaults()
{
	return TandemSettings{};
}

TandemSettings settingsFromJson(const QJsonObject& obj, const TandemSettings& fallback)
{
	TandemSettings s = fallback;

	s.dragThresholdPx = readNonNegative(obj, kDragThresholdKey, s.dragThresholdPx);
	s.interactiveThresholdFactor = readPositive(obj, kInteractiveFactorKey, s.interactiveThresholdFactor);
	if (obj.contains(kSuppressClearKey))
		s.suppressBackgroundClearMs = std::max(0, obj.value(kSuppressClearKey).toInt(s.suppressBackgroundClearMs));

	s.shapeMinSize = readPositive(obj, kShapeMinKey, s.shapeMinSize);
	s.shapeMaxSize = readPositive(obj, kShapeMaxKey, s.shapeMaxSize);
	if (s.shapeMaxSize < s.shapeMinSize) {
		qCWarning(tandemsettingslog) << "shape size bounds inverted, keeping fallback";
		s.shapeMinSize = fallback.shapeMinSize;
		s.shapeMaxSize = fallback.shapeMaxSize;
	}

	s.textMinWidth = readPositive(obj, kTextMinKey, s.textMinWidth);
	s.textMaxWidth = readPositive(obj, kTextMaxKey, s.textMaxWidth);
	if (s.textMaxWidth < s.textMinWidth) {
		qCWarning(tandemsettingslog) << "text width bounds inverted, keeping fallback";
		s.textMinWidth = fallback.textMinWidth;
		s.textMaxWidth = fallback.textMaxWidth;
	}

	s.resizeMinRatio = readPositive(obj, kResizeMinRatioKey, s.resizeMinRatio);

	if (obj.contains(kGridKey))
		s.grid = gridFromJson(obj.value(kGridKey).toObject(), s.grid);

	s.groupOutlinePadding = readNonNegative(obj, kOutlinePaddingKey, s.groupOutlinePadding);
	s.emptyGroupSize = readPositive(obj, kEmptyGroupKey, s.emptyGroupSize);
	s.unmeasuredChildExtent = readPositive(obj, kUnmeasuredKey, s.unmeasuredChildExtent);
	return s;
}

QJsonObject settingsToJson(const TandemSettings& s)
{
	QJsonObject obj;
	obj.insert(kDragThresholdKey, s.dragThresholdPx);
	obj.insert(kInteractiveFactorKey, s.interactiveThresholdFactor);
	obj.insert(kSuppressClearKey, s.suppressBackgroundClearMs);
	obj.insert(kShapeMinKey, s.shapeMinSize);
	obj.insert(kShapeMaxKey, s.shapeMaxSize);
	obj.insert(kTextMinKey, s.textMinWidth);
	obj.insert(kTextMaxKey, s.textMaxWidth);
	obj.insert(kResizeMinRatioKey, s.resizeMinRatio);
	obj.insert(kGridKey, gridToJson(s.grid));
	obj.insert(kOutlinePaddingKey, s.groupOutlinePadding);
	obj.insert(kEmptyGroupKey, s.emptyGroupSize);
	obj.insert(kUnmeasuredKey, s.unmeasuredChildExtent);
	return obj;
}

bool settingsEqual(const TandemSettings& a, const TandemSettings& b)
{
	return nearlyEqual(a.dragThresholdPx, b.dragThresholdPx)
		&& nearlyEqual(a.interactiveThresholdFactor, b.interactiveThresholdFactor)
		&& a.suppressBackgroundClearMs == b.suppressBackgroundClearMs
		&& nearlyEqual(a.shapeMinSize, b.shapeMinSize)
		&& nearlyEqual(a.shapeMaxSize, b.shapeMaxSize)
		&& nearlyEqual(a.textMinWidth, b.textMinWidth)
		&& nearlyEqual(a.textMaxWidth, b.textMaxWidth)
		&& nearlyEqual(a.resizeMinRatio, b.resizeMinRatio)
		&& a.grid.columns == b.grid.columns
		&& nearlyEqual(a.grid.padding, b.grid.padding)
		&& nearlyEqual(a.grid.cellWidth, b.grid.cellWidth)
		&& nearlyEqual(a.grid.cellHeight, b.grid.cellHeight)
		&& nearlyEqual(a.grid.gapX, b.grid.gapX)
		&& nearlyEqual(a.grid.gapY, b.grid.gapY)
		&& nearlyEqual(a.groupOutlinePadding, b.groupOutlinePadding)
		&& nearlyEqual(a.emptyGroupSize, b.emptyGroupSize)
		&& nearlyEqual(a.unmeasuredChildExtent, b.unmeasuredChildExtent);
}

TandemSettings loadSettings(const QString& path, const TandemSettings& fallback, Utils::Result* result)
{
	QJsonObject obj;
	const Utils::Result r = Utils::JsonFileUtils::readObject(path, obj);
	if (!r) {
		if (r.code == Utils::ResultCode::MissingItem) {
			qCDebug(tandemsettingslog) << "no settings file at" << path << "- using defaults";
			if (result)
				*result = Utils::Result::success();
		} else {
			qCWarning(tandemsettingslog).noquote() << "failed to load settings:" << r.message();
			if (result)
				*result = r;
		}
		return fallback;
	}

	if (result)
		*result = Utils::Result::success();
	return settingsFromJson(obj, fallback);
}

Utils::Result saveSettings(const QString& path, const TandemSettings& settings)
{
	const Utils::Result r = Utils::JsonFileUtils::writeObjectAtomic(path, settingsToJson(settings));
	if (!r)
		qCWarning(tandemsettingslog).noquote() << "failed to save settings:" << r.message();
	return r;
}

} // namespace Tandem
