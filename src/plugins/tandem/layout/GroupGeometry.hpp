// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemSettings.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

#include <optional>

namespace Tandem {

class LayoutCache;
class TandemItem;

namespace GroupGeometry {

struct TANDEM_EXPORT GroupBounds final {
	QRectF rect;
	bool placeholder = false;

	QRectF outline(double padding) const { return rect.adjusted(-padding, -padding, padding, padding); }
};

// Top-left of cell `index` in row-major grid order.
TANDEM_EXPORT QPointF gridPositionByIndex(int index, const GridLayoutConfig& config);

// Child offset from the group origin: its grid cell when the group is in grid
// view, its stored position otherwise.
TANDEM_EXPORT QPointF childOffset(const TandemItem& group,
								  const TandemItem& child,
								  const GridLayoutConfig& config);

TANDEM_EXPORT QPointF childAbsolutePosition(const TandemItem& group,
											const TandemItem& child,
											const QPointF& groupPosition,
											const GridLayoutConfig& config);

// Union of the children's boxes. Measured boxes are preferred; unmeasured
// children get a square of `settings.unmeasuredChildExtent`. While the group
// is dragged, every box is moved to `ephemeralGroupPosition + childOffset`.
TANDEM_EXPORT GroupBounds groupBounds(const TandemItem& group,
									  const LayoutCache& layout,
									  const TandemSettings& settings,
									  std::optional<QPointF> ephemeralGroupPosition = std::nullopt);

} // namespace GroupGeometry
} // namespace Tandem
