// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/layout/GroupGeometry.hpp"

#include "tandem/document/TandemItem.hpp"
#include "tandem/layout/LayoutCache.hpp"

#include <algorithm>

namespace Tandem::GroupGeometry {

QPointF gridPositionByIndex(int index, const GridLayoutConfig& config)
{
	const int columns = std::max(1, config.columns);
	const int i = std::max(0, index);
	const int col = i % columns;
	const int row = i / columns;
	return QPointF(config.padding + col * (config.cellWidth + config.gapX),
				   config.padding + row * (config.cellHeight + config.gapY));
}

QPointF childOffset(const TandemItem& group, const TandemItem& child, const GridLayoutConfig& config)
{
	const auto* content = group.contentAs<GroupContent>();
	if (!content || !content->viewAsGrid())
		return child.position();

	const int index = content->indexOf(&child);
	if (index < 0)
		return child.position();
	return gridPositionByIndex(index, config);
}

QPointF childAbsolutePosition(const TandemItem& group,
							  const TandemItem& child,
							  const QPointF& groupPosition,
							  const GridLayoutConfig& config)
{
	return groupPosition + childOffset(group, child, config);
}

GroupBounds groupBounds(const TandemItem& group,
						const LayoutCache& layout,
						const TandemSettings& settings,
						std::optional<QPointF> ephemeralGroupPosition)
{
	const QPointF origin = ephemeralGroupPosition.value_or(group.position());

	const auto* content = group.contentAs<GroupContent>();
	if (!content || content->children().empty()) {
		const double side = settings.emptyGroupSize;
		return GroupBounds{QRectF(origin, QSizeF(side, side)), true};
	}

	QRectF united;
	bool first = true;
	for (const auto& child : content->children()) {
		const QPointF offset = childOffset(group, *child, settings.grid);
		const std::optional<QRectF> measured = layout.bounds(child->id());

		QRectF box;
		if (measured && !ephemeralGroupPosition) {
			box = *measured;
		} else {
			const double fallback = settings.unmeasuredChildExtent;
			const QSizeF extent = measured ? measured->size() : QSizeF(fallback, fallback);
			box = QRectF(origin + offset, extent);
		}

		united = first ? box : united.united(box);
		first = false;
	}

	return GroupBounds{united, false};
}

} // namespace Tandem::GroupGeometry
