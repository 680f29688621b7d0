// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/layout/DisplayResolver.hpp"

#include "tandem/api/ITandemDocument.hpp"
#include "tandem/document/TandemItem.hpp"
#include "tandem/layout/GroupGeometry.hpp"
#include "tandem/presence/PresenceSession.hpp"

#include <utility>

namespace Tandem {

DisplayResolver::DisplayResolver(const Api::ITandemDocument& document,
								 const PresenceSession& presence,
								 TandemSettings settings)
	: m_document(document)
	, m_presence(presence)
	, m_settings(std::move(settings))
{}

QPointF DisplayResolver::groupPosition(const TandemItem& group) const
{
	if (const auto drag = m_presence.activeDragFor(group.id()))
		return drag->position();
	return group.position();
}

DisplayTransform DisplayResolver::resolve(const TandemItem& item) const
{
	DisplayTransform out;
	out.rotation = item.rotation();

	const TandemItem* parent = m_document.parentOf(item.id());
	if (parent) {
		out.position = GroupGeometry::childAbsolutePosition(*parent, item, groupPosition(*parent),
															m_settings.grid);
	} else {
		out.position = item.position();
	}

	if (const auto drag = m_presence.activeDragFor(item.id())) {
		out.position = drag->position();
		out.rotation = drag->rotation;
		out.manipulating = true;
	}

	if (const auto resize = m_presence.activeResizeFor(item.id())) {
		out.position = resize->position();
		out.dimensionOverride = resize->size;
		out.manipulating = true;
	}

	if (!item.content().canRotate() || isGridChild(item))
		out.rotation = 0.0;

	if (out.dimensionOverride) {
		auto preview = item.content().clone();
		preview->setResizableDimension(*out.dimensionOverride);
		out.size = preview->intrinsicSize();
	} else {
		out.size = item.content().intrinsicSize();
	}

	return out;
}

std::optional<DisplayTransform> DisplayResolver::resolve(ObjectId itemId) const
{
	const TandemItem* item = m_document.findItem(itemId);
	if (!item)
		return std::nullopt;
	return resolve(*item);
}

bool DisplayResolver::isGridChild(const TandemItem& item) const
{
	const TandemItem* parent = m_document.parentOf(item.id());
	if (!parent)
		return false;
	const auto* group = parent->contentAs<GroupContent>();
	return group && group->viewAsGrid();
}

bool DisplayResolver::canDrag(const TandemItem& item) const
{
	return !isGridChild(item);
}

bool DisplayResolver::canRotate(const TandemItem& item) const
{
	return item.content().canRotate() && !isGridChild(item);
}

bool DisplayResolver::canResize(const TandemItem& item) const
{
	return item.content().canResize() && !isGridChild(item);
}

} // namespace Tandem
