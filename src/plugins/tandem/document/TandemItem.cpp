// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/document/TandemItem.hpp"

#include "tandem/Tools.hpp"

#include <utility>

namespace Tandem {

TandemItem::TandemItem(ObjectId id, QPointF position, double rotation, std::unique_ptr<TandemContent> content)
	: m_id(id)
	, m_position(position)
	, m_rotation(Tools::Math::normalizeDegrees(rotation))
	, m_content(std::move(content))
{
	Q_ASSERT(m_content);
}

void TandemItem::setRotation(double degrees)
{
	m_rotation = Tools::Math::normalizeDegrees(degrees);
}

void TandemItem::setContent(std::unique_ptr<TandemContent> content)
{
	if (!content)
		return;
	m_content = std::move(content);
}

std::unique_ptr<TandemItem> TandemItem::clone() const
{
	return std::make_unique<TandemItem>(m_id, m_position, m_rotation, m_content->clone());
}

void TandemItem::restoreFrom(const TandemItem& snapshot)
{
	m_position = snapshot.m_position;
	m_rotation = snapshot.m_rotation;
	if (!m_content->restoreFrom(*snapshot.m_content))
		m_content = snapshot.m_content->clone();
}

} // namespace Tandem
