// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"
#include "tandem/document/TandemContent.hpp"

#include <QtCore/QPointF>

#include <memory>

namespace Tandem {

// One node of the shared tree. Position is the top-left corner, relative to
// the parent group when there is one, absolute otherwise.
class TANDEM_EXPORT TandemItem final
{
public:
	TandemItem(ObjectId id, QPointF position, double rotation, std::unique_ptr<TandemContent> content);

	ObjectId id() const noexcept { return m_id; }

	QPointF position() const noexcept { return m_position; }
	void setPosition(const QPointF& pos) { m_position = pos; }
	double x() const noexcept { return m_position.x(); }
	double y() const noexcept { return m_position.y(); }

	double rotation() const noexcept { return m_rotation; }
	void setRotation(double degrees);

	TandemContent& content() { return *m_content; }
	const TandemContent& content() const { return *m_content; }
	void setContent(std::unique_ptr<TandemContent> content);

	ContentKind kind() const { return m_content->kind(); }
	bool isGroup() const { return kind() == ContentKind::Group; }

	template <typename T>
	T* contentAs() { return dynamic_cast<T*>(m_content.get()); }
	template <typename T>
	const T* contentAs() const { return dynamic_cast<const T*>(m_content.get()); }

	// Deep copy, children included; ids are preserved.
	std::unique_ptr<TandemItem> clone() const;

	// Overwrites position, rotation and content with those of `snapshot`. Content
	// and child items are restored in place, so existing pointers stay valid.
	void restoreFrom(const TandemItem& snapshot);

private:
	ObjectId m_id{};
	QPointF m_position;
	double m_rotation = 0.0;
	std::unique_ptr<TandemContent> m_content;
};

} // namespace Tandem
