// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QPointF>
#include <QtCore/QString>

#include <optional>

namespace Tandem {

// Ephemeral values carry absolute canvas coordinates, also for grouped items.
struct TANDEM_EXPORT DragState final {
	ObjectId itemId{};
	double x = 0.0;
	double y = 0.0;
	double rotation = 0.0;
	QString branch;

	QPointF position() const { return QPointF(x, y); }

	friend bool operator==(const DragState& a, const DragState& b)
	{
		return a.itemId == b.itemId && a.x == b.x && a.y == b.y && a.rotation == b.rotation
			   && a.branch == b.branch;
	}
	friend bool operator!=(const DragState& a, const DragState& b) { return !(a == b); }
};

struct TANDEM_EXPORT ResizeState final {
	ObjectId itemId{};
	double x = 0.0;
	double y = 0.0;
	double size = 0.0;

	QPointF position() const { return QPointF(x, y); }

	friend bool operator==(const ResizeState& a, const ResizeState& b)
	{
		return a.itemId == b.itemId && a.x == b.x && a.y == b.y && a.size == b.size;
	}
	friend bool operator!=(const ResizeState& a, const ResizeState& b) { return !(a == b); }
};

struct TANDEM_EXPORT SelectionState final {
	QList<ObjectId> selected;

	bool contains(ObjectId id) const { return selected.contains(id); }

	friend bool operator==(const SelectionState& a, const SelectionState& b) { return a.selected == b.selected; }
	friend bool operator!=(const SelectionState& a, const SelectionState& b) { return !(a == b); }
};

// JSON wire form of a presence value. decode() returns nullopt for payloads
// that do not describe a valid value.
template <typename T>
struct PresenceCodec;

template <>
struct TANDEM_EXPORT PresenceCodec<DragState> {
	static QJsonObject encode(const DragState& state);
	static std::optional<DragState> decode(const QJsonObject& obj);
};

template <>
struct TANDEM_EXPORT PresenceCodec<ResizeState> {
	static QJsonObject encode(const ResizeState& state);
	static std::optional<ResizeState> decode(const QJsonObject& obj);
};

template <>
struct TANDEM_EXPORT PresenceCodec<SelectionState> {
	static QJsonObject encode(const SelectionState& state);
	static std::optional<SelectionState> decode(const QJsonObject& obj);
};

} // namespace Tandem
