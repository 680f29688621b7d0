#include "tandem/presence/EphemeralStates.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>

#include <cmath>

using namespace Qt::StringLiterals;

namespace Tandem {

namespace {

QJsonValue idToJson(ObjectId id)
{
	return QString::number(id.value());
}

std::optional<ObjectId> idFromJson(const QJsonValue& value)
{
	if (!value.isString())
		return std::nullopt;
	bool ok = false;
	const quint64 raw = value.toString().toULongLong(&ok);
	if (!ok || raw == 0)
		return std::nullopt;
	return ObjectId(raw);
}

std::optional<double> finiteNumber(const QJsonObject& obj, QLatin1StringView key)
{
	const QJsonValue v = obj.value(key);
	if (!v.isDouble())
		return std::nullopt;
	const double d = v.toDouble();
	if (!std::isfinite(d))
		return std::nullopt;
	return d;
}

} // namespace

QJsonObject PresenceCodec<DragState>::encode(const DragState& state)
{
	QJsonObject obj;
	obj.insert(u"itemId"_s, idToJson(state.itemId));
	obj.insert(u"x"_s, state.x);
	obj.insert(u"y"_s, state.y);
	obj.insert(u"rotation"_s, state.rotation);
	obj.insert(u"branch"_s, state.branch);
	return obj;
}

std::optional<DragState> PresenceCodec<DragState>::decode(const QJsonObject& obj)
{
	const auto id = idFromJson(obj.value("itemId"_L1));
	const auto x = finiteNumber(obj, "x"_L1);
	const auto y = finiteNumber(obj, "y"_L1);
	const auto rotation = finiteNumber(obj, "rotation"_L1);
	if (!id || !x || !y || !rotation)
		return std::nullopt;

	DragState state;
	state.itemId = *id;
	state.x = *x;
	state.y = *y;
	state.rotation = *rotation;
	state.branch = obj.value("branch"_L1).toString();
	return state;
}

QJsonObject PresenceCodec<ResizeState>::encode(const ResizeState& state)
{
	QJsonObject obj;
	obj.insert(u"itemId"_s, idToJson(state.itemId));
	obj.insert(u"x"_s, state.x);
	obj.insert(u"y"_s, state.y);
	obj.insert(u"size"_s, state.size);
	return obj;
}

std::optional<ResizeState> PresenceCodec<ResizeState>::decode(const QJsonObject& obj)
{
	const auto id = idFromJson(obj.value("itemId"_L1));
	const auto x = finiteNumber(obj, "x"_L1);
	const auto y = finiteNumber(obj, "y"_L1);
	const auto size = finiteNumber(obj, "size"_L1);
	if (!id || !x || !y || !size || *size <= 0.0)
		return std::nullopt;

	return ResizeState{*id, *x, *y, *size};
}

QJsonObject PresenceCodec<SelectionState>::encode(const SelectionState& state)
{
	QJsonArray ids;
	for (const ObjectId id : state.selected)
		ids.append(idToJson(id));

	QJsonObject obj;
	obj.insert(u"selected"_s, ids);
	return obj;
}

std::optional<SelectionState> PresenceCodec<SelectionState>::decode(const QJsonObject& obj)
{
	const QJsonValue v = obj.value("selected"_L1);
	if (!v.isArray())
		return std::nullopt;

	SelectionState state;
	for (const QJsonValue& entry : v.toArray()) {
		const auto id = idFromJson(entry);
		if (!id)
			return std::nullopt;
		if (!state.selected.contains(*id))
			state.selected.push_back(*id);
	}
	return state;
}

} // namespace Tandem
