// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QMetaType>
#include <QtCore/QtGlobal>

namespace Tandem {

template <typename Tag>
class StrongId final
{
public:
	using value_type = quint64;

	constexpr StrongId() = default;
	explicit constexpr StrongId(value_type v) : m_value(v) {}

	constexpr value_type value() const { return m_value; }
	constexpr bool isValid() const { return m_value != 0; }

	explicit operator bool() const { return isValid(); }

	friend constexpr bool operator==(StrongId a, StrongId b) { return a.m_value == b.m_value; }
	friend constexpr bool operator!=(StrongId a, StrongId b) { return a.m_value != b.m_value; }
	friend constexpr bool operator<(StrongId a, StrongId b) { return a.m_value < b.m_value; }

private:
	value_type m_value = 0;
};

struct ObjectIdTag {};
struct ClientIdTag {};

using ObjectId = StrongId<ObjectIdTag>;
using ClientId = StrongId<ClientIdTag>;

// Input classes own independent arbitration slots.
enum class InputClass : quint8 {
	Mouse,
	Touch
};

#define DEFINE_QHASH_OVERLOAD(Id) \
inline size_t qHash(Id id, size_t seed = 0) noexcept {  \
	return ::qHash(id.value(), seed);					\
}

DEFINE_QHASH_OVERLOAD(Tandem::ObjectId)
DEFINE_QHASH_OVERLOAD(Tandem::ClientId)

#undef DEFINE_QHASH_OVERLOAD

} // namespace Tandem

Q_DECLARE_METATYPE(Tandem::ObjectId)
Q_DECLARE_METATYPE(Tandem::ClientId)
Q_DECLARE_METATYPE(Tandem::InputClass)
