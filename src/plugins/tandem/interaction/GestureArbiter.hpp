// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <array>
#include <functional>

namespace Tandem {

struct GestureTokenTag {};
using GestureToken = StrongId<GestureTokenTag>;

// One active gesture per input class. Starting a gesture cancels the current
// occupant of its slot by running that gesture's cleanup.
class TANDEM_EXPORT GestureArbiter final
{
public:
	using Cleanup = std::function<void()>;

	GestureArbiter() = default;
	~GestureArbiter();

	GestureArbiter(const GestureArbiter&) = delete;
	GestureArbiter& operator=(const GestureArbiter&) = delete;

	GestureToken begin(InputClass cls, Cleanup cleanup);

	// Frees the slot when `token` still owns it. The cleanup is not run.
	bool end(InputClass cls, GestureToken token);

	void cancel(InputClass cls);
	void cancelAll();

	bool isActive(InputClass cls) const;
	bool owns(InputClass cls, GestureToken token) const;

private:
	struct Slot final {
		GestureToken token{};
		Cleanup cleanup;
	};

	static size_t indexOf(InputClass cls) { return static_cast<size_t>(cls); }

	std::array<Slot, 2> m_slots{};
	quint64 m_nextToken = 1;
};

} // namespace Tandem
