#include "tandem/interaction/GestureArbiter.hpp"

#include <QtCore/QDebug>

#include <utility>

namespace Tandem {

GestureArbiter::~GestureArbiter() = default;

GestureToken GestureArbiter::begin(InputClass cls, Cleanup cleanup)
{
	cancel(cls);

	Slot& slot = m_slots[indexOf(cls)];
	slot.token = GestureToken(m_nextToken++);
	slot.cleanup = std::move(cleanup);
	return slot.token;
}

bool GestureArbiter::end(InputClass cls, GestureToken token)
{
	Slot& slot = m_slots[indexOf(cls)];
	if (!token || slot.token != token)
		return false;
	slot = Slot{};
	return true;
}

void GestureArbiter::cancel(InputClass cls)
{
	Slot& slot = m_slots[indexOf(cls)];
	if (!slot.token)
		return;

	// The slot is already free while the cleanup runs.
	Cleanup cleanup = std::exchange(slot.cleanup, {});
	const GestureToken superseded = std::exchange(slot.token, GestureToken{});
	qCDebug(tandemgesturelog) << "Cancelling gesture" << superseded.value();
	if (cleanup)
		cleanup();
}

void GestureArbiter::cancelAll()
{
	cancel(InputClass::Mouse);
	cancel(InputClass::Touch);
}

bool GestureArbiter::isActive(InputClass cls) const
{
	return m_slots[indexOf(cls)].token.isValid();
}

bool GestureArbiter::owns(InputClass cls, GestureToken token) const
{
	return token && m_slots[indexOf(cls)].token == token;
}

} // namespace Tandem
