#include "tandem/interaction/InteractionState.hpp"

#include <algorithm>

namespace Tandem {

InteractionState::InteractionState(QObject* parent)
	: QObject(parent)
{
	m_timer.start();
}

void InteractionState::beginManipulation()
{
	if (++m_manipulators == 1)
		emit manipulatingChanged(true);
}

void InteractionState::endManipulation()
{
	if (m_manipulators == 0)
		return;
	if (--m_manipulators == 0)
		emit manipulatingChanged(false);
}

void InteractionState::suppressBackgroundClear(int durationMs)
{
	m_suppressUntil = std::max(m_suppressUntil, now() + std::max(0, durationMs));
}

bool InteractionState::isBackgroundClearSuppressed() const
{
	return m_suppressUntil >= 0 && now() < m_suppressUntil;
}

void InteractionState::setClock(Clock clock)
{
	m_clock = std::move(clock);
	m_suppressUntil = -1;
}

qint64 InteractionState::now() const
{
	return m_clock ? m_clock() : m_timer.elapsed();
}

} // namespace Tandem
