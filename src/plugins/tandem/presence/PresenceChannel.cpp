#include "tandem/presence/PresenceChannel.hpp"

namespace Tandem {

PresenceSubscription::PresenceSubscription(std::function<void()> release)
	: m_release(std::move(release))
{}

PresenceSubscription::~PresenceSubscription()
{
	unsubscribe();
}

PresenceSubscription::PresenceSubscription(PresenceSubscription&& other) noexcept
	: m_release(std::exchange(other.m_release, {}))
{}

PresenceSubscription& PresenceSubscription::operator=(PresenceSubscription&& other) noexcept
{
	if (this != &other) {
		unsubscribe();
		m_release = std::exchange(other.m_release, {});
	}
	return *this;
}

void PresenceSubscription::unsubscribe()
{
	if (!m_release)
		return;
	auto release = std::exchange(m_release, {});
	release();
}

} // namespace Tandem
