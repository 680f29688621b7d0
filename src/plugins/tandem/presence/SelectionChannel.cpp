#include "tandem/presence/SelectionChannel.hpp"

#include "tandem/TandemConstants.hpp"

#include <algorithm>

namespace Tandem {

SelectionChannel::SelectionChannel(Api::IPresenceTransport& transport, ClientId self)
	: m_channel(transport, self, QString::fromLatin1(Constants::kSelectionTopic))
{}

QList<ObjectId> SelectionChannel::selection() const
{
	const auto& local = m_channel.currentLocalValue();
	return local ? local->selected : QList<ObjectId>{};
}

void SelectionChannel::setSelection(const QList<ObjectId>& ids)
{
	SelectionState state;
	for (const ObjectId id : ids) {
		if (id && !state.selected.contains(id))
			state.selected.push_back(id);
	}
	if (state.selected.isEmpty()) {
		clearSelection();
		return;
	}
	m_channel.publish(state);
}

void SelectionChannel::toggleSelection(ObjectId id)
{
	if (!id)
		return;
	QList<ObjectId> ids = selection();
	if (ids.contains(id))
		ids.removeAll(id);
	else
		ids.push_back(id);
	setSelection(ids);
}

void SelectionChannel::clearSelection()
{
	m_channel.clear();
}

bool SelectionChannel::testSelection(ObjectId id) const
{
	const auto& local = m_channel.currentLocalValue();
	return local && local->contains(id);
}

bool SelectionChannel::testRemoteSelection(ObjectId id) const
{
	return !remoteSelectors(id).isEmpty();
}

QList<ClientId> SelectionChannel::remoteSelectors(ObjectId id) const
{
	QList<ClientId> out;
	const auto& remote = m_channel.remoteValues();
	for (auto it = remote.cbegin(); it != remote.cend(); ++it) {
		if (it->contains(id))
			out.push_back(it.key());
	}
	std::sort(out.begin(), out.end());
	return out;
}

} // namespace Tandem
