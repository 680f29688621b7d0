// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/presence/PresenceSession.hpp"

#include "tandem/TandemConstants.hpp"

#include <QtCore/QDebug>

#include <algorithm>

namespace Tandem {

PresenceSession::PresenceSession(Api::IPresenceTransport& transport, QString branch, QObject* parent)
	: QObject(parent)
	, m_transport(&transport)
	, m_client(transport.connectClient())
	, m_branch(std::move(branch))
{
	m_drag = std::make_unique<PresenceChannel<DragState>>(
		transport, m_client, QString::fromLatin1(Constants::kDragTopic));
	m_resize = std::make_unique<PresenceChannel<ResizeState>>(
		transport, m_client, QString::fromLatin1(Constants::kResizeTopic));
	m_selection = std::make_unique<SelectionChannel>(transport, m_client);

	m_subscriptions.push_back(m_drag->subscribe(
		[this](const std::optional<DragState>&) { emit presenceChanged(); },
		[this](ClientId, const std::optional<DragState>&) { emit presenceChanged(); }));
	m_subscriptions.push_back(m_resize->subscribe(
		[this](const std::optional<ResizeState>&) { emit presenceChanged(); },
		[this](ClientId, const std::optional<ResizeState>&) { emit presenceChanged(); }));
	m_subscriptions.push_back(m_selection->channel().subscribe(
		[this](const std::optional<SelectionState>&) { emit presenceChanged(); },
		[this](ClientId, const std::optional<SelectionState>&) { emit presenceChanged(); }));

	qCDebug(tandempresencelog) << "Presence session" << m_client.value() << "on branch" << m_branch;
}

PresenceSession::~PresenceSession()
{
	m_subscriptions.clear();
	m_selection.reset();
	m_resize.reset();
	m_drag.reset();
	if (m_transport)
		m_transport->disconnectClient(m_client);
}

template <typename T>
std::optional<T> PresenceSession::findActive(const PresenceChannel<T>& channel, ObjectId itemId) const
{
	if (const auto& local = channel.currentLocalValue(); local && local->itemId == itemId)
		return local;

	const auto& remote = channel.remoteValues();
	QList<ClientId> clients = remote.keys();
	std::sort(clients.begin(), clients.end());
	for (const ClientId client : clients) {
		if (m_transport && !m_transport->isConnected(client))
			continue;
		const T value = remote.value(client);
		if (value.itemId == itemId)
			return value;
	}
	return std::nullopt;
}

std::optional<DragState> PresenceSession::activeDragFor(ObjectId itemId) const
{
	return findActive(*m_drag, itemId);
}

std::optional<ResizeState> PresenceSession::activeResizeFor(ObjectId itemId) const
{
	return findActive(*m_resize, itemId);
}

bool PresenceSession::isRemotelyManipulated(ObjectId itemId) const
{
	for (const DragState& s : m_drag->remoteValues()) {
		if (s.itemId == itemId)
			return true;
	}
	for (const ResizeState& s : m_resize->remoteValues()) {
		if (s.itemId == itemId)
			return true;
	}
	return false;
}

} // namespace Tandem
