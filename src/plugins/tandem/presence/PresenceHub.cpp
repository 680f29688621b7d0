// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/presence/PresenceHub.hpp"

#include <QtCore/QDebug>
#include <QtCore/QMetaObject>

#include <algorithm>

namespace Tandem {

PresenceHub::PresenceHub(DeliveryMode mode, QObject* parent)
	: Api::IPresenceTransport(parent)
	, m_mode(mode)
{}

PresenceHub::~PresenceHub() = default;

ClientId PresenceHub::connectClient()
{
	const ClientId client(m_nextClient++);
	m_values.insert(client, {});
	qCDebug(tandempresencelog) << "Client connected" << client.value();
	emit clientConnected(client);
	return client;
}

void PresenceHub::disconnectClient(ClientId client)
{
	auto it = m_values.find(client);
	if (it == m_values.end())
		return;

	const QStringList topics = it->keys();
	m_values.erase(it);

	for (auto l = m_listeners.begin(); l != m_listeners.end();) {
		if (l->receiver == client)
			l = m_listeners.erase(l);
		else
			++l;
	}

	// Remaining clients see the departed client's values expire.
	for (const QString& topic : topics)
		broadcast(client, topic, std::nullopt);

	qCDebug(tandempresencelog) << "Client disconnected" << client.value();
	emit clientDisconnected(client);
}

bool PresenceHub::isConnected(ClientId client) const
{
	return m_values.contains(client);
}

void PresenceHub::send(ClientId from, const QString& topic, const std::optional<QJsonObject>& payload)
{
	auto it = m_values.find(from);
	if (it == m_values.end()) {
		qCWarning(tandempresencelog) << "Dropping update on" << topic << "from unknown client" << from.value();
		return;
	}

	if (payload)
		it->insert(topic, *payload);
	else
		it->remove(topic);

	broadcast(from, topic, payload);
}

PresenceHub::ListenerId PresenceHub::listen(ClientId receiver, const QString& topic, Delivery delivery)
{
	if (!isConnected(receiver) || !delivery)
		return 0;

	const ListenerId id = m_nextListener++;
	m_listeners.insert(id, Listener{receiver, topic, std::move(delivery)});

	QList<ClientId> holders;
	for (auto it = m_values.cbegin(); it != m_values.cend(); ++it) {
		if (it.key() != receiver && it->contains(topic))
			holders.push_back(it.key());
	}
	std::sort(holders.begin(), holders.end());
	for (const ClientId holder : holders)
		dispatch(id, holder, m_values.value(holder).value(topic));

	return id;
}

void PresenceHub::unlisten(ListenerId listener)
{
	m_listeners.remove(listener);
}

QList<ClientId> PresenceHub::clients() const
{
	QList<ClientId> out = m_values.keys();
	std::sort(out.begin(), out.end());
	return out;
}

std::optional<QJsonObject> PresenceHub::valueOf(ClientId client, const QString& topic) const
{
	const auto it = m_values.constFind(client);
	if (it == m_values.cend() || !it->contains(topic))
		return std::nullopt;
	return it->value(topic);
}

void PresenceHub::broadcast(ClientId from, const QString& topic, const std::optional<QJsonObject>& payload)
{
	QList<ListenerId> targets;
	for (auto it = m_listeners.cbegin(); it != m_listeners.cend(); ++it) {
		if (it->receiver != from && it->topic == topic)
			targets.push_back(it.key());
	}
	std::sort(targets.begin(), targets.end());

	for (const ListenerId id : targets)
		dispatch(id, from, payload);
}

void PresenceHub::dispatch(ListenerId listener, ClientId from, const std::optional<QJsonObject>& payload)
{
	if (m_mode == DeliveryMode::Immediate) {
		deliverNow(listener, from, payload);
		return;
	}

	QMetaObject::invokeMethod(this, [this, listener, from, payload]() {
		deliverNow(listener, from, payload);
	}, Qt::QueuedConnection);
}

void PresenceHub::deliverNow(ListenerId listener, ClientId from, const std::optional<QJsonObject>& payload)
{
	const auto it = m_listeners.constFind(listener);
	if (it == m_listeners.cend())
		return;

	// The callback may unlisten itself.
	const Delivery delivery = it->delivery;
	delivery(from, payload);
}

} // namespace Tandem
