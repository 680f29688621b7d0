// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"
#include "tandem/api/IPresenceTransport.hpp"
#include "tandem/presence/EphemeralStates.hpp"

#include <QtCore/QDebug>
#include <QtCore/QHash>
#include <QtCore/QJsonDocument>
#include <QtCore/QPointer>
#include <QtCore/QString>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace Tandem {

// Move-only handle; unsubscribes on destruction. Safe to outlive the channel.
class TANDEM_EXPORT PresenceSubscription final
{
public:
	PresenceSubscription() = default;
	explicit PresenceSubscription(std::function<void()> release);
	~PresenceSubscription();

	PresenceSubscription(const PresenceSubscription&) = delete;
	PresenceSubscription& operator=(const PresenceSubscription&) = delete;

	PresenceSubscription(PresenceSubscription&& other) noexcept;
	PresenceSubscription& operator=(PresenceSubscription&& other) noexcept;

	void unsubscribe();
	bool isActive() const noexcept { return static_cast<bool>(m_release); }

private:
	std::function<void()> m_release;
};

// Typed last-value-wins presence topic for one client. Local subscribers see
// this client's own updates; remote subscribers see every other client's,
// with clears delivered as nullopt.
template <typename T>
class PresenceChannel final
{
public:
	using LocalHandler = std::function<void(const std::optional<T>& value)>;
	using RemoteHandler = std::function<void(ClientId client, const std::optional<T>& value)>;

	PresenceChannel(Api::IPresenceTransport& transport, ClientId self, QString topic)
		: m_transport(&transport)
		, m_self(self)
		, m_topic(std::move(topic))
		, m_subscribers(std::make_shared<std::vector<Subscriber>>())
	{
		m_listener = transport.listen(m_self, m_topic,
			[this](ClientId from, const std::optional<QJsonObject>& payload) {
				handleRemote(from, payload);
			});
	}

	~PresenceChannel()
	{
		if (m_transport && m_listener)
			m_transport->unlisten(m_listener);
	}

	PresenceChannel(const PresenceChannel&) = delete;
	PresenceChannel& operator=(const PresenceChannel&) = delete;

	ClientId clientId() const noexcept { return m_self; }
	const QString& topic() const noexcept { return m_topic; }

	void publish(const T& value)
	{
		m_local = value;
		if (m_transport)
			m_transport->send(m_self, m_topic, PresenceCodec<T>::encode(value));
		notifyLocal(m_local);
	}

	void clear()
	{
		if (!m_local)
			return;
		m_local.reset();
		if (m_transport)
			m_transport->send(m_self, m_topic, std::nullopt);
		notifyLocal(m_local);
	}

	PresenceSubscription subscribe(LocalHandler onLocal, RemoteHandler onRemote = {})
	{
		const quint64 id = m_nextSubscriber++;
		m_subscribers->push_back(Subscriber{id, std::move(onLocal), std::move(onRemote)});

		std::weak_ptr<std::vector<Subscriber>> weak = m_subscribers;
		return PresenceSubscription([weak, id]() {
			auto subs = weak.lock();
			if (!subs)
				return;
			subs->erase(std::remove_if(subs->begin(), subs->end(),
									   [id](const Subscriber& s) { return s.id == id; }),
						subs->end());
		});
	}

	const std::optional<T>& currentLocalValue() const noexcept { return m_local; }
	const QHash<ClientId, T>& remoteValues() const noexcept { return m_remote; }

	std::optional<T> remoteValue(ClientId client) const
	{
		const auto it = m_remote.constFind(client);
		if (it == m_remote.cend())
			return std::nullopt;
		return *it;
	}

private:
	struct Subscriber final {
		quint64 id = 0;
		LocalHandler local;
		RemoteHandler remote;
	};

	void notifyLocal(const std::optional<T>& value)
	{
		const auto snapshot = *m_subscribers;
		for (const Subscriber& s : snapshot) {
			if (s.local)
				s.local(value);
		}
	}

	void notifyRemote(ClientId from, const std::optional<T>& value)
	{
		const auto snapshot = *m_subscribers;
		for (const Subscriber& s : snapshot) {
			if (s.remote)
				s.remote(from, value);
		}
	}

	void handleRemote(ClientId from, const std::optional<QJsonObject>& payload)
	{
		if (from == m_self)
			return;

		if (!payload) {
			if (m_remote.remove(from) == 0)
				return;
			notifyRemote(from, std::nullopt);
			return;
		}

		const std::optional<T> value = PresenceCodec<T>::decode(*payload);
		if (!value) {
			qCWarning(tandempresencelog).noquote()
				<< "Ignoring malformed" << m_topic << "payload from client" << from.value() << ":"
				<< QString::fromUtf8(QJsonDocument(*payload).toJson(QJsonDocument::Compact));
			return;
		}

		m_remote.insert(from, *value);
		notifyRemote(from, value);
	}

	QPointer<Api::IPresenceTransport> m_transport;
	ClientId m_self{};
	QString m_topic;
	Api::IPresenceTransport::ListenerId m_listener = 0;

	std::optional<T> m_local;
	QHash<ClientId, T> m_remote;

	std::shared_ptr<std::vector<Subscriber>> m_subscribers;
	quint64 m_nextSubscriber = 1;
};

} // namespace Tandem
