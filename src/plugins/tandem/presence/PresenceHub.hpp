// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/api/IPresenceTransport.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>

namespace Tandem {

// In-process presence transport connecting the sessions of one process.
// Queued delivery posts each update to the event loop, the way a network
// transport would surface it.
class TANDEM_EXPORT PresenceHub final : public Api::IPresenceTransport
{
	Q_OBJECT

public:
	enum class DeliveryMode : quint8 {
		Immediate,
		Queued
	};

	explicit PresenceHub(DeliveryMode mode = DeliveryMode::Immediate, QObject* parent = nullptr);
	~PresenceHub() override;

	DeliveryMode deliveryMode() const noexcept { return m_mode; }
	void setDeliveryMode(DeliveryMode mode) { m_mode = mode; }

	ClientId connectClient() override;
	void disconnectClient(ClientId client) override;
	bool isConnected(ClientId client) const override;

	void send(ClientId from, const QString& topic, const std::optional<QJsonObject>& payload) override;

	ListenerId listen(ClientId receiver, const QString& topic, Delivery delivery) override;
	void unlisten(ListenerId listener) override;

	QList<ClientId> clients() const;
	std::optional<QJsonObject> valueOf(ClientId client, const QString& topic) const;

private:
	struct Listener final {
		ClientId receiver{};
		QString topic;
		Delivery delivery;
	};

	void broadcast(ClientId from, const QString& topic, const std::optional<QJsonObject>& payload);
	void dispatch(ListenerId listener, ClientId from, const std::optional<QJsonObject>& payload);
	void deliverNow(ListenerId listener, ClientId from, const std::optional<QJsonObject>& payload);

	DeliveryMode m_mode = DeliveryMode::Immediate;
	QHash<ClientId, QHash<QString, QJsonObject>> m_values;
	QHash<ListenerId, Listener> m_listeners;
	quint64 m_nextClient = 1;
	ListenerId m_nextListener = 1;
};

} // namespace Tandem
