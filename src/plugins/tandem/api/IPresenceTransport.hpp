// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>
#include <optional>

namespace Tandem::Api {

// Per-client, per-topic last-value broadcast. A nullopt payload means the
// sender cleared its value. Values of a client expire when it disconnects.
class TANDEM_EXPORT IPresenceTransport : public QObject
{
    Q_OBJECT

public:
    using Delivery = std::function<void(ClientId from, const std::optional<QJsonObject>& payload)>;
    using ListenerId = quint64;

    using QObject::QObject;
    ~IPresenceTransport() override = default;

    virtual ClientId connectClient() = 0;
    virtual void disconnectClient(ClientId client) = 0;
    virtual bool isConnected(ClientId client) const = 0;

    virtual void send(ClientId from, const QString& topic, const std::optional<QJsonObject>& payload) = 0;

    // Receives every other client's updates on `topic`. Values already held
    // by connected clients are replayed immediately.
    virtual ListenerId listen(ClientId receiver, const QString& topic, Delivery delivery) = 0;
    virtual void unlisten(ListenerId listener) = 0;

signals:
    void clientConnected(Tandem::ClientId client);
    void clientDisconnected(Tandem::ClientId client);
};

} // namespace Tandem::Api
