// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"
#include "tandem/presence/PresenceChannel.hpp"
#include "tandem/presence/SelectionChannel.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>

#include <optional>
#include <vector>

namespace Tandem {

// Presence context of one client: the drag, resize and selection topics on a
// shared transport. Connects on construction, disconnects on destruction.
class TANDEM_EXPORT PresenceSession final : public QObject
{
	Q_OBJECT

public:
	explicit PresenceSession(Api::IPresenceTransport& transport,
							 QString branch = {},
							 QObject* parent = nullptr);
	~PresenceSession() override;

	ClientId clientId() const noexcept { return m_client; }
	const QString& branch() const noexcept { return m_branch; }

	PresenceChannel<DragState>& drag() { return *m_drag; }
	const PresenceChannel<DragState>& drag() const { return *m_drag; }
	PresenceChannel<ResizeState>& resize() { return *m_resize; }
	const PresenceChannel<ResizeState>& resize() const { return *m_resize; }
	SelectionChannel& selection() { return *m_selection; }
	const SelectionChannel& selection() const { return *m_selection; }

	// Local value first, then connected remotes in ascending client order.
	std::optional<DragState> activeDragFor(ObjectId itemId) const;
	std::optional<ResizeState> activeResizeFor(ObjectId itemId) const;

	bool isRemotelyManipulated(ObjectId itemId) const;

signals:
	void presenceChanged();

private:
	template <typename T>
	std::optional<T> findActive(const PresenceChannel<T>& channel, ObjectId itemId) const;

	QPointer<Api::IPresenceTransport> m_transport;
	ClientId m_client{};
	QString m_branch;

	std::unique_ptr<PresenceChannel<DragState>> m_drag;
	std::unique_ptr<PresenceChannel<ResizeState>> m_resize;
	std::unique_ptr<SelectionChannel> m_selection;
	std::vector<PresenceSubscription> m_subscriptions;
};

} // namespace Tandem
