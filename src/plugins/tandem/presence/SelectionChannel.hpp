// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/presence/PresenceChannel.hpp"

#include <QtCore/QList>

namespace Tandem {

class TANDEM_EXPORT SelectionChannel final
{
public:
	SelectionChannel(Api::IPresenceTransport& transport, ClientId self);

	PresenceChannel<SelectionState>& channel() { return m_channel; }
	const PresenceChannel<SelectionState>& channel() const { return m_channel; }

	QList<ObjectId> selection() const;

	void setSelection(const QList<ObjectId>& ids);
	void toggleSelection(ObjectId id);
	void clearSelection();

	bool testSelection(ObjectId id) const;
	bool testRemoteSelection(ObjectId id) const;

	// Remote clients currently selecting `id`, ascending.
	QList<ClientId> remoteSelectors(ObjectId id) const;

private:
	PresenceChannel<SelectionState> m_channel;
};

} // namespace Tandem
