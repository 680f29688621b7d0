// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemSettings.hpp"
#include "tandem/TandemTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QSizeF>

#include <optional>

namespace Tandem {

class PresenceSession;
class TandemItem;

namespace Api {
class ITandemDocument;
}

// What a renderer draws for one item: ephemeral values override persisted
// ones, grouped children are placed relative to the group's displayed origin.
struct TANDEM_EXPORT DisplayTransform final {
	QPointF position;
	double rotation = 0.0;
	QSizeF size;
	std::optional<double> dimensionOverride;
	bool manipulating = false;
};

class TANDEM_EXPORT DisplayResolver final
{
public:
	DisplayResolver(const Api::ITandemDocument& document,
					const PresenceSession& presence,
					TandemSettings settings = {});

	const TandemSettings& settings() const noexcept { return m_settings; }
	void setSettings(const TandemSettings& settings) { m_settings = settings; }

	DisplayTransform resolve(const TandemItem& item) const;
	std::optional<DisplayTransform> resolve(ObjectId itemId) const;

	// Persisted group position unless the group itself is being dragged.
	QPointF groupPosition(const TandemItem& group) const;

	bool isGridChild(const TandemItem& item) const;
	bool canDrag(const TandemItem& item) const;
	bool canRotate(const TandemItem& item) const;
	bool canResize(const TandemItem& item) const;

private:
	const Api::ITandemDocument& m_document;
	const PresenceSession& m_presence;
	TandemSettings m_settings;
};

} // namespace Tandem
