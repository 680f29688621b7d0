// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QString>

namespace Tandem {

namespace Api {
class ITandemDocument;
}

// Turns the final value of a gesture into exactly one document transaction.
// Positions are in the item's own frame: relative to the parent group for
// grouped items, absolute otherwise. Values are written as given.
class TANDEM_EXPORT CommitReconciler final : public QObject
{
	Q_OBJECT

public:
	explicit CommitReconciler(Api::ITandemDocument& document, QObject* parent = nullptr);

	Api::ITandemDocument& document() const { return m_document; }

	Utils::Result commitMove(ObjectId itemId, const QPointF& position);
	Utils::Result commitRotation(ObjectId itemId, double degrees);
	Utils::Result commitResize(ObjectId itemId, const QPointF& position, double dimension);

	// The containing group when there is one, the item itself otherwise.
	ObjectId transactionScopeFor(ObjectId itemId) const;

signals:
	void committed(Tandem::ObjectId itemId, const QString& label);
	void commitFailed(Tandem::ObjectId itemId, const QString& label, const QString& message);

private:
	Utils::Result finish(ObjectId itemId, const QString& label, Utils::Result result);

	Api::ITandemDocument& m_document;
};

} // namespace Tandem
