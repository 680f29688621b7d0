// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/document/CommitReconciler.hpp"

#include "tandem/api/ITandemDocument.hpp"
#include "tandem/document/TandemItem.hpp"

#include <QtCore/QDebug>

using namespace Qt::StringLiterals;

namespace Tandem {

namespace {

Utils::Result missingItem(ObjectId itemId)
{
	return Utils::Result::failure(Utils::ResultCode::MissingItem,
								  u"Item %1 is not in the transaction scope"_s.arg(itemId.value()));
}

} // namespace

CommitReconciler::CommitReconciler(Api::ITandemDocument& document, QObject* parent)
	: QObject(parent)
	, m_document(document)
{}

ObjectId CommitReconciler::transactionScopeFor(ObjectId itemId) const
{
	if (const TandemItem* parent = m_document.parentOf(itemId))
		return parent->id();
	return itemId;
}

Utils::Result CommitReconciler::commitMove(ObjectId itemId, const QPointF& position)
{
	const QString label = u"Move"_s;
	auto r = m_document.runTransaction(transactionScopeFor(itemId), label,
		[itemId, position](Api::ITransactionScope& scope) {
			TandemItem* item = scope.item(itemId);
			if (!item)
				return missingItem(itemId);
			item->setPosition(position);
			return Utils::Result::success();
		});
	return finish(itemId, label, std::move(r));
}

Utils::Result CommitReconciler::commitRotation(ObjectId itemId, double degrees)
{
	const QString label = u"Rotate"_s;
	auto r = m_document.runTransaction(transactionScopeFor(itemId), label,
		[itemId, degrees](Api::ITransactionScope& scope) {
			TandemItem* item = scope.item(itemId);
			if (!item)
				return missingItem(itemId);
			if (!item->content().canRotate()) {
				return Utils::Result::failure(Utils::ResultCode::InvalidArgument,
											  u"Item %1 cannot be rotated"_s.arg(itemId.value()));
			}
			item->setRotation(degrees);
			return Utils::Result::success();
		});
	return finish(itemId, label, std::move(r));
}

Utils::Result CommitReconciler::commitResize(ObjectId itemId, const QPointF& position, double dimension)
{
	const QString label = u"Resize"_s;
	auto r = m_document.runTransaction(transactionScopeFor(itemId), label,
		[itemId, position, dimension](Api::ITransactionScope& scope) {
			TandemItem* item = scope.item(itemId);
			if (!item)
				return missingItem(itemId);
			if (!item->content().canResize()) {
				return Utils::Result::failure(Utils::ResultCode::InvalidArgument,
											  u"Item %1 cannot be resized"_s.arg(itemId.value()));
			}
			item->setPosition(position);
			item->content().setResizableDimension(dimension);
			return Utils::Result::success();
		});
	return finish(itemId, label, std::move(r));
}

Utils::Result CommitReconciler::finish(ObjectId itemId, const QString& label, Utils::Result result)
{
	if (result.ok) {
		emit committed(itemId, label);
		return result;
	}

	qCWarning(tandemdocumentlog).noquote()
		<< label << "commit for item" << itemId.value() << "failed:" << result.message();
	emit commitFailed(itemId, label, result.message());
	return result;
}

} // namespace Tandem
