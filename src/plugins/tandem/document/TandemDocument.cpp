// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "tandem/document/TandemDocument.hpp"

#include <QtCore/QDebug>

#include <utility>

using namespace Qt::StringLiterals;

namespace Tandem {

namespace {

using ItemList = std::vector<std::unique_ptr<TandemItem>>;

TandemItem* findInSubtree(TandemItem& root, ObjectId id)
{
	if (root.id() == id)
		return &root;
	auto* group = root.contentAs<GroupContent>();
	if (!group)
		return nullptr;
	for (const auto& child : group->children()) {
		if (auto* hit = findInSubtree(*child, id))
			return hit;
	}
	return nullptr;
}

class SubtreeScope final : public Api::ITransactionScope
{
public:
	explicit SubtreeScope(TandemItem& root) : m_root(root) {}

	ObjectId scopeId() const override { return m_root.id(); }
	TandemItem* item(ObjectId id) override { return findInSubtree(m_root, id); }

private:
	TandemItem& m_root;
};

} // namespace

TandemDocument::TandemDocument(QObject* parent)
	: Api::ITandemDocument(parent)
{}

TandemDocument::~TandemDocument() = default;

TandemItem* TandemDocument::createShape(const QPointF& pos, ShapeKind shape, double size,
										const QString& color, ObjectId parentGroup)
{
	auto content = std::make_unique<ShapeContent>(shape, size, color);
	return insertItem(std::make_unique<TandemItem>(allocateId(), pos, 0.0, std::move(content)), parentGroup);
}

TandemItem* TandemDocument::createNote(const QPointF& pos, const QString& text, const QString& color,
									   ObjectId parentGroup)
{
	auto content = std::make_unique<NoteContent>(text, color);
	return insertItem(std::make_unique<TandemItem>(allocateId(), pos, 0.0, std::move(content)), parentGroup);
}

TandemItem* TandemDocument::createText(const QPointF& pos, const QString& text, double width,
									   double fontSize, ObjectId parentGroup)
{
	auto content = std::make_unique<TextContent>(text, width, fontSize);
	return insertItem(std::make_unique<TandemItem>(allocateId(), pos, 0.0, std::move(content)), parentGroup);
}

TandemItem* TandemDocument::createTable(const QPointF& pos, int rows, int columns, ObjectId parentGroup)
{
	auto content = std::make_unique<TableContent>(rows, columns);
	return insertItem(std::make_unique<TandemItem>(allocateId(), pos, 0.0, std::move(content)), parentGroup);
}

TandemItem* TandemDocument::createGroup(const QPointF& pos, const QString& name, bool viewAsGrid)
{
	auto content = std::make_unique<GroupContent>(name, viewAsGrid);
	return insertItem(std::make_unique<TandemItem>(allocateId(), pos, 0.0, std::move(content)));
}

std::vector<std::unique_ptr<TandemItem>>* TandemDocument::containerFor(ObjectId parentGroup)
{
	if (!parentGroup)
		return &m_items;
	TandemItem* parent = findItem(parentGroup);
	if (!parent)
		return nullptr;
	auto* group = parent->contentAs<GroupContent>();
	return group ? &group->children() : nullptr;
}

TandemItem* TandemDocument::insertItem(std::unique_ptr<TandemItem> item, ObjectId parentGroup)
{
	if (!item || !item->id())
		return nullptr;
	if (m_inTransaction) {
		qCWarning(tandemdocumentlog) << "insertItem rejected during a transaction";
		return nullptr;
	}
	if (findItem(item->id())) {
		qCWarning(tandemdocumentlog) << "insertItem: duplicate id" << item->id().value();
		return nullptr;
	}
	// Groups hold leaves only.
	if (parentGroup && item->isGroup()) {
		qCWarning(tandemdocumentlog) << "insertItem: groups cannot be nested";
		return nullptr;
	}

	auto* container = containerFor(parentGroup);
	if (!container) {
		qCWarning(tandemdocumentlog) << "insertItem: parent" << parentGroup.value() << "is not a group";
		return nullptr;
	}

	if (item->id().value() >= m_nextId)
		m_nextId = item->id().value() + 1;

	TandemItem* raw = item.get();
	container->push_back(std::move(item));
	++m_revision;
	emit changed();
	return raw;
}

std::unique_ptr<TandemItem> TandemDocument::removeItem(ObjectId id)
{
	if (m_inTransaction)
		return {};
	const auto loc = locate(id);
	if (!loc)
		return {};

	auto it = loc->container->begin() + static_cast<std::ptrdiff_t>(loc->index);
	std::unique_ptr<TandemItem> removed = std::move(*it);
	loc->container->erase(it);
	++m_revision;
	emit changed();
	return removed;
}

bool TandemDocument::setGroupViewAsGrid(ObjectId groupId, bool viewAsGrid)
{
	const Utils::Result r = runTransaction(groupId, u"Toggle grid view"_s,
		[groupId, viewAsGrid](Api::ITransactionScope& scope) {
			TandemItem* item = scope.item(groupId);
			auto* group = item ? item->contentAs<GroupContent>() : nullptr;
			if (!group)
				return Utils::Result::failure(Utils::ResultCode::InvalidArgument, u"Item is not a group"_s);
			group->setViewAsGrid(viewAsGrid);
			return Utils::Result::success();
		});
	return r.ok;
}

std::optional<TandemDocument::Location> TandemDocument::locate(ObjectId id) const
{
	if (!id)
		return std::nullopt;

	auto* roots = const_cast<ItemList*>(&m_items);
	for (size_t i = 0; i < roots->size(); ++i) {
		TandemItem* root = (*roots)[i].get();
		if (root->id() == id)
			return Location{root, nullptr, roots, i};

		auto* group = root->contentAs<GroupContent>();
		if (!group)
			continue;
		auto& children = group->children();
		for (size_t c = 0; c < children.size(); ++c) {
			if (children[c]->id() == id)
				return Location{children[c].get(), root, &children, c};
		}
	}
	return std::nullopt;
}

TandemItem* TandemDocument::findItem(ObjectId id) const
{
	const auto loc = locate(id);
	return loc ? loc->item : nullptr;
}

TandemItem* TandemDocument::parentOf(ObjectId id) const
{
	const auto loc = locate(id);
	return loc ? loc->parent : nullptr;
}

Utils::Result TandemDocument::runTransaction(ObjectId scope,
											 const QString& label,
											 const Api::TransactionBody& body)
{
	if (m_inTransaction) {
		qCWarning(tandemdocumentlog) << "Nested transaction rejected:" << label;
		return Utils::Result::failure(Utils::ResultCode::Rejected,
									  u"Nested transaction '%1' rejected"_s.arg(label));
	}
	if (!body)
		return Utils::Result::failure(Utils::ResultCode::InvalidArgument, u"Empty transaction body"_s);

	TandemItem* root = findItem(scope);
	if (!root) {
		return Utils::Result::failure(Utils::ResultCode::MissingItem,
									  u"Transaction scope %1 not found"_s.arg(scope.value()));
	}

	const std::unique_ptr<TandemItem> snapshot = root->clone();

	m_inTransaction = true;
	SubtreeScope txScope(*root);
	Utils::Result result = body(txScope);
	if (result.ok && m_gate)
		result = m_gate(label, scope);
	m_inTransaction = false;

	if (!result.ok) {
		root->restoreFrom(*snapshot);
		qCWarning(tandemdocumentlog).noquote()
			<< "Transaction" << label << "on" << scope.value() << "rolled back:" << result.message();
		emit transactionRejected(label, scope, result.message());
		return result;
	}

	++m_revision;
	qCDebug(tandemdocumentlog) << "Transaction committed" << label << scope.value();
	emit transactionCommitted(label, scope);
	emit changed();
	return result;
}

} // namespace Tandem
