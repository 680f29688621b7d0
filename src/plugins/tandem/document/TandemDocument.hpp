// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "tandem/TandemGlobal.hpp"
#include "tandem/TandemTypes.hpp"
#include "tandem/api/ITandemDocument.hpp"
#include "tandem/document/TandemItem.hpp"

#include <QtCore/QPointF>
#include <QtCore/QString>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace Tandem {

// In-process shared tree. Edits inside runTransaction are all-or-nothing:
// the scope subtree is snapshotted and restored when the body or the commit
// gate rejects.
class TANDEM_EXPORT TandemDocument final : public Api::ITandemDocument
{
	Q_OBJECT

public:
	explicit TandemDocument(QObject* parent = nullptr);
	~TandemDocument() override;

	const std::vector<std::unique_ptr<TandemItem>>& items() const { return m_items; }

	ObjectId allocateId() { return ObjectId(m_nextId++); }

	TandemItem* createShape(const QPointF& pos, ShapeKind shape, double size,
							const QString& color, ObjectId parentGroup = {});
	TandemItem* createNote(const QPointF& pos, const QString& text, const QString& color,
						   ObjectId parentGroup = {});
	TandemItem* createText(const QPointF& pos, const QString& text, double width, double fontSize,
						   ObjectId parentGroup = {});
	TandemItem* createTable(const QPointF& pos, int rows, int columns, ObjectId parentGroup = {});
	TandemItem* createGroup(const QPointF& pos, const QString& name, bool viewAsGrid = false);

	// Takes ownership. Fails (nullptr) for duplicate ids, unknown or non-group
	// parents, and while a transaction is running.
	TandemItem* insertItem(std::unique_ptr<TandemItem> item, ObjectId parentGroup = {});
	std::unique_ptr<TandemItem> removeItem(ObjectId id);

	bool setGroupViewAsGrid(ObjectId groupId, bool viewAsGrid);

	TandemItem* findItem(ObjectId id) const override;
	TandemItem* parentOf(ObjectId id) const override;

	Utils::Result runTransaction(ObjectId scope,
								 const QString& label,
								 const Api::TransactionBody& body) override;
	bool inTransaction() const override { return m_inTransaction; }

	// Consulted after a body succeeds; a failure rolls the transaction back.
	// Stands in for a replicated store refusing a write.
	using CommitGate = std::function<Utils::Result(const QString& label, ObjectId scope)>;
	void setCommitGate(CommitGate gate) { m_gate = std::move(gate); }

	quint64 revision() const noexcept { return m_revision; }

private:
	struct Location final {
		TandemItem* item = nullptr;
		TandemItem* parent = nullptr;
		std::vector<std::unique_ptr<TandemItem>>* container = nullptr;
		size_t index = 0;
	};

	std::optional<Location> locate(ObjectId id) const;
	std::vector<std::unique_ptr<TandemItem>>* containerFor(ObjectId parentGroup);

	std::vector<std::unique_ptr<TandemItem>> m_items;
	quint64 m_nextId = 1;
	quint64 m_revision = 0;
	bool m_inTransaction = false;
	CommitGate m_gate;
};

} // namespace Tandem
