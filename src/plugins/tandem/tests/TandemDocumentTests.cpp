// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <QtTest/QSignalSpy>

#include "tandem/document/TandemDocument.hpp"

using namespace Tandem;
using namespace Qt::StringLiterals;

TEST(TandemDocumentTests, CreatedItemsHaveStableDistinctIds)
{
    TandemDocument doc;
    TandemItem* a = doc.createShape(QPointF(0.0, 0.0), ShapeKind::Star, 100.0, u"#fff"_s);
    TandemItem* b = doc.createNote(QPointF(10.0, 10.0), u"hi"_s, u"yellow"_s);

    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(doc.findItem(a->id()), a);
    EXPECT_EQ(doc.findItem(b->id()), b);
    EXPECT_EQ(doc.findItem(ObjectId(9999)), nullptr);
}

TEST(TandemDocumentTests, ParentOfReportsContainingGroup)
{
    TandemDocument doc;
    TandemItem* group = doc.createGroup(QPointF(100.0, 100.0), u"G"_s);
    TandemItem* child = doc.createText(QPointF(5.0, 5.0), u"t"_s, 320.0, 18.0, group->id());
    TandemItem* loose = doc.createTable(QPointF(0.0, 0.0), 3, 4);

    ASSERT_NE(child, nullptr);
    EXPECT_EQ(doc.parentOf(child->id()), group);
    EXPECT_EQ(doc.parentOf(group->id()), nullptr);
    EXPECT_EQ(doc.parentOf(loose->id()), nullptr);
    EXPECT_EQ(doc.findItem(child->id()), child);
}

TEST(TandemDocumentTests, InsertRejectsNonGroupParentsAndNestedGroups)
{
    TandemDocument doc;
    TandemItem* shape = doc.createShape(QPointF(), ShapeKind::Circle, 50.0, u"#000"_s);
    TandemItem* group = doc.createGroup(QPointF(), u"G"_s);

    EXPECT_EQ(doc.createNote(QPointF(), u"x"_s, u"y"_s, shape->id()), nullptr);
    EXPECT_EQ(doc.createNote(QPointF(), u"x"_s, u"y"_s, ObjectId(4242)), nullptr);

    auto nested = std::make_unique<TandemItem>(doc.allocateId(), QPointF(), 0.0,
                                               std::make_unique<GroupContent>(u"inner"_s));
    EXPECT_EQ(doc.insertItem(std::move(nested), group->id()), nullptr);
}

TEST(TandemDocumentTests, TransactionCommitsAllFieldsAndNotifies)
{
    TandemDocument doc;
    TandemItem* shape = doc.createShape(QPointF(0.0, 0.0), ShapeKind::Square, 100.0, u"#000"_s);
    const ObjectId id = shape->id();

    QSignalSpy committed(&doc, &Api::ITandemDocument::transactionCommitted);
    QSignalSpy changed(&doc, &Api::ITandemDocument::changed);
    const quint64 revisionBefore = doc.revision();

    const auto r = doc.runTransaction(id, u"Resize"_s, [id](Api::ITransactionScope& scope) {
        TandemItem* item = scope.item(id);
        item->setPosition(QPointF(50.0, 50.0));
        item->content().setResizableDimension(200.0);
        return Utils::Result::success();
    });

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(shape->position(), QPointF(50.0, 50.0));
    EXPECT_DOUBLE_EQ(shape->content().resizableDimension(), 200.0);
    ASSERT_EQ(committed.count(), 1);
    EXPECT_EQ(committed.at(0).at(0).toString(), u"Resize"_s);
    EXPECT_EQ(committed.at(0).at(1).value<ObjectId>(), id);
    EXPECT_EQ(changed.count(), 1);
    EXPECT_GT(doc.revision(), revisionBefore);
}

TEST(TandemDocumentTests, FailedBodyRollsBackEveryEdit)
{
    TandemDocument doc;
    TandemItem* shape = doc.createShape(QPointF(10.0, 10.0), ShapeKind::Square, 100.0, u"#000"_s);
    const ObjectId id = shape->id();

    QSignalSpy rejected(&doc, &Api::ITandemDocument::transactionRejected);
    QSignalSpy committed(&doc, &Api::ITandemDocument::transactionCommitted);

    const auto r = doc.runTransaction(id, u"Broken"_s, [id](Api::ITransactionScope& scope) {
        TandemItem* item = scope.item(id);
        item->setPosition(QPointF(999.0, 999.0));
        item->content().setResizableDimension(5.0);
        return Utils::Result::failure(Utils::ResultCode::Rejected, u"conflict"_s);
    });

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, Utils::ResultCode::Rejected);
    EXPECT_EQ(shape->position(), QPointF(10.0, 10.0));
    EXPECT_DOUBLE_EQ(shape->content().resizableDimension(), 100.0);
    EXPECT_EQ(rejected.count(), 1);
    EXPECT_EQ(committed.count(), 0);
}

TEST(TandemDocumentTests, CommitGateRejectionRestoresGroupSubtree)
{
    TandemDocument doc;
    TandemItem* group = doc.createGroup(QPointF(0.0, 0.0), u"G"_s);
    TandemItem* child = doc.createShape(QPointF(20.0, 20.0), ShapeKind::Circle, 60.0, u"#000"_s, group->id());
    const ObjectId groupId = group->id();
    const ObjectId childId = child->id();

    doc.setCommitGate([](const QString&, ObjectId) {
        return Utils::Result::failure(Utils::ResultCode::Rejected, u"store refused"_s);
    });

    const auto r = doc.runTransaction(groupId, u"Move"_s, [childId](Api::ITransactionScope& scope) {
        scope.item(childId)->setPosition(QPointF(70.0, 80.0));
        return Utils::Result::success();
    });

    EXPECT_FALSE(r.ok);
    const TandemItem* restored = doc.findItem(childId);
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->position(), QPointF(20.0, 20.0));
    EXPECT_EQ(doc.parentOf(childId), group);
}

TEST(TandemDocumentTests, RejectedGroupTransactionKeepsChildPointers)
{
    TandemDocument doc;
    TandemItem* group = doc.createGroup(QPointF(0.0, 0.0), u"G"_s);
    TandemItem* first = doc.createShape(QPointF(20.0, 20.0), ShapeKind::Circle, 60.0, u"#000"_s, group->id());
    TandemItem* second = doc.createText(QPointF(100.0, 0.0), u"t"_s, 320.0, 18.0, group->id());
    auto* firstShape = first->contentAs<ShapeContent>();
    auto* groupContent = group->contentAs<GroupContent>();
    const ObjectId firstId = first->id();
    const ObjectId secondId = second->id();

    doc.setCommitGate([](const QString&, ObjectId) {
        return Utils::Result::failure(Utils::ResultCode::Rejected, u"store refused"_s);
    });

    const auto r = doc.runTransaction(group->id(), u"Resize"_s, [&](Api::ITransactionScope& scope) {
        scope.item(firstId)->setPosition(QPointF(70.0, 80.0));
        scope.item(firstId)->content().setResizableDimension(300.0);
        scope.item(secondId)->contentAs<TextContent>()->setWidth(900.0);
        return Utils::Result::success();
    });

    ASSERT_FALSE(r.ok);
    EXPECT_EQ(doc.findItem(firstId), first);
    EXPECT_EQ(doc.findItem(secondId), second);
    EXPECT_EQ(first->contentAs<ShapeContent>(), firstShape);
    EXPECT_EQ(group->contentAs<GroupContent>(), groupContent);
    EXPECT_EQ(first->position(), QPointF(20.0, 20.0));
    EXPECT_DOUBLE_EQ(firstShape->size(), 60.0);
    EXPECT_DOUBLE_EQ(second->contentAs<TextContent>()->width(), 320.0);
    EXPECT_EQ(groupContent->indexOf(first), 0);
    EXPECT_EQ(groupContent->indexOf(second), 1);
}

TEST(TandemDocumentTests, ScopeHidesItemsOutsideSubtree)
{
    TandemDocument doc;
    TandemItem* a = doc.createShape(QPointF(), ShapeKind::Circle, 50.0, u"#000"_s);
    TandemItem* b = doc.createShape(QPointF(), ShapeKind::Circle, 50.0, u"#000"_s);
    const ObjectId bId = b->id();

    bool sawOther = true;
    const auto r = doc.runTransaction(a->id(), u"Peek"_s, [&](Api::ITransactionScope& scope) {
        sawOther = scope.item(bId) != nullptr;
        return Utils::Result::success();
    });

    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(sawOther);
}

TEST(TandemDocumentTests, NestedTransactionsAreRejected)
{
    TandemDocument doc;
    TandemItem* shape = doc.createShape(QPointF(), ShapeKind::Circle, 50.0, u"#000"_s);
    const ObjectId id = shape->id();

    Utils::Result inner;
    const auto outer = doc.runTransaction(id, u"Outer"_s, [&](Api::ITransactionScope&) {
        EXPECT_TRUE(doc.inTransaction());
        inner = doc.runTransaction(id, u"Inner"_s, [](Api::ITransactionScope&) {
            return Utils::Result::success();
        });
        return Utils::Result::success();
    });

    EXPECT_TRUE(outer.ok);
    EXPECT_FALSE(inner.ok);
    EXPECT_EQ(inner.code, Utils::ResultCode::Rejected);
    EXPECT_FALSE(doc.inTransaction());
}

TEST(TandemDocumentTests, UnknownScopeReportsMissingItem)
{
    TandemDocument doc;
    const auto r = doc.runTransaction(ObjectId(77), u"Ghost"_s, [](Api::ITransactionScope&) {
        return Utils::Result::success();
    });
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, Utils::ResultCode::MissingItem);
}

TEST(TandemDocumentTests, GridToggleAndRemoval)
{
    TandemDocument doc;
    TandemItem* group = doc.createGroup(QPointF(), u"G"_s);
    TandemItem* child = doc.createNote(QPointF(), u"n"_s, u"yellow"_s, group->id());
    const ObjectId childId = child->id();

    EXPECT_TRUE(doc.setGroupViewAsGrid(group->id(), true));
    EXPECT_TRUE(group->contentAs<GroupContent>()->viewAsGrid());
    EXPECT_FALSE(doc.setGroupViewAsGrid(childId, true));

    auto removed = doc.removeItem(childId);
    ASSERT_NE(removed, nullptr);
    EXPECT_EQ(removed->id(), childId);
    EXPECT_EQ(doc.findItem(childId), nullptr);
    EXPECT_TRUE(group->contentAs<GroupContent>()->children().empty());
}
