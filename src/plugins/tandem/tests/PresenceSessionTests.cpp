// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <QtTest/QSignalSpy>

#include "tandem/presence/PresenceHub.hpp"
#include "tandem/presence/PresenceSession.hpp"

using namespace Tandem;
using namespace Qt::StringLiterals;

TEST(PresenceSessionTests, SessionsGetDistinctClientIds)
{
    PresenceHub hub;
    PresenceSession a(hub, u"main"_s);
    PresenceSession b(hub, u"draft"_s);

    EXPECT_NE(a.clientId(), b.clientId());
    EXPECT_EQ(a.branch(), u"main"_s);
    EXPECT_EQ(hub.clients().size(), 2);
}

TEST(PresenceSessionTests, ActiveDragPrefersLocalValue)
{
    PresenceHub hub;
    PresenceSession a(hub);
    PresenceSession b(hub);
    const ObjectId item(42);

    EXPECT_FALSE(a.activeDragFor(item).has_value());

    b.drag().publish(DragState{item, 7.0, 8.0, 0.0, {}});
    ASSERT_TRUE(a.activeDragFor(item).has_value());
    EXPECT_DOUBLE_EQ(a.activeDragFor(item)->x, 7.0);
    EXPECT_TRUE(a.isRemotelyManipulated(item));

    a.drag().publish(DragState{item, 1.0, 2.0, 0.0, {}});
    EXPECT_DOUBLE_EQ(a.activeDragFor(item)->x, 1.0);

    // Values for other items do not match.
    EXPECT_FALSE(a.activeDragFor(ObjectId(43)).has_value());
}

TEST(PresenceSessionTests, RemoteUpdatesRaisePresenceChanged)
{
    PresenceHub hub;
    PresenceSession a(hub);
    PresenceSession b(hub);
    QSignalSpy changed(&a, &PresenceSession::presenceChanged);

    b.resize().publish(ResizeState{ObjectId(1), 0.0, 0.0, 50.0});
    b.resize().clear();
    EXPECT_EQ(changed.count(), 2);
    EXPECT_FALSE(a.activeResizeFor(ObjectId(1)).has_value());
}

TEST(PresenceSessionTests, DestroyingSessionExpiresItsValues)
{
    PresenceHub hub;
    PresenceSession a(hub);
    const ObjectId item(5);
    {
        PresenceSession b(hub);
        b.drag().publish(DragState{item, 1.0, 1.0, 0.0, {}});
        EXPECT_TRUE(a.activeDragFor(item).has_value());
    }
    EXPECT_FALSE(a.activeDragFor(item).has_value());
    EXPECT_EQ(hub.clients().size(), 1);
}

TEST(PresenceSessionTests, SelectionOperations)
{
    PresenceHub hub;
    PresenceSession a(hub);
    PresenceSession b(hub);
    const ObjectId x(1);
    const ObjectId y(2);

    a.selection().setSelection({x, y, x});
    EXPECT_EQ(a.selection().selection(), (QList<ObjectId>{x, y}));
    EXPECT_TRUE(a.selection().testSelection(x));
    EXPECT_FALSE(a.selection().testRemoteSelection(x));
    EXPECT_TRUE(b.selection().testRemoteSelection(x));
    EXPECT_FALSE(b.selection().testSelection(x));
    EXPECT_EQ(b.selection().remoteSelectors(y), (QList<ClientId>{a.clientId()}));

    a.selection().toggleSelection(x);
    EXPECT_FALSE(a.selection().testSelection(x));
    EXPECT_FALSE(b.selection().testRemoteSelection(x));
    EXPECT_TRUE(b.selection().testRemoteSelection(y));

    a.selection().toggleSelection(x);
    EXPECT_TRUE(a.selection().testSelection(x));

    a.selection().clearSelection();
    EXPECT_TRUE(a.selection().selection().isEmpty());
    EXPECT_FALSE(b.selection().testRemoteSelection(y));
}
