// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "TandemTestSupport.hpp"

#include <QtGui/QMouseEvent>
#include <QtGui/QWindow>
#include <QtWidgets/QWidget>

using namespace Tandem;

TEST(PointerSessionTests, ManualSessionForwardsToAttachedHandlers)
{
    ManualPointerSession session;
    int moves = 0;
    int ends = 0;
    bool lastCancelled = false;

    session.dispatchMove(TandemTest::mouseAt(1, 1));
    session.attach([&](const PointerEvent&) { ++moves; },
                   [&](const PointerEvent&, bool cancelled) {
                       ++ends;
                       lastCancelled = cancelled;
                   });
    EXPECT_TRUE(session.isAttached());

    session.dispatchMove(TandemTest::mouseAt(2, 2));
    session.dispatchCancel(TandemTest::mouseAt(2, 2));
    EXPECT_EQ(moves, 1);
    EXPECT_EQ(ends, 1);
    EXPECT_TRUE(lastCancelled);

    session.detach();
    session.dispatchEnd(TandemTest::mouseAt(3, 3));
    EXPECT_EQ(ends, 1);
}

TEST(PointerSessionTests, ManualCaptureCanBeUnavailable)
{
    ManualPointerSession session;
    EXPECT_TRUE(session.capture(4));
    EXPECT_EQ(session.capturedPointer(), 4);
    session.release();
    EXPECT_FALSE(session.isCaptured());

    session.setCaptureAvailable(false);
    EXPECT_FALSE(session.capture(4));
    EXPECT_FALSE(session.isCaptured());
}

TEST(PointerSessionTests, EventFilterSeesWindowMouseEvents)
{
    TandemTest::ensureApp();

    EventFilterPointerSession session;
    QList<QPointF> moves;
    int ends = 0;
    session.attach([&](const PointerEvent& ev) { moves.push_back(ev.screenPos); },
                   [&](const PointerEvent&, bool cancelled) {
                       EXPECT_FALSE(cancelled);
                       ++ends;
                   });
    ASSERT_TRUE(session.isAttached());

    QWindow window;
    QMouseEvent move(QEvent::MouseMove, QPointF(5, 5), QPointF(105, 205),
                     Qt::NoButton, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &move);

    // Deliveries to non-window objects are ignored.
    QObject plain;
    QCoreApplication::sendEvent(&plain, &move);

    QMouseEvent release(QEvent::MouseButtonRelease, QPointF(5, 5), QPointF(110, 210),
                        Qt::LeftButton, Qt::NoButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &release);

    ASSERT_EQ(moves.size(), 1);
    EXPECT_EQ(moves.front(), QPointF(105, 205));
    EXPECT_EQ(ends, 1);

    session.detach();
    QCoreApplication::sendEvent(&window, &move);
    EXPECT_EQ(moves.size(), 1);
}

TEST(PointerSessionTests, EventFilterEndsOnlyOnLeftButtonRelease)
{
    TandemTest::ensureApp();

    EventFilterPointerSession session;
    int ends = 0;
    session.attach([](const PointerEvent&) {}, [&](const PointerEvent&, bool) { ++ends; });

    QWindow window;
    QMouseEvent rightUp(QEvent::MouseButtonRelease, QPointF(5, 5), QPointF(105, 205),
                        Qt::RightButton, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &rightUp);
    EXPECT_EQ(ends, 0);

    QMouseEvent leftUp(QEvent::MouseButtonRelease, QPointF(5, 5), QPointF(105, 205),
                       Qt::LeftButton, Qt::NoButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &leftUp);
    EXPECT_EQ(ends, 1);

    session.detach();
}

TEST(PointerSessionTests, EventFilterCaptureNeedsVisibleTarget)
{
    TandemTest::ensureApp();

    QWidget target;
    EventFilterPointerSession session(&target);
    EXPECT_FALSE(session.capture(0));
    EXPECT_FALSE(session.isCaptured());

    EventFilterPointerSession detached;
    EXPECT_FALSE(detached.capture(0));
}
