// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include <QtTest/QSignalSpy>

#include "TandemTestSupport.hpp"

#include "tandem/presence/PresenceChannel.hpp"
#include "tandem/presence/PresenceHub.hpp"

#include <QtCore/QJsonObject>

#include <vector>

using namespace Tandem;
using namespace Qt::StringLiterals;

namespace {

DragState drag(quint64 id, double x, double y, double rotation = 0.0)
{
    return DragState{ObjectId(id), x, y, rotation, u"main"_s};
}

} // namespace

TEST(PresenceChannelTests, PublishIsSeenLocallyAndByOtherClientsOnly)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();

    PresenceChannel<DragState> chanA(hub, a, u"drag"_s);
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    std::vector<std::optional<DragState>> localA;
    std::vector<std::optional<DragState>> remoteA;
    std::vector<std::pair<ClientId, std::optional<DragState>>> remoteB;

    auto subA = chanA.subscribe([&](const std::optional<DragState>& v) { localA.push_back(v); },
                                [&](ClientId, const std::optional<DragState>& v) { remoteA.push_back(v); });
    auto subB = chanB.subscribe({}, [&](ClientId from, const std::optional<DragState>& v) {
        remoteB.emplace_back(from, v);
    });

    chanA.publish(drag(7, 150.0, 100.0));

    ASSERT_EQ(localA.size(), 1u);
    EXPECT_EQ(*localA.front(), drag(7, 150.0, 100.0));
    EXPECT_TRUE(remoteA.empty());

    ASSERT_EQ(remoteB.size(), 1u);
    EXPECT_EQ(remoteB.front().first, a);
    EXPECT_EQ(*remoteB.front().second, drag(7, 150.0, 100.0));
    EXPECT_EQ(chanB.remoteValue(a), drag(7, 150.0, 100.0));
    EXPECT_TRUE(chanB.remoteValues().contains(a));
}

TEST(PresenceChannelTests, LastWriteWinsPerPublisher)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    PresenceChannel<DragState> chanA(hub, a, u"drag"_s);
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    chanA.publish(drag(1, 10.0, 10.0));
    chanA.publish(drag(1, 20.0, 10.0));
    chanA.publish(drag(1, 30.0, 10.0));

    EXPECT_EQ(chanA.currentLocalValue(), drag(1, 30.0, 10.0));
    EXPECT_EQ(chanB.remoteValues().size(), 1);
    EXPECT_EQ(chanB.remoteValue(a), drag(1, 30.0, 10.0));
}

TEST(PresenceChannelTests, ClearDeliversEmptyValue)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    PresenceChannel<DragState> chanA(hub, a, u"drag"_s);
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    std::vector<std::optional<DragState>> seen;
    auto sub = chanB.subscribe({}, [&](ClientId, const std::optional<DragState>& v) { seen.push_back(v); });

    chanA.publish(drag(3, 1.0, 2.0));
    chanA.clear();

    EXPECT_FALSE(chanA.currentLocalValue().has_value());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen.back().has_value());
    EXPECT_FALSE(chanB.remoteValue(a).has_value());

    // Clearing an empty channel is a no-op.
    chanA.clear();
    EXPECT_EQ(seen.size(), 2u);
}

TEST(PresenceChannelTests, SubscriptionStopsOnUnsubscribeAndDestruction)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    PresenceChannel<ResizeState> chan(hub, a, u"resize"_s);

    int calls = 0;
    {
        PresenceSubscription sub = chan.subscribe([&](const std::optional<ResizeState>&) { ++calls; });
        chan.publish(ResizeState{ObjectId(1), 0.0, 0.0, 100.0});
        EXPECT_EQ(calls, 1);

        PresenceSubscription moved = std::move(sub);
        EXPECT_FALSE(sub.isActive());
        EXPECT_TRUE(moved.isActive());
        chan.publish(ResizeState{ObjectId(1), 0.0, 0.0, 110.0});
        EXPECT_EQ(calls, 2);
    }

    chan.publish(ResizeState{ObjectId(1), 0.0, 0.0, 120.0});
    EXPECT_EQ(calls, 2);

    PresenceSubscription explicitSub = chan.subscribe([&](const std::optional<ResizeState>&) { ++calls; });
    explicitSub.unsubscribe();
    chan.publish(ResizeState{ObjectId(1), 0.0, 0.0, 130.0});
    EXPECT_EQ(calls, 2);
}

TEST(PresenceChannelTests, SubscriptionMayOutliveChannel)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    PresenceSubscription sub;
    {
        PresenceChannel<DragState> chan(hub, a, u"drag"_s);
        sub = chan.subscribe([](const std::optional<DragState>&) {});
    }
    sub.unsubscribe();
    EXPECT_FALSE(sub.isActive());
}

TEST(PresenceChannelTests, MalformedRemotePayloadIsIgnored)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    int remoteCalls = 0;
    auto sub = chanB.subscribe({}, [&](ClientId, const std::optional<DragState>&) { ++remoteCalls; });

    QJsonObject bogus;
    bogus.insert(u"itemId"_s, u"not-a-number"_s);
    bogus.insert(u"x"_s, u"left"_s);
    hub.send(a, u"drag"_s, bogus);

    EXPECT_EQ(remoteCalls, 0);
    EXPECT_TRUE(chanB.remoteValues().isEmpty());
}

TEST(PresenceChannelTests, LateListenerReceivesCurrentValues)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    PresenceChannel<DragState> chanA(hub, a, u"drag"_s);
    chanA.publish(drag(9, 5.0, 6.0));

    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);
    EXPECT_EQ(chanB.remoteValue(a), drag(9, 5.0, 6.0));
}

TEST(PresenceChannelTests, DisconnectExpiresValuesOfDepartedClient)
{
    PresenceHub hub;
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    QSignalSpy disconnected(&hub, &Api::IPresenceTransport::clientDisconnected);

    auto chanA = std::make_unique<PresenceChannel<DragState>>(hub, a, u"drag"_s);
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    std::vector<std::optional<DragState>> seen;
    auto sub = chanB.subscribe({}, [&](ClientId, const std::optional<DragState>& v) { seen.push_back(v); });

    chanA->publish(drag(4, 1.0, 1.0));
    chanA.reset();
    // Without a disconnect the last value stays.
    EXPECT_TRUE(chanB.remoteValue(a).has_value());

    hub.disconnectClient(a);
    EXPECT_FALSE(chanB.remoteValue(a).has_value());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen.back().has_value());
    EXPECT_EQ(disconnected.count(), 1);
    EXPECT_FALSE(hub.isConnected(a));
}

TEST(PresenceChannelTests, QueuedDeliveryReachesRemotesThroughEventLoop)
{
    TandemTest::ensureApp();

    PresenceHub hub(PresenceHub::DeliveryMode::Queued);
    const ClientId a = hub.connectClient();
    const ClientId b = hub.connectClient();
    PresenceChannel<DragState> chanA(hub, a, u"drag"_s);
    PresenceChannel<DragState> chanB(hub, b, u"drag"_s);

    chanA.publish(drag(2, 40.0, 50.0));
    // Local state is immediate; the remote copy waits for the event loop.
    EXPECT_EQ(chanA.currentLocalValue(), drag(2, 40.0, 50.0));
    EXPECT_FALSE(chanB.remoteValue(a).has_value());

    QCoreApplication::processEvents();
    EXPECT_EQ(chanB.remoteValue(a), drag(2, 40.0, 50.0));
}

TEST(PresenceChannelTests, SelectionCodecRejectsInvalidIds)
{
    QJsonObject obj = PresenceCodec<SelectionState>::encode(SelectionState{{ObjectId(1), ObjectId(2)}});
    const auto decoded = PresenceCodec<SelectionState>::decode(obj);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->selected.size(), 2);

    QJsonObject broken;
    broken.insert(u"selected"_s, u"1,2"_s);
    EXPECT_FALSE(PresenceCodec<SelectionState>::decode(broken).has_value());
}
