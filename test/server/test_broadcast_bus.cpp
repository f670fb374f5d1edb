//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "broadcast_bus.hpp"

#include "lan_gtest_helpers.hpp"
#include "protocol/lan_message_codec.hpp"
#include "transport/outbox.hpp"

#include "possync/sdk/lan_message.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace
{

using namespace possync::server;  // NOLINT This our main concern here in the unit tests.

using possync::common::transport::Outbox;
using possync::sdk::LanMessage;
using possync::sdk::OrderStatusUpdate;
using possync::sdk::SyncState;

using testing::ElementsAre;
using testing::Pointee;
using testing::IsEmpty;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestBroadcastBus : public testing::Test
{
protected:
    static std::string encoded(const LanMessage& message)
    {
        return possync::common::protocol::encode(message);
    }
};

// MARK: - Tests:

TEST_F(TestBroadcastBus, publish_to_nobody)
{
    BroadcastBus bus;
    EXPECT_THAT(bus.publish(SyncState{}), 0);
    EXPECT_THAT(bus.subscriberCount(), 0);
}

TEST_F(TestBroadcastBus, publish_to_all_subscribers_in_order)
{
    BroadcastBus bus;

    const auto outbox_a = Outbox::make(8);
    const auto outbox_b = Outbox::make(8);
    bus.subscribe("a", outbox_a);
    bus.subscribe("b", outbox_b);
    EXPECT_THAT(bus.subscriberCount(), 2);

    const LanMessage first{OrderStatusUpdate{"o1", "preparing", "2024-01-01T00:00:00.000Z"}};
    const LanMessage second{OrderStatusUpdate{"o1", "ready", "2024-01-01T00:00:01.000Z"}};
    EXPECT_THAT(bus.publish(first), 2);
    EXPECT_THAT(bus.publish(second), 2);

    for (const auto& outbox : {outbox_a, outbox_b})
    {
        EXPECT_THAT(outbox->takeAll(), ElementsAre(Pointee(encoded(first)), Pointee(encoded(second))));
    }
}

TEST_F(TestBroadcastBus, unsubscribed_gets_nothing)
{
    BroadcastBus bus;

    const auto outbox_a = Outbox::make(8);
    const auto outbox_b = Outbox::make(8);
    bus.subscribe("a", outbox_a);
    bus.subscribe("b", outbox_b);
    bus.unsubscribe("a");
    bus.unsubscribe("unknown");

    EXPECT_THAT(bus.publish(SyncState{}), 1);
    EXPECT_THAT(outbox_a->takeAll(), IsEmpty());
    EXPECT_THAT(outbox_b->size(), 1);

    bus.clear();
    EXPECT_THAT(bus.subscriberCount(), 0);
    EXPECT_THAT(bus.publish(SyncState{}), 0);
    EXPECT_THAT(outbox_b->size(), 1);
}

TEST_F(TestBroadcastBus, slow_subscriber_drops_oldest)
{
    BroadcastBus bus;

    const auto slow = Outbox::make(2);
    const auto fast = Outbox::make(8);
    bus.subscribe("slow", slow);
    bus.subscribe("fast", fast);

    for (int i = 0; i < 5; ++i)
    {
        EXPECT_THAT(bus.publish(OrderStatusUpdate{std::to_string(i), "ready", "2024-01-01T00:00:00.000Z"}), 2);
    }

    EXPECT_THAT(fast->size(), 5);
    EXPECT_THAT(fast->droppedCount(), 0);
    EXPECT_THAT(slow->droppedCount(), 3);
    EXPECT_THAT(slow->takeAll(),
                ElementsAre(Pointee(encoded(OrderStatusUpdate{"3", "ready", "2024-01-01T00:00:00.000Z"})),
                            Pointee(encoded(OrderStatusUpdate{"4", "ready", "2024-01-01T00:00:00.000Z"}))));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
