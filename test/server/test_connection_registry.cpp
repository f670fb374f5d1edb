//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "connection_registry.hpp"

#include "lan_gtest_helpers.hpp"
#include "transport/outbox.hpp"

#include "possync/sdk/lan_types.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace possync::server;  // NOLINT This our main concern here in the unit tests.

using possync::sdk::ClientInfo;
using possync::sdk::DeviceType;

using testing::IsEmpty;
using testing::IsNull;
using testing::NotNull;
using testing::Field;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestConnectionRegistry : public testing::Test
{
protected:
    static ClientSession::Ptr makeSession(const std::string& client_id, const std::string& connected_at)
    {
        return std::make_shared<const ClientSession>(ClientInfo{client_id, DeviceType::Kds, connected_at, "127.0.0.1"},
                                                     possync::common::transport::Outbox::make(4));
    }
};

// MARK: - Tests:

TEST_F(TestConnectionRegistry, insert_find_remove)
{
    ConnectionRegistry registry;
    EXPECT_THAT(registry.size(), 0);
    EXPECT_THAT(registry.list(), IsEmpty());

    const auto session = makeSession("c1", "2024-01-01T00:00:00.000Z");
    EXPECT_TRUE(registry.insert(session));
    EXPECT_THAT(registry.size(), 1);
    EXPECT_THAT(registry.find("c1"), session);
    EXPECT_THAT(registry.find("c2"), IsNull());

    EXPECT_TRUE(registry.remove("c1"));
    EXPECT_FALSE(registry.remove("c1"));
    EXPECT_THAT(registry.size(), 0);
    EXPECT_THAT(registry.find("c1"), IsNull());
}

TEST_F(TestConnectionRegistry, insert_duplicate_id)
{
    ConnectionRegistry registry;

    const auto first = makeSession("c1", "2024-01-01T00:00:00.000Z");
    EXPECT_TRUE(registry.insert(first));
    EXPECT_FALSE(registry.insert(makeSession("c1", "2024-01-01T00:00:01.000Z")));
    EXPECT_THAT(registry.size(), 1);
    EXPECT_THAT(registry.find("c1"), first);
}

TEST_F(TestConnectionRegistry, list_is_ordered_by_connection_time)
{
    ConnectionRegistry registry;
    registry.insert(makeSession("c3", "2024-01-01T00:00:03.000Z"));
    registry.insert(makeSession("c1", "2024-01-01T00:00:01.000Z"));
    registry.insert(makeSession("b2", "2024-01-01T00:00:02.000Z"));
    registry.insert(makeSession("a2", "2024-01-01T00:00:02.000Z"));

    EXPECT_THAT(registry.list(),
                ElementsAre(Field(&ClientInfo::client_id, "c1"),
                            Field(&ClientInfo::client_id, "a2"),
                            Field(&ClientInfo::client_id, "b2"),
                            Field(&ClientInfo::client_id, "c3")));

    registry.clear();
    EXPECT_THAT(registry.size(), 0);
    EXPECT_FALSE(registry.remove("c1"));
}

TEST_F(TestConnectionRegistry, concurrent_insert_and_remove)
{
    ConnectionRegistry registry;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&registry, t] {
            //
            for (int i = 0; i < 100; ++i)
            {
                const auto id = "c" + std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(registry.insert(makeSession(id, "2024-01-01T00:00:00.000Z")));
                (void) registry.list();
                if ((i % 2) == 0)
                {
                    EXPECT_TRUE(registry.remove(id));
                }
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_THAT(registry.size(), 200);
    EXPECT_THAT(registry.find("c2-51"), NotNull());
    EXPECT_THAT(registry.find("c2-50"), IsNull());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
