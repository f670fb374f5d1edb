//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "possync/sdk/lan_types.hpp"

#include "lan_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace possync::sdk;  // NOLINT This our main concern here in the unit tests.

using Json = nlohmann::json;

using testing::Optional;
using testing::StrEq;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestLanTypes : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestLanTypes, device_type_names)
{
    EXPECT_THAT(toString(DeviceType::Pos), StrEq("pos"));
    EXPECT_THAT(toString(DeviceType::Kds), StrEq("kds"));
    EXPECT_THAT(toString(DeviceType::Bds), StrEq("bds"));
    EXPECT_THAT(toString(DeviceType::Manager), StrEq("manager"));

    EXPECT_THAT(parseDeviceType("kds"), Optional(DeviceType::Kds));
    EXPECT_THAT(parseDeviceType("manager"), Optional(DeviceType::Manager));
    EXPECT_FALSE(parseDeviceType("KDS").has_value());
    EXPECT_FALSE(parseDeviceType("").has_value());
    EXPECT_FALSE(parseDeviceType("printer").has_value());
}

TEST_F(TestLanTypes, error_code_names)
{
    EXPECT_THAT(toString(ErrorCode::BindFailed), StrEq("BindFailed"));
    EXPECT_THAT(toString(ErrorCode::RegistrationRejected), StrEq("RegistrationRejected"));
    EXPECT_THAT(toString(ErrorCode::DiscoveryFailed), StrEq("DiscoveryFailed"));
}

TEST_F(TestLanTypes, client_info_json)
{
    const ClientInfo info{"c1", DeviceType::Bds, "2024-01-01T00:00:00.000Z", "192.168.1.20"};
    EXPECT_THAT(Json(info),
                Json({{"clientId", "c1"},
                      {"deviceType", "bds"},
                      {"connectedAt", "2024-01-01T00:00:00.000Z"},
                      {"ipAddress", "192.168.1.20"}}));
}

TEST_F(TestLanTypes, server_info_json)
{
    const ServerInfo info{"s1", "t1", 3, "2024-01-01T00:00:00.000Z"};
    const Json       json = info;
    EXPECT_THAT(json,
                Json({{"serverId", "s1"},
                      {"tenantId", "t1"},
                      {"connectedClients", 3},
                      {"serverTime", "2024-01-01T00:00:00.000Z"}}));
    EXPECT_THAT(json.get<ServerInfo>(), info);

    EXPECT_THROW((void) Json({{"serverId", "s1"}}).get<ServerInfo>(), Json::exception);
}

TEST_F(TestLanTypes, status_json)
{
    LanServerStatus server_status;
    EXPECT_THAT(Json(server_status),
                Json({{"isRunning", false},
                      {"port", 0},
                      {"ipAddress", nullptr},
                      {"mdnsRegistered", false},
                      {"connectedClients", Json::array()},
                      {"startedAt", nullptr},
                      {"serverId", nullptr}}));

    server_status.running    = true;
    server_status.port       = 3847;
    server_status.ip_address = "10.0.0.5";
    server_status.clients.push_back(ClientInfo{"c1", DeviceType::Kds, "2024-01-01T00:00:00.000Z", "10.0.0.6"});
    const Json server_json = server_status;
    EXPECT_THAT(server_json.at("ipAddress"), Json("10.0.0.5"));
    EXPECT_THAT(server_json.at("connectedClients").size(), 1);

    LanClientStatus client_status;
    client_status.connected      = true;
    client_status.server_address = "tcp://10.0.0.5:3847";
    client_status.device_type    = DeviceType::Pos;
    const Json client_json       = client_status;
    EXPECT_THAT(client_json.at("isConnected"), Json(true));
    EXPECT_THAT(client_json.at("serverAddress"), Json("tcp://10.0.0.5:3847"));
    EXPECT_THAT(client_json.at("serverInfo"), Json(nullptr));
    EXPECT_THAT(client_json.at("deviceType"), Json("pos"));
}

TEST_F(TestLanTypes, discovered_server_json)
{
    DiscoveredServer server{"handsfree-pos-abcdefgh", "192.168.1.10", 3847, cetl::nullopt};
    EXPECT_THAT(Json(server).at("tenantId"), Json(nullptr));

    server.tenant_id = "abcdefgh-1234";
    EXPECT_THAT(Json(server),
                Json({{"name", "handsfree-pos-abcdefgh"},
                      {"ipAddress", "192.168.1.10"},
                      {"port", 3847},
                      {"tenantId", "abcdefgh-1234"}}));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
