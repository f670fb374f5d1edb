//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "protocol/lan_message_codec.hpp"

#include "lan_gtest_helpers.hpp"

#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace possync::sdk;                // NOLINT This our main concern here in the unit tests.
using namespace possync::common::protocol;  // NOLINT This our main concern here in the unit tests.

using Json = nlohmann::json;

using testing::_;
using testing::Field;
using testing::HasSubstr;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestLanMessageCodec : public testing::Test
{
protected:
    static Json encodeToJson(const LanMessage& message)
    {
        return Json::parse(encode(message));
    }
};

// MARK: - Tests:

TEST_F(TestLanMessageCodec, encode_wire_shape)
{
    EXPECT_THAT(encodeToJson(Ping{}), Json({{"type", "ping"}}));
    EXPECT_THAT(encodeToJson(Pong{}), Json({{"type", "pong"}}));

    EXPECT_THAT(encodeToJson(Register{DeviceType::Kds, "t1"}),
                Json({{"type", "register"}, {"device_type", "kds"}, {"tenant_id", "t1"}}));

    EXPECT_THAT(encodeToJson(Error{"Tenant ID mismatch", "TENANT_MISMATCH"}),
                Json({{"type", "error"}, {"message", "Tenant ID mismatch"}, {"code", "TENANT_MISMATCH"}}));

    EXPECT_THAT(encodeToJson(OrderStatusUpdate{"o1", "ready", "2024-01-01T00:00:00.000Z"}),
                Json({{"type", "order_status_update"},
                      {"order_id", "o1"},
                      {"status", "ready"},
                      {"updated_at", "2024-01-01T00:00:00.000Z"}}));

    EXPECT_THAT(encodeToJson(SyncState{{Json{{"id", 1}}, Json{{"id", 2}}}}),
                Json({{"type", "sync_state"}, {"orders", Json::array({Json{{"id", 1}}, Json{{"id", 2}}})}}));

    const Registered registered{"c1", ServerInfo{"s1", "t1", 2, "2024-01-01T00:00:00.000Z"}};
    EXPECT_THAT(encodeToJson(registered),
                Json({{"type", "registered"},
                      {"client_id", "c1"},
                      {"server_info",
                       {{"serverId", "s1"},
                        {"tenantId", "t1"},
                        {"connectedClients", 2},
                        {"serverTime", "2024-01-01T00:00:00.000Z"}}}}));
}

TEST_F(TestLanMessageCodec, order_created_payloads_are_opaque)
{
    const Json order         = {{"id", "o1"}, {"items", Json::array({1, "two", nullptr})}, {"total", 12.5}};
    const Json kitchen_order = {{"station", "grill"}, {"nested", {{"deep", true}}}};

    const LanMessage message{OrderCreated{order, kitchen_order}};
    const auto       payload = encode(message);
    EXPECT_THAT(Json::parse(payload).at("kitchen_order"), kitchen_order);

    const auto decoded = decode(payload);
    ASSERT_THAT(decoded, VariantWith<DecodeResult::Success>(message));
}

TEST_F(TestLanMessageCodec, decode_every_type)
{
    const LanMessage messages[] = {
        OrderCreated{Json{{"id", 1}}, Json::object()},
        OrderStatusUpdate{"o1", "preparing", "2024-01-01T00:00:00.000Z"},
        SyncState{},
        Ping{},
        Pong{},
        Register{DeviceType::Manager, "tenant"},
        Registered{"c1", ServerInfo{"s1", "t1", 0, "2024-01-01T00:00:00.000Z"}},
        Error{"Expected register message", "TENANT_MISMATCH"},
    };
    for (const auto& message : messages)
    {
        EXPECT_THAT(decode(encode(message)), VariantWith<DecodeResult::Success>(message)) << toString(message.type());
    }
}

TEST_F(TestLanMessageCodec, decode_unknown_type)
{
    EXPECT_THAT(decode(R"({"type":"menu_update","menu":{}})"),
                VariantWith<DecodeResult::Unknown>(Field(&UnknownMessage::type, "menu_update")));
}

TEST_F(TestLanMessageCodec, decode_ignores_extra_fields)
{
    EXPECT_THAT(decode(R"({"type":"ping","extra":42})"), VariantWith<DecodeResult::Success>(LanMessage{Ping{}}));
}

TEST_F(TestLanMessageCodec, decode_malformed)
{
    EXPECT_THAT(decode("not json"), VariantWith<DecodeResult::Failure>(_));
    EXPECT_THAT(decode("[1,2,3]"), VariantWith<DecodeResult::Failure>(_));
    EXPECT_THAT(decode(R"({"order_id":"o1"})"), VariantWith<DecodeResult::Failure>(_));
    EXPECT_THAT(decode(R"({"type":42})"), VariantWith<DecodeResult::Failure>(_));

    // Missing or mistyped fields of a known type.
    EXPECT_THAT(decode(R"({"type":"order_status_update","order_id":"o1"})"), VariantWith<DecodeResult::Failure>(_));
    EXPECT_THAT(decode(R"({"type":"register","device_type":"kds","tenant_id":7})"),
                VariantWith<DecodeResult::Failure>(_));
    EXPECT_THAT(decode(R"({"type":"sync_state","orders":{}})"),
                VariantWith<DecodeResult::Failure>(
                    Field(&DecodeFailure::reason, HasSubstr("not an array"))));
    EXPECT_THAT(decode(R"({"type":"register","device_type":"printer","tenant_id":"t1"})"),
                VariantWith<DecodeResult::Failure>(Field(&DecodeFailure::reason, HasSubstr("printer"))));
}

TEST_F(TestLanMessageCodec, encode_replaces_malformed_utf8)
{
    const LanMessage update{OrderStatusUpdate{"o1", "pr\xC3", "2024-01-01T00:00:00.000Z"}};
    std::string      payload;
    EXPECT_NO_THROW(payload = encode(update));
    EXPECT_THAT(decode(payload),
                VariantWith<DecodeResult::Success>(
                    LanMessage{OrderStatusUpdate{"o1", "pr\xEF\xBF\xBD", "2024-01-01T00:00:00.000Z"}}));

    EXPECT_THAT(encodeToJson(Register{DeviceType::Pos, "\xFFtenant"}),
                Json({{"type", "register"}, {"device_type", "pos"}, {"tenant_id", "\xEF\xBF\xBDtenant"}}));
}

TEST_F(TestLanMessageCodec, type_names)
{
    EXPECT_THAT(toString(LanMessage{OrderCreated{}}.type()), testing::StrEq("order_created"));
    EXPECT_THAT(toString(LanMessage{OrderStatusUpdate{}}.type()), testing::StrEq("order_status_update"));
    EXPECT_THAT(toString(LanMessage{SyncState{}}.type()), testing::StrEq("sync_state"));
    EXPECT_THAT(toString(LanMessage{Registered{}}.type()), testing::StrEq("registered"));
    EXPECT_THAT(LanMessage{Error{}}.type(), LanMessage::Type::Error);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
