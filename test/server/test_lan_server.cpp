//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "lan_server.hpp"

#include "lan_gtest_helpers.hpp"
#include "lan_test_peer.hpp"
#include "recording_event_sink.hpp"
#include "sdk/in_memory_service_discovery.hpp"
#include "sdk/service_discovery_mock.hpp"

#include "possync/sdk/event_sink.hpp"
#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/lan_types.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{

using namespace possync;          // NOLINT This our main concern here in the unit tests.
using namespace possync::sdk;     // NOLINT This our main concern here in the unit tests.
using namespace possync::server;  // NOLINT This our main concern here in the unit tests.

using Json = nlohmann::json;

using testing::_;
using testing::Eq;
using testing::Not;
using testing::Field;
using testing::Pair;
using testing::Contains;
using testing::Return;
using testing::IsEmpty;
using testing::SizeIs;
using testing::StrictMock;
using testing::StartsWith;
using testing::VariantWith;
using testing::UnorderedElementsAre;

using std::literals::chrono_literals::operator""ms;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestLanServer : public testing::Test
{
protected:
    struct Registration
    {
        std::unique_ptr<LanTestPeer> peer;
        Registered                   registered;
    };

    static LanSettings makeSettings()
    {
        LanSettings settings;
        settings.bind_host            = "127.0.0.1";
        settings.port                 = 0;
        settings.handshake_timeout    = 2000ms;
        settings.accept_poll_interval = 20ms;
        settings.write_timeout        = 1000ms;
        return settings;
    }

    std::unique_ptr<LanServer> makeServer(const LanSettings& settings = makeSettings())
    {
        return std::make_unique<LanServer>(settings, discovery_, sink_);
    }

    static std::uint16_t startServer(LanServer& server, const std::string& tenant_id = "tenant-1")
    {
        const auto result = server.start(tenant_id);
        EXPECT_THAT(result, VariantWith<StartResult::Success>(StartsWith("tcp://127.0.0.1:")));
        return server.status().port;
    }

    /// Connects and registers a raw peer; waits until the server has published its connect event.
    cetl::optional<Registration> registerPeer(const std::uint16_t port,
                                              const DeviceType    device_type = DeviceType::Kds,
                                              const std::string&  tenant_id   = "tenant-1")
    {
        auto peer = LanTestPeer::connectTo(port);
        if (!peer || !peer->send(Register{device_type, tenant_id}))
        {
            return cetl::nullopt;
        }
        const auto reply = peer->receiveMessage();
        if (!reply || (reply->tryAs<Registered>() == nullptr))
        {
            return cetl::nullopt;
        }
        Registration registration{std::move(peer), *reply->tryAs<Registered>()};

        ++connected_count_;
        if (!sink_->waitFor(events::LanClientConnected, connected_count_))
        {
            return cetl::nullopt;
        }
        return registration;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    std::shared_ptr<InMemoryServiceDiscovery> discovery_{std::make_shared<InMemoryServiceDiscovery>()};
    std::shared_ptr<RecordingEventSink>       sink_{std::make_shared<RecordingEventSink>()};
    std::size_t                               connected_count_{0};
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestLanServer, start_and_stop)
{
    const auto server = makeServer();
    EXPECT_THAT(server->state(), LanServer::State::Stopped);
    EXPECT_FALSE(server->status().running);

    const auto port = startServer(*server);
    EXPECT_THAT(port, Not(Eq(0)));
    EXPECT_THAT(server->state(), LanServer::State::Running);
    EXPECT_THAT(discovery_->activeCount(), 1);

    const auto status = server->status();
    EXPECT_TRUE(status.running);
    EXPECT_TRUE(status.advertised);
    EXPECT_THAT(status.ip_address, testing::Optional(std::string{"127.0.0.1"}));
    EXPECT_TRUE(status.started_at.has_value());
    EXPECT_TRUE(status.server_id.has_value());
    EXPECT_THAT(status.clients, IsEmpty());

    EXPECT_THAT(server->start("tenant-1"),
                VariantWith<StartResult::Failure>(FailureWithCode(ErrorCode::AlreadyRunning)));

    server->stop();
    EXPECT_THAT(server->state(), LanServer::State::Stopped);
    EXPECT_FALSE(server->status().running);
    EXPECT_THAT(discovery_->activeCount(), 0);

    // Idempotent.
    server->stop();
    EXPECT_THAT(server->state(), LanServer::State::Stopped);

    // Restartable, with a fresh identity.
    const auto old_server_id = status.server_id;
    startServer(*server);
    EXPECT_THAT(server->status().server_id, Not(Eq(old_server_id)));
    server->stop();
}

TEST_F(TestLanServer, advertised_record)
{
    const auto discovery = std::make_shared<StrictMock<ServiceDiscoveryMock>>();
    StrictMock<RegistrationMock> registration_mock;

    EXPECT_CALL(registration_mock, isActive()).WillRepeatedly(Return(true));

    ServiceRecord advertised;
    EXPECT_CALL(*discovery, registerService(_))
        .WillOnce([&](const ServiceRecord& record) -> ServiceDiscovery::RegisterResult::Var {
            //
            advertised = record;
            ServiceDiscovery::Registration::Ptr registration =
                std::make_unique<RegistrationMock::Wrapper>(registration_mock);
            return std::move(registration);  // NOLINT(*-redundant-move)
        });

    const auto server = std::make_unique<LanServer>(makeSettings(), discovery, sink_);
    const auto port   = startServer(*server, "abcdefgh-ijkl-mnop");

    EXPECT_THAT(advertised.service_type, "_handsfree._tcp.local.");
    EXPECT_THAT(advertised.instance_name, "Handsfree POS-abcdefgh");
    EXPECT_THAT(advertised.host, testing::EndsWith(".local."));
    EXPECT_THAT(advertised.ip_address, "127.0.0.1");
    EXPECT_THAT(advertised.port, port);
    EXPECT_THAT(advertised.properties,
                UnorderedElementsAre(Pair("tenant", "abcdefgh-ijkl-mnop"),
                                     Pair("server_id", server->status().server_id.value_or(""))));

    EXPECT_CALL(registration_mock, unregister()).Times(testing::AtLeast(1));
    EXPECT_CALL(registration_mock, deinit());
    server->stop();
}

TEST_F(TestLanServer, advertise_failure)
{
    const auto discovery = std::make_shared<StrictMock<ServiceDiscoveryMock>>();
    EXPECT_CALL(*discovery, registerService(_)).WillOnce([](const ServiceRecord&) {
        //
        return ServiceDiscovery::RegisterResult::Var{Failure{ErrorCode::DiscoveryFailed, "no multicast", {}}};
    });

    const auto server = std::make_unique<LanServer>(makeSettings(), discovery, sink_);
    EXPECT_THAT(server->start("tenant-1"),
                VariantWith<StartResult::Failure>(FailureWithCode(ErrorCode::AdvertiseFailed)));
    EXPECT_THAT(server->state(), LanServer::State::Stopped);
    EXPECT_FALSE(server->status().running);
}

TEST_F(TestLanServer, start_rolls_back_when_advertising_throws)
{
    const auto discovery = std::make_shared<StrictMock<ServiceDiscoveryMock>>();
    EXPECT_CALL(*discovery, registerService(_))
        .WillOnce([](const ServiceRecord&) -> ServiceDiscovery::RegisterResult::Var {
            //
            throw std::runtime_error{"advertising exploded"};
        })
        .WillOnce([](const ServiceRecord&) {
            //
            return ServiceDiscovery::RegisterResult::Var{Failure{ErrorCode::DiscoveryFailed, "no multicast", {}}};
        });

    const auto server = std::make_unique<LanServer>(makeSettings(), discovery, sink_);
    EXPECT_THROW((void) server->start("tenant-1"), std::runtime_error);
    EXPECT_THAT(server->state(), LanServer::State::Stopped);
    EXPECT_FALSE(server->status().running);

    // Not stuck in "starting": the next attempt runs all the way to advertising again.
    EXPECT_THAT(server->start("tenant-1"),
                VariantWith<StartResult::Failure>(FailureWithCode(ErrorCode::AdvertiseFailed)));
    EXPECT_THAT(server->state(), LanServer::State::Stopped);
}

TEST_F(TestLanServer, instance_name_keeps_whole_characters)
{
    const auto server = makeServer();
    startServer(*server, "Restaur\xC3\xA9-1");

    const auto records = discovery_->records();
    ASSERT_THAT(records, SizeIs(1));
    EXPECT_THAT(records.front().instance_name, "Handsfree POS-Restaur\xC3\xA9");
    EXPECT_THAT(records.front().properties, Contains(Pair("tenant", "Restaur\xC3\xA9-1")));

    // Restartable with the same tenant.
    server->stop();
    startServer(*server, "Restaur\xC3\xA9-1");
    server->stop();
}

TEST_F(TestLanServer, bind_failure)
{
    const auto first = makeServer();
    const auto port  = startServer(*first);

    auto settings = makeSettings();
    settings.port = port;
    const auto second = makeServer(settings);
    EXPECT_THAT(second->start("tenant-1"),
                VariantWith<StartResult::Failure>(FailureWithCode(ErrorCode::BindFailed)));
    EXPECT_THAT(second->state(), LanServer::State::Stopped);
    EXPECT_THAT(discovery_->activeCount(), 1);

    settings.bind_host = "not-an-address";
    const auto third   = makeServer(settings);
    EXPECT_THAT(third->start("tenant-1"), VariantWith<StartResult::Failure>(FailureWithCode(ErrorCode::BindFailed)));

    first->stop();
}

TEST_F(TestLanServer, broadcast_when_not_running)
{
    const auto server = makeServer();
    EXPECT_THAT(server->broadcast(Ping{}), VariantWith<BroadcastResult::Failure>(FailureWithCode(ErrorCode::NotRunning)));
    EXPECT_THAT(server->broadcastOrderStatus("o1", "ready"),
                VariantWith<BroadcastResult::Failure>(FailureWithCode(ErrorCode::NotRunning)));
    EXPECT_THAT(server->clients(), IsEmpty());
}

TEST_F(TestLanServer, register_same_tenant)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto first = registerPeer(port, DeviceType::Kds);
    ASSERT_TRUE(first);
    EXPECT_THAT(first->registered.client_id, Not(IsEmpty()));
    EXPECT_THAT(first->registered.server_info.tenant_id, "tenant-1");
    EXPECT_THAT(first->registered.server_info.server_id, server->status().server_id.value_or(""));
    EXPECT_THAT(first->registered.server_info.server_time, Not(IsEmpty()));
    EXPECT_THAT(first->registered.server_info.connected_clients, 0);

    auto second = registerPeer(port, DeviceType::Bds);
    ASSERT_TRUE(second);
    EXPECT_THAT(second->registered.server_info.connected_clients, 1);
    EXPECT_THAT(second->registered.client_id, Not(Eq(first->registered.client_id)));

    const auto connected = sink_->waitFor(events::LanClientConnected, 2);
    ASSERT_TRUE(connected);
    EXPECT_THAT(connected->at("clientId"), Json(second->registered.client_id));
    EXPECT_THAT(connected->at("deviceType"), Json("bds"));
    EXPECT_THAT(connected->at("ipAddress"), Json("127.0.0.1"));

    EXPECT_THAT(server->clients(),
                UnorderedElementsAre(Field(&ClientInfo::client_id, first->registered.client_id),
                                     Field(&ClientInfo::client_id, second->registered.client_id)));
    EXPECT_THAT(server->status().clients, SizeIs(2));

    server->stop();
}

TEST_F(TestLanServer, reject_other_tenant)
{
    const auto server = makeServer();
    const auto port   = startServer(*server, "tenant-1");

    const auto peer = LanTestPeer::connectTo(port);
    ASSERT_TRUE(peer);
    ASSERT_TRUE(peer->send(Register{DeviceType::Bds, "tenant-2"}));

    const auto reply = peer->receiveMessage();
    ASSERT_TRUE(reply);
    EXPECT_THAT(*reply, Eq(LanMessage{Error{"Tenant ID mismatch", "TENANT_MISMATCH"}}));
    EXPECT_TRUE(peer->waitClosed());

    EXPECT_THAT(server->clients(), IsEmpty());
    EXPECT_THAT(sink_->count(events::LanClientConnected), 0);

    server->stop();
}

TEST_F(TestLanServer, reject_non_register_first_message)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    const auto peer = LanTestPeer::connectTo(port);
    ASSERT_TRUE(peer);
    ASSERT_TRUE(peer->send(Ping{}));

    const auto reply = peer->receiveMessage();
    ASSERT_TRUE(reply);
    EXPECT_THAT(*reply, Eq(LanMessage{Error{"Expected register message", "TENANT_MISMATCH"}}));
    EXPECT_TRUE(peer->waitClosed());

    server->stop();
}

TEST_F(TestLanServer, handshake_timeout)
{
    auto settings              = makeSettings();
    settings.handshake_timeout = 100ms;
    const auto server          = makeServer(settings);
    const auto port            = startServer(*server);

    const auto peer = LanTestPeer::connectTo(port);
    ASSERT_TRUE(peer);
    EXPECT_TRUE(peer->waitClosed(3000ms));
    EXPECT_THAT(sink_->count(events::LanClientConnected), 0);

    server->stop();
}

TEST_F(TestLanServer, ping_pong_and_garbage)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto client = registerPeer(port);
    ASSERT_TRUE(client);

    // Malformed and unknown messages are ignored.
    ASSERT_TRUE(client->peer->sendRaw("garbage"));
    ASSERT_TRUE(client->peer->sendRaw(R"({"type":"menu_update"})"));
    ASSERT_TRUE(client->peer->send(SyncState{}));

    ASSERT_TRUE(client->peer->send(Ping{}));
    const auto reply = client->peer->receiveMessage();
    ASSERT_TRUE(reply);
    EXPECT_THAT(reply->type(), LanMessage::Type::Pong);

    EXPECT_THAT(server->clients(), SizeIs(1));
    server->stop();
}

TEST_F(TestLanServer, broadcast_to_all_clients_in_order)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto kds = registerPeer(port, DeviceType::Kds);
    auto bds = registerPeer(port, DeviceType::Bds);
    ASSERT_TRUE(kds && bds);

    const LanMessage order_created{OrderCreated{Json{{"id", "o1"}}, Json{{"station", "grill"}}}};
    EXPECT_THAT(server->broadcast(order_created), VariantWith<BroadcastResult::Success>(2));
    EXPECT_THAT(server->broadcastOrderStatus("o1", "ready"), VariantWith<BroadcastResult::Success>(2));

    for (auto* const client : {&kds.value(), &bds.value()})
    {
        const auto first = client->peer->receiveMessage();
        ASSERT_TRUE(first);
        EXPECT_THAT(*first, Eq(order_created));

        const auto second = client->peer->receiveMessage();
        ASSERT_TRUE(second);
        const auto* const update = second->tryAs<OrderStatusUpdate>();
        ASSERT_TRUE(update != nullptr);
        EXPECT_THAT(update->order_id, "o1");
        EXPECT_THAT(update->status, "ready");
        EXPECT_THAT(update->updated_at, Not(IsEmpty()));
    }

    server->stop();
}

TEST_F(TestLanServer, broadcast_order_created)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto kds = registerPeer(port, DeviceType::Kds);
    ASSERT_TRUE(kds);

    const Json order{{"id", "o7"}, {"items", Json::array({"burger", "fries"})}};
    const Json kitchen_order{{"station", "grill"}, {"priority", 2}};
    EXPECT_THAT(server->broadcastOrderCreated(order, kitchen_order), VariantWith<BroadcastResult::Success>(1));

    const auto received = kds->peer->receiveMessage();
    ASSERT_TRUE(received);
    EXPECT_THAT(*received, Eq(LanMessage{OrderCreated{order, kitchen_order}}));

    server->stop();
    EXPECT_THAT(server->broadcastOrderCreated(order, kitchen_order),
                VariantWith<BroadcastResult::Failure>(FailureWithCode(ErrorCode::NotRunning)));
}

TEST_F(TestLanServer, broadcast_replaces_malformed_utf8)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto kds = registerPeer(port, DeviceType::Kds);
    ASSERT_TRUE(kds);

    // A truncated two-byte sequence.
    EXPECT_THAT(server->broadcastOrderStatus("o1", "ready\xC3"), VariantWith<BroadcastResult::Success>(1));
    EXPECT_THAT(server->broadcast(OrderCreated{Json{{"id", "o\xFF"}}, Json::object()}),
                VariantWith<BroadcastResult::Success>(1));

    const auto update = kds->peer->receiveMessage();
    ASSERT_TRUE(update && (update->tryAs<OrderStatusUpdate>() != nullptr));
    EXPECT_THAT(update->tryAs<OrderStatusUpdate>()->status, "ready\xEF\xBF\xBD");

    const auto created = kds->peer->receiveMessage();
    ASSERT_TRUE(created && (created->tryAs<OrderCreated>() != nullptr));
    EXPECT_THAT(created->tryAs<OrderCreated>()->order, Eq(Json{{"id", "o\xEF\xBF\xBD"}}));

    EXPECT_THAT(server->state(), LanServer::State::Running);
    server->stop();
}

TEST_F(TestLanServer, client_disconnect)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto first  = registerPeer(port);
    auto second = registerPeer(port);
    ASSERT_TRUE(first && second);

    first->peer->close();
    const auto disconnected = sink_->waitFor(events::LanClientDisconnected);
    ASSERT_TRUE(disconnected);
    EXPECT_THAT(*disconnected, Json(first->registered.client_id));
    EXPECT_THAT(server->clients(), SizeIs(1));

    EXPECT_THAT(server->broadcast(Ping{}), VariantWith<BroadcastResult::Success>(1));

    server->stop();
}

TEST_F(TestLanServer, stop_closes_all_clients)
{
    const auto server = makeServer();
    const auto port   = startServer(*server);

    auto first  = registerPeer(port);
    auto second = registerPeer(port);
    ASSERT_TRUE(first && second);

    server->stop();

    // Every registered client got its disconnect event before `stop` returned.
    EXPECT_THAT(sink_->count(events::LanClientDisconnected), 2);
    EXPECT_TRUE(first->peer->waitClosed());
    EXPECT_TRUE(second->peer->waitClosed());
    EXPECT_THAT(server->clients(), IsEmpty());
    EXPECT_THAT(server->broadcast(Ping{}), VariantWith<BroadcastResult::Failure>(FailureWithCode(ErrorCode::NotRunning)));

    // New connections are refused.
    EXPECT_FALSE(LanTestPeer::connectTo(port));
}

TEST_F(TestLanServer, throwing_sink_does_not_break_session)
{
    class ThrowingSink final : public EventSink
    {
    public:
        void publish(const std::string&, const Json&) override
        {
            throw std::runtime_error("sink failure");
        }
    };

    const auto server = std::make_unique<LanServer>(makeSettings(), discovery_, std::make_shared<ThrowingSink>());
    const auto port   = startServer(*server);

    const auto peer = LanTestPeer::connectTo(port);
    ASSERT_TRUE(peer);
    ASSERT_TRUE(peer->send(Register{DeviceType::Pos, "tenant-1"}));
    const auto registered = peer->receiveMessage();
    ASSERT_TRUE(registered);
    EXPECT_THAT(registered->type(), LanMessage::Type::Registered);

    ASSERT_TRUE(peer->send(Ping{}));
    const auto pong = peer->receiveMessage();
    ASSERT_TRUE(pong);
    EXPECT_THAT(pong->type(), LanMessage::Type::Pong);

    server->stop();
}

TEST_F(TestLanServer, state_names)
{
    EXPECT_THAT(toString(LanServer::State::Stopped), testing::StrEq("stopped"));
    EXPECT_THAT(toString(LanServer::State::Running), testing::StrEq("running"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
