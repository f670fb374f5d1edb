//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <possync/sdk/lan_sync.hpp>

#include "discovery/multicast_service_discovery.hpp"
#include "lan_client.hpp"
#include "lan_server.hpp"
#include "logging.hpp"

#include "possync/sdk/event_sink.hpp"
#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/lan_types.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace possync
{
namespace sdk
{
namespace
{

class LanSyncImpl final : public LanSync
{
public:
    LanSyncImpl(const LanSettings& settings, const ServiceDiscovery::Ptr& discovery, const EventSink::Ptr& sink)
        : server_{settings, discovery, sink}
        , client_{settings, discovery, sink}
    {
    }

    ~LanSyncImpl() override
    {
        logger_->debug("Shutting down LAN sync.");
    }

    // LanSync

    StartResult::Var start(const std::string& tenant_id) override
    {
        return server_.start(tenant_id);
    }

    void stop() override
    {
        server_.stop();
    }

    LanServerStatus status() const override
    {
        return server_.status();
    }

    BroadcastResult::Var broadcast(const LanMessage& message) override
    {
        return server_.broadcast(message);
    }

    BroadcastResult::Var broadcastOrderCreated(nlohmann::json order, nlohmann::json kitchen_order) override
    {
        return server_.broadcastOrderCreated(std::move(order), std::move(kitchen_order));
    }

    BroadcastResult::Var broadcastOrderStatus(const std::string& order_id, const std::string& status) override
    {
        return server_.broadcastOrderStatus(order_id, status);
    }

    std::vector<ClientInfo> clients() const override
    {
        return server_.clients();
    }

    DiscoverResult::Var discover(const cetl::optional<std::string>&               tenant_id,
                                 const cetl::optional<std::chrono::milliseconds>& timeout) override
    {
        return client_.discover(tenant_id, timeout);
    }

    ConnectResult::Var connect(const std::string& address,
                               const DeviceType   device_type,
                               const std::string& tenant_id) override
    {
        return client_.connect(address, device_type, tenant_id);
    }

    void disconnect() override
    {
        client_.disconnect();
    }

    LanClientStatus clientStatus() const override
    {
        return client_.status();
    }

private:
    common::LoggerPtr logger_{common::getLogger("sdk")};

    // The client is destroyed (disconnected) first, then the server is stopped.
    server::LanServer server_;
    client::LanClient client_;

};  // LanSyncImpl

}  // namespace

CETL_NODISCARD LanSync::Ptr LanSync::make(const LanSettings&       settings,
                                          const DiscoverySettings& discovery_settings,
                                          EventSink::Ptr           sink)
{
    auto discovery = common::discovery::MulticastServiceDiscovery::make(discovery_settings);
    if (!discovery)
    {
        common::getLogger("sdk")->error("Failed to create service discovery (group='{}').", discovery_settings.group);
        return nullptr;
    }
    return make(settings, std::move(discovery), std::move(sink));
}

CETL_NODISCARD LanSync::Ptr LanSync::make(const LanSettings& settings, ServiceDiscovery::Ptr discovery, EventSink::Ptr sink)
{
    if (!discovery || !sink)
    {
        common::getLogger("sdk")->error("Both service discovery and event sink are required.");
        return nullptr;
    }
    return std::make_unique<LanSyncImpl>(settings, discovery, sink);
}

}  // namespace sdk
}  // namespace possync
