//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_LAN_SYNC_HPP_INCLUDED
#define POSSYNC_SDK_LAN_SYNC_HPP_INCLUDED

#include "event_sink.hpp"
#include "lan_message.hpp"
#include "lan_settings.hpp"
#include "lan_types.hpp"
#include "service_discovery.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace possync
{
namespace sdk
{

/// The owning shell of the LAN sync.
///
/// Owns exactly one server slot (leader role) and exactly one client slot (follower role),
/// and exposes the administrative operations of both to the hosting application.
/// All methods are thread-safe; status getters never wait for network activity.
///
class LanSync
{
public:
    /// Defines the (exclusive) owning pointer type of the shell.
    ///
    using Ptr = std::unique_ptr<LanSync>;

    /// Creates a new instance which uses UDP multicast based service discovery.
    ///
    /// @param settings Tunables of the server and client slots.
    /// @param discovery_settings Multicast group and port for the service discovery.
    /// @param sink Local notification sink; must not be `nullptr`.
    /// @return Owning pointer to the new shell. `nullptr` on failure (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(const LanSettings&       settings,
                                   const DiscoverySettings& discovery_settings,
                                   EventSink::Ptr           sink);

    /// Creates a new instance with the given service discovery implementation.
    ///
    /// @param settings Tunables of the server and client slots.
    /// @param discovery Service discovery to advertise and browse with; must not be `nullptr`.
    /// @param sink Local notification sink; must not be `nullptr`.
    /// @return Owning pointer to the new shell. `nullptr` on failure (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(const LanSettings& settings, ServiceDiscovery::Ptr discovery, EventSink::Ptr sink);

    // No copy/move semantics.
    LanSync(LanSync&&)                 = delete;
    LanSync(const LanSync&)            = delete;
    LanSync& operator=(LanSync&&)      = delete;
    LanSync& operator=(const LanSync&) = delete;

    /// Stops the server slot and disconnects the client slot.
    ///
    virtual ~LanSync() = default;

    // MARK: Server slot (leader)

    /// Starts the LAN server for the given tenant, and advertises it on the local network.
    ///
    /// @return Reachable address of the server (like "tcp://192.168.1.10:3847"),
    ///         or failure (`AlreadyRunning`, `BindFailed` or `AdvertiseFailed`).
    ///
    virtual StartResult::Var start(const std::string& tenant_id) = 0;

    /// Stops the LAN server (if running), and disconnects all its clients.
    ///
    virtual void stop() = 0;

    virtual LanServerStatus status() const = 0;

    /// Publishes the message to all currently registered clients.
    ///
    /// Never blocks on a slow client.
    ///
    /// @return Number of clients the message was published to, or `NotRunning` failure.
    ///
    virtual BroadcastResult::Var broadcast(const LanMessage& message) = 0;

    /// Publishes a newly created order together with its kitchen ticket.
    ///
    virtual BroadcastResult::Var broadcastOrderCreated(nlohmann::json order, nlohmann::json kitchen_order) = 0;

    /// Publishes an order status update stamped with the current time.
    ///
    virtual BroadcastResult::Var broadcastOrderStatus(const std::string& order_id, const std::string& status) = 0;

    virtual std::vector<ClientInfo> clients() const = 0;

    // MARK: Client slot (follower)

    /// Browses the local network for LAN sync servers.
    ///
    /// @param tenant_id If present, only servers of this tenant are reported.
    /// @param timeout Browsing window; the configured default is used if empty.
    ///
    virtual DiscoverResult::Var discover(const cetl::optional<std::string>&               tenant_id,
                                         const cetl::optional<std::chrono::milliseconds>& timeout) = 0;

    /// Connects to and registers with the LAN server at the given address.
    ///
    /// @param address Server address, like "tcp://192.168.1.10:3847" or "192.168.1.10".
    /// @return Status of the new connection, or failure (`AlreadyConnected`, `InvalidAddress`,
    ///         `ConnectFailed`, `HandshakeTimeout` or `RegistrationRejected`).
    ///
    virtual ConnectResult::Var connect(const std::string& address,
                                       const DeviceType   device_type,
                                       const std::string& tenant_id) = 0;

    /// Disconnects from the server (if connected). Does not wait for the session to wind down.
    ///
    virtual void disconnect() = 0;

    virtual LanClientStatus clientStatus() const = 0;

protected:
    LanSync() = default;

};  // LanSync

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_LAN_SYNC_HPP_INCLUDED
