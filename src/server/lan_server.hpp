//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SERVER_LAN_SERVER_HPP_INCLUDED
#define POSSYNC_SERVER_LAN_SERVER_HPP_INCLUDED

#include "logging.hpp"

#include "possync/sdk/event_sink.hpp"
#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/lan_types.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace possync
{
namespace server
{

/// The leader role of the LAN sync.
///
/// Accepts client connections, admits only clients of its own tenant,
/// advertises itself on the local network, and fans out broadcast messages to all registered clients.
///
/// Every accepted connection is served by its own thread; the listening socket by one more.
/// Event sink is never called while internal locks are held.
///
class LanServer final
{
public:
    enum class State : std::uint8_t
    {
        Stopped,
        Starting,
        Running,
        Stopping,
    };

    LanServer(sdk::LanSettings settings, sdk::ServiceDiscovery::Ptr discovery, sdk::EventSink::Ptr sink);

    LanServer(LanServer&&)                 = delete;
    LanServer(const LanServer&)            = delete;
    LanServer& operator=(LanServer&&)      = delete;
    LanServer& operator=(const LanServer&) = delete;

    ~LanServer();

    sdk::StartResult::Var start(const std::string& tenant_id);

    /// Idempotent. Waits until all connection threads are finished.
    ///
    /// Must not be called from within the event sink.
    ///
    void stop();

    sdk::BroadcastResult::Var broadcast(const sdk::LanMessage& message);
    sdk::BroadcastResult::Var broadcastOrderCreated(nlohmann::json order, nlohmann::json kitchen_order);
    sdk::BroadcastResult::Var broadcastOrderStatus(const std::string& order_id, const std::string& status);

    sdk::LanServerStatus         status() const;
    std::vector<sdk::ClientInfo> clients() const;
    State                        state() const;

private:
    struct Context;
    class Session;
    class Instance;

    const sdk::LanSettings           settings_;
    const sdk::ServiceDiscovery::Ptr discovery_;
    const sdk::EventSink::Ptr        sink_;
    common::LoggerPtr                logger_{common::getLogger("server")};

    // Serializes start/stop transitions; status readers use only the state lock.
    std::mutex lifecycle_mutex_;

    mutable std::shared_timed_mutex state_mutex_;
    State                           state_{State::Stopped};
    std::unique_ptr<Instance>       running_;

};  // LanServer

const char* toString(const LanServer::State state) noexcept;

}  // namespace server
}  // namespace possync

#endif  // POSSYNC_SERVER_LAN_SERVER_HPP_INCLUDED
