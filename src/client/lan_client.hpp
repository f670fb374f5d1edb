//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_CLIENT_LAN_CLIENT_HPP_INCLUDED
#define POSSYNC_CLIENT_LAN_CLIENT_HPP_INCLUDED

#include "logging.hpp"

#include "possync/sdk/event_sink.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/lan_types.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace possync
{
namespace client
{

/// The follower role of the LAN sync.
///
/// Keeps at most one registered connection to a LAN server, keeps it alive with periodic pings,
/// and forwards server messages to the event sink. There is no automatic reconnection.
///
/// Event sink must not call `connect` or `disconnect` from within its `publish`.
///
class LanClient final
{
public:
    enum class State : std::uint8_t
    {
        Disconnected,
        Connecting,
        Connected,
    };

    LanClient(sdk::LanSettings settings, sdk::ServiceDiscovery::Ptr discovery, sdk::EventSink::Ptr sink);

    LanClient(LanClient&&)                 = delete;
    LanClient(const LanClient&)            = delete;
    LanClient& operator=(LanClient&&)      = delete;
    LanClient& operator=(const LanClient&) = delete;

    ~LanClient();

    sdk::DiscoverResult::Var discover(const cetl::optional<std::string>&               tenant_id,
                                      const cetl::optional<std::chrono::milliseconds>& timeout) const;

    sdk::ConnectResult::Var connect(const std::string&    address,
                                    const sdk::DeviceType device_type,
                                    const std::string&    tenant_id);

    /// Idempotent. Does not wait for the connection thread to wind down.
    ///
    void disconnect();

    sdk::LanClientStatus status() const;
    State                state() const;

private:
    class Session;

    void joinRetiredSessions();
    void onSessionFinished(const Session* const session);

    const sdk::LanSettings           settings_;
    const sdk::ServiceDiscovery::Ptr discovery_;
    const sdk::EventSink::Ptr        sink_;
    common::LoggerPtr                logger_{common::getLogger("client")};

    // Serializes connect/disconnect; guards `retired_` too.
    std::mutex                            lifecycle_mutex_;
    std::vector<std::shared_ptr<Session>> retired_;

    mutable std::shared_timed_mutex state_mutex_;
    State                           state_{State::Disconnected};
    sdk::LanClientStatus            status_;
    std::shared_ptr<Session>        session_;

};  // LanClient

const char* toString(const LanClient::State state) noexcept;

}  // namespace client
}  // namespace possync

#endif  // POSSYNC_CLIENT_LAN_CLIENT_HPP_INCLUDED
