//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_DISCOVERY_MULTICAST_SERVICE_DISCOVERY_HPP_INCLUDED
#define POSSYNC_COMMON_DISCOVERY_MULTICAST_SERVICE_DISCOVERY_HPP_INCLUDED

#include "io/socket_address.hpp"
#include "logging.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/cetl.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace possync
{
namespace common
{
namespace discovery
{

/// Service discovery over UDP multicast (mDNS-like, with JSON datagrams).
///
/// - A registered service is announced to the group, answers the group `query` datagrams
///   (by unicast reply to the querier), and sends `goodbye` on unregistration.
/// - Browsing sends a `query` to the group and collects `announce` replies until the timeout.
///
class MulticastServiceDiscovery final : public sdk::ServiceDiscovery
{
public:
    /// @return `nullptr` if the multicast group address is invalid.
    ///
    CETL_NODISCARD static Ptr make(const sdk::DiscoverySettings& settings);

    MulticastServiceDiscovery(const sdk::DiscoverySettings& settings, const io::SocketAddress& group_address);

    MulticastServiceDiscovery(MulticastServiceDiscovery&&)                 = delete;
    MulticastServiceDiscovery(const MulticastServiceDiscovery&)            = delete;
    MulticastServiceDiscovery& operator=(MulticastServiceDiscovery&&)      = delete;
    MulticastServiceDiscovery& operator=(const MulticastServiceDiscovery&) = delete;

    ~MulticastServiceDiscovery() override = default;

    // sdk::ServiceDiscovery

    CETL_NODISCARD RegisterResult::Var registerService(const sdk::ServiceRecord& record) override;
    CETL_NODISCARD BrowseResult::Var   browse(const std::string&              service_type,
                                              const std::chrono::milliseconds timeout) override;

private:
    class ResponderImpl;
    class BrowserImpl;

    const sdk::DiscoverySettings settings_;
    const io::SocketAddress      group_address_;
    LoggerPtr                    logger_{getLogger("discovery")};

};  // MulticastServiceDiscovery

}  // namespace discovery
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_DISCOVERY_MULTICAST_SERVICE_DISCOVERY_HPP_INCLUDED
