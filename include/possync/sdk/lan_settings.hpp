//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_LAN_SETTINGS_HPP_INCLUDED
#define POSSYNC_SDK_LAN_SETTINGS_HPP_INCLUDED

#include "lan_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace possync
{
namespace sdk
{

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// Tunables of the LAN server and client.
///
struct LanSettings
{
    /// Address the server listens on; `0.0.0.0` or `*` for all interfaces.
    std::string   bind_host{"0.0.0.0"};
    std::uint16_t port{DefaultLanPort};

    /// Bound of the registration exchange (on both sides), and of the client's TCP connect.
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds keepalive_interval{30000};
    std::chrono::milliseconds accept_poll_interval{100};
    /// Bound of a single frame write to a peer which does not read.
    std::chrono::milliseconds write_timeout{5000};

    /// Max number of not yet written broadcast frames per client; the oldest ones are dropped beyond.
    std::size_t outbox_capacity{1000};

    std::string               service_type{"_handsfree._tcp.local."};
    std::string               instance_prefix{"Handsfree POS"};
    std::chrono::milliseconds discovery_timeout{5000};
};

/// Settings of the default (UDP multicast based) service discovery.
///
struct DiscoverySettings
{
    std::string   group{"239.255.42.99"};
    std::uint16_t port{5354};
    int           ttl{1};
};

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_LAN_SETTINGS_HPP_INCLUDED
