//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_DISCOVERY_DISCOVERY_DATAGRAM_HPP_INCLUDED
#define POSSYNC_COMMON_DISCOVERY_DISCOVERY_DATAGRAM_HPP_INCLUDED

#include "possync/sdk/service_discovery.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace possync
{
namespace common
{
namespace discovery
{

/// Single datagram of the multicast service discovery protocol.
///
/// Encoded as a JSON object: `{"v": 1, "op": "query|announce|goodbye", "type": ..., ...}`.
/// Only `announce` carries the full service record; `goodbye` carries type and instance name;
/// `query` carries just the type.
///
struct DiscoveryDatagram
{
    enum class Op : std::uint8_t
    {
        Query,
        Announce,
        Goodbye,
    };

    static constexpr int ProtocolVersion = 1;

    Op                 op{Op::Query};
    sdk::ServiceRecord record;

    static DiscoveryDatagram query(const std::string& service_type);
    static DiscoveryDatagram announce(const sdk::ServiceRecord& record);
    static DiscoveryDatagram goodbye(const sdk::ServiceRecord& record);

    std::string encode() const;

    /// Parses a received datagram.
    ///
    /// @return Empty optional for anything which is not a well-formed datagram of the supported version.
    ///
    static cetl::optional<DiscoveryDatagram> parse(const cetl::string_view payload);
};

}  // namespace discovery
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_DISCOVERY_DISCOVERY_DATAGRAM_HPP_INCLUDED
