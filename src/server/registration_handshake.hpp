//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SERVER_REGISTRATION_HANDSHAKE_HPP_INCLUDED
#define POSSYNC_SERVER_REGISTRATION_HANDSHAKE_HPP_INCLUDED

#include "protocol/lan_message_codec.hpp"

#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>

namespace possync
{
namespace server
{

/// Server side decision over the first message of a new connection.
///
struct RegistrationHandshake
{
    /// Code of the `Error` reply to any rejected registration.
    static constexpr const char* RejectCode = "TENANT_MISMATCH";

    struct Admit
    {
        sdk::DeviceType device_type;
    };
    struct Reject
    {
        sdk::Error reply;
    };
    using Decision = cetl::variant<Admit, Reject>;

    /// Admits only a well-formed `Register` message of the server's own tenant.
    ///
    static Decision evaluate(const common::protocol::DecodeResult::Var& first_message, const std::string& tenant_id);

    /// Builds the positive reply.
    ///
    /// @param clients_before Number of clients registered before the new one is admitted.
    ///
    static sdk::Registered makeRegistered(const std::string& client_id,
                                          const std::string& server_id,
                                          const std::string& tenant_id,
                                          const std::size_t  clients_before);

};  // RegistrationHandshake

}  // namespace server
}  // namespace possync

#endif  // POSSYNC_SERVER_REGISTRATION_HANDSHAKE_HPP_INCLUDED
