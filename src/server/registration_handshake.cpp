//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "registration_handshake.hpp"

#include "common_helpers.hpp"
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

constexpr const char* RegistrationHandshake::RejectCode;

RegistrationHandshake::Decision RegistrationHandshake::evaluate(
    const common::protocol::DecodeResult::Var& first_message,
    const std::string&                         tenant_id)
{
    const auto* const message = cetl::get_if<common::protocol::DecodeResult::Success>(&first_message);
    const auto* const reg     = (message != nullptr) ? message->tryAs<sdk::Register>() : nullptr;
    if (reg == nullptr)
    {
        return Reject{sdk::Error{"Expected register message", RejectCode}};
    }
    if (reg->tenant_id != tenant_id)
    {
        return Reject{sdk::Error{"Tenant ID mismatch", RejectCode}};
    }
    return Admit{reg->device_type};
}

sdk::Registered RegistrationHandshake::makeRegistered(const std::string& client_id,
                                                      const std::string& server_id,
                                                      const std::string& tenant_id,
                                                      const std::size_t  clients_before)
{
    return sdk::Registered{client_id, sdk::ServerInfo{server_id, tenant_id, clients_before, common::nowRfc3339()}};
}

}  // namespace server
}  // namespace possync
