//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_PROTOCOL_LAN_MESSAGE_CODEC_HPP_INCLUDED
#define POSSYNC_COMMON_PROTOCOL_LAN_MESSAGE_CODEC_HPP_INCLUDED

#include "possync/sdk/lan_message.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace possync
{
namespace common
{
namespace protocol
{

/// Well-formed message of a type this build does not know (f.e. sent by a newer peer).
///
struct UnknownMessage
{
    std::string type;
};

struct DecodeFailure
{
    std::string reason;
};

struct DecodeResult
{
    using Success = sdk::LanMessage;
    using Unknown = UnknownMessage;
    using Failure = DecodeFailure;
    using Var     = cetl::variant<Success, Unknown, Failure>;
};

/// Encodes the message as a JSON object with the "type" discriminant field.
///
std::string encode(const sdk::LanMessage& message);

/// Decodes a JSON object produced by `encode`.
///
/// Unrecognized "type" values produce the `Unknown` result (which receivers should just ignore);
/// malformed JSON or missing/mistyped fields produce the `Failure` one.
///
DecodeResult::Var decode(const cetl::string_view payload);

}  // namespace protocol
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_PROTOCOL_LAN_MESSAGE_CODEC_HPP_INCLUDED
