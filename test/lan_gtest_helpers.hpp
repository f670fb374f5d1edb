//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_LAN_GTEST_HELPERS_HPP_INCLUDED
#define POSSYNC_LAN_GTEST_HELPERS_HPP_INCLUDED

#include "protocol/lan_message_codec.hpp"

#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_types.hpp"

#include <nlohmann/json.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <ostream>

// MARK: - GTest Printers:

namespace possync
{
namespace sdk
{

inline void PrintTo(const ErrorCode error_code, std::ostream* os)
{
    *os << toString(error_code);
}

inline void PrintTo(const DeviceType device_type, std::ostream* os)
{
    *os << toString(device_type);
}

inline void PrintTo(const Failure& failure, std::ostream* os)
{
    *os << "Failure{code=" << toString(failure.code) << ", msg='" << failure.message << "'";
    if (!failure.server_code.empty())
    {
        *os << ", server_code=" << failure.server_code;
    }
    *os << "}";
}

inline void PrintTo(const ClientInfo& client_info, std::ostream* os)
{
    *os << nlohmann::json(client_info).dump();
}

inline void PrintTo(const ServerInfo& server_info, std::ostream* os)
{
    *os << nlohmann::json(server_info).dump();
}

inline void PrintTo(const LanMessage& message, std::ostream* os)
{
    *os << common::protocol::encode(message);
}

}  // namespace sdk
}  // namespace possync

// MARK: - GTest Matchers:

namespace possync
{

/// Matches `sdk::Failure` by its error code.
///
inline testing::Matcher<const sdk::Failure&> FailureWithCode(const sdk::ErrorCode code)
{
    return testing::Field(&sdk::Failure::code, code);
}

}  // namespace possync

#endif  // POSSYNC_LAN_GTEST_HELPERS_HPP_INCLUDED
