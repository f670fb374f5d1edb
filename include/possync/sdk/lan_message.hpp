//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_LAN_MESSAGE_HPP_INCLUDED
#define POSSYNC_SDK_LAN_MESSAGE_HPP_INCLUDED

#include "lan_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace possync
{
namespace sdk
{

/// A new order has been created. Both payloads are opaque to the LAN sync.
struct OrderCreated
{
    nlohmann::json order;
    nlohmann::json kitchen_order;
};

struct OrderStatusUpdate
{
    std::string order_id;
    std::string status;
    std::string updated_at;
};

/// Full state of the currently active orders.
struct SyncState
{
    std::vector<nlohmann::json> orders;
};

struct Ping
{};

struct Pong
{};

/// The very first message of a client connection.
struct Register
{
    DeviceType  device_type{DeviceType::Kds};
    std::string tenant_id;
};

/// Positive reply to the `Register` message.
struct Registered
{
    std::string client_id;
    ServerInfo  server_info;
};

/// Negative reply; the connection is closed right after it.
struct Error
{
    std::string message;
    std::string code;
};

inline bool operator==(const OrderCreated& lhs, const OrderCreated& rhs)
{
    return (lhs.order == rhs.order) && (lhs.kitchen_order == rhs.kitchen_order);
}
inline bool operator==(const OrderStatusUpdate& lhs, const OrderStatusUpdate& rhs)
{
    return (lhs.order_id == rhs.order_id) && (lhs.status == rhs.status) && (lhs.updated_at == rhs.updated_at);
}
inline bool operator==(const SyncState& lhs, const SyncState& rhs)
{
    return lhs.orders == rhs.orders;
}
inline bool operator==(const Ping&, const Ping&)
{
    return true;
}
inline bool operator==(const Pong&, const Pong&)
{
    return true;
}
inline bool operator==(const Register& lhs, const Register& rhs)
{
    return (lhs.device_type == rhs.device_type) && (lhs.tenant_id == rhs.tenant_id);
}
inline bool operator==(const Registered& lhs, const Registered& rhs)
{
    return (lhs.client_id == rhs.client_id) && (lhs.server_info == rhs.server_info);
}
inline bool operator==(const Error& lhs, const Error& rhs)
{
    return (lhs.message == rhs.message) && (lhs.code == rhs.code);
}

/// Closed set of messages exchanged between LAN sync server and its clients.
///
/// The discriminant (`type()`) is explicit and matches the order of the `Var` alternatives.
///
class LanMessage final
{
public:
    enum class Type : std::uint8_t
    {
        OrderCreated,
        OrderStatusUpdate,
        SyncState,
        Ping,
        Pong,
        Register,
        Registered,
        Error,
    };

    using Var = cetl::variant<OrderCreated, OrderStatusUpdate, SyncState, Ping, Pong, Register, Registered, Error>;

    template <typename Alt,
              typename = std::enable_if_t<!std::is_same<std::decay_t<Alt>, LanMessage>::value &&
                                          std::is_constructible<Var, Alt&&>::value>>
    LanMessage(Alt&& alt)  // NOLINT(*-explicit-constructor, *-forwarding-reference-overload)
        : value_{std::forward<Alt>(alt)}
    {
    }

    Type type() const noexcept
    {
        return static_cast<Type>(value_.index());
    }

    const Var& value() const noexcept
    {
        return value_;
    }

    template <typename Alt>
    const Alt* tryAs() const noexcept
    {
        return cetl::get_if<Alt>(&value_);
    }

    friend bool operator==(const LanMessage& lhs, const LanMessage& rhs);
    friend bool operator!=(const LanMessage& lhs, const LanMessage& rhs)
    {
        return !(lhs == rhs);
    }

private:
    Var value_;

};  // LanMessage

/// Gets the wire discriminant of the message type, like "order_created".
///
const char* toString(const LanMessage::Type type) noexcept;

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_LAN_MESSAGE_HPP_INCLUDED
