//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_LAN_TYPES_HPP_INCLUDED
#define POSSYNC_SDK_LAN_TYPES_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace possync
{
namespace sdk
{

/// Well-known TCP port of the LAN sync server.
///
constexpr std::uint16_t DefaultLanPort = 3847;

/// Role of a device which participates in the LAN sync.
///
enum class DeviceType : std::uint8_t
{
    Pos,
    Kds,
    Bds,
    Manager,
};

/// Gets wire (lowercase) name of the device type, like "kds".
///
const char* toString(const DeviceType device_type) noexcept;

/// Parses wire (lowercase) name of a device type.
///
/// @return Empty optional if the name is not one of "pos", "kds", "bds" or "manager".
///
cetl::optional<DeviceType> parseDeviceType(const std::string& name);

enum class ErrorCode : std::uint8_t
{
    AlreadyRunning,
    NotRunning,
    BindFailed,
    AdvertiseFailed,
    AlreadyConnected,
    InvalidAddress,
    ConnectFailed,
    HandshakeTimeout,
    RegistrationRejected,
    DiscoveryFailed,
};

const char* toString(const ErrorCode error_code) noexcept;

/// Describes why an administrative operation has failed.
///
struct Failure
{
    ErrorCode   code;
    std::string message;

    /// Error code as reported by the remote server (only for `ErrorCode::RegistrationRejected`),
    /// f.e. "TENANT_MISMATCH".
    std::string server_code;
};

/// Externally visible part of a connected client session.
///
struct ClientInfo
{
    std::string client_id;
    DeviceType  device_type{DeviceType::Kds};
    std::string connected_at;
    std::string ip_address;
};

/// Server information sent to a client on successful registration.
///
struct ServerInfo
{
    std::string server_id;
    std::string tenant_id;
    std::size_t connected_clients{0};
    std::string server_time;
};

inline bool operator==(const ServerInfo& lhs, const ServerInfo& rhs)
{
    return (lhs.server_id == rhs.server_id) && (lhs.tenant_id == rhs.tenant_id) &&
           (lhs.connected_clients == rhs.connected_clients) && (lhs.server_time == rhs.server_time);
}
inline bool operator!=(const ServerInfo& lhs, const ServerInfo& rhs)
{
    return !(lhs == rhs);
}

/// A LAN sync server found by a discovery query.
///
struct DiscoveredServer
{
    std::string                 name;
    std::string                 ip_address;
    std::uint16_t               port{0};
    cetl::optional<std::string> tenant_id;
};

struct LanServerStatus
{
    bool                        running{false};
    std::uint16_t               port{0};
    cetl::optional<std::string> ip_address;
    bool                        advertised{false};
    std::vector<ClientInfo>     clients;
    cetl::optional<std::string> started_at;
    cetl::optional<std::string> server_id;
};

struct LanClientStatus
{
    bool                        connected{false};
    cetl::optional<std::string> server_address;
    cetl::optional<ServerInfo>  server_info;
    cetl::optional<std::string> connected_at;
    DeviceType                  device_type{DeviceType::Kds};
    cetl::optional<std::string> client_id;
};

struct StartResult
{
    using Success = std::string;  // reachable address, like "tcp://192.168.1.10:3847"
    using Failure = sdk::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

struct BroadcastResult
{
    using Success = std::size_t;  // number of sessions published to
    using Failure = sdk::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

struct DiscoverResult
{
    using Success = std::vector<DiscoveredServer>;
    using Failure = sdk::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

struct ConnectResult
{
    using Success = LanClientStatus;
    using Failure = sdk::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

// JSON forms (camelCase) used by notifications, status reporting and the `server_info` wire field.
//
void to_json(nlohmann::json& json, const DeviceType& device_type);
void to_json(nlohmann::json& json, const ClientInfo& client_info);
void to_json(nlohmann::json& json, const ServerInfo& server_info);
void from_json(const nlohmann::json& json, ServerInfo& server_info);
void to_json(nlohmann::json& json, const DiscoveredServer& server);
void to_json(nlohmann::json& json, const LanServerStatus& status);
void to_json(nlohmann::json& json, const LanClientStatus& status);

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_LAN_TYPES_HPP_INCLUDED
