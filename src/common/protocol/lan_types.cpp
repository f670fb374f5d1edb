//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "possync/sdk/lan_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>

namespace possync
{
namespace sdk
{

const char* toString(const DeviceType device_type) noexcept
{
    switch (device_type)
    {
    case DeviceType::Pos:
        return "pos";
    case DeviceType::Kds:
        return "kds";
    case DeviceType::Bds:
        return "bds";
    case DeviceType::Manager:
        return "manager";
    }
    return "?";
}

cetl::optional<DeviceType> parseDeviceType(const std::string& name)
{
    for (const auto device_type : {DeviceType::Pos, DeviceType::Kds, DeviceType::Bds, DeviceType::Manager})
    {
        if (name == toString(device_type))
        {
            return device_type;
        }
    }
    return cetl::nullopt;
}

const char* toString(const ErrorCode error_code) noexcept
{
    switch (error_code)
    {
    case ErrorCode::AlreadyRunning:
        return "AlreadyRunning";
    case ErrorCode::NotRunning:
        return "NotRunning";
    case ErrorCode::BindFailed:
        return "BindFailed";
    case ErrorCode::AdvertiseFailed:
        return "AdvertiseFailed";
    case ErrorCode::AlreadyConnected:
        return "AlreadyConnected";
    case ErrorCode::InvalidAddress:
        return "InvalidAddress";
    case ErrorCode::ConnectFailed:
        return "ConnectFailed";
    case ErrorCode::HandshakeTimeout:
        return "HandshakeTimeout";
    case ErrorCode::RegistrationRejected:
        return "RegistrationRejected";
    case ErrorCode::DiscoveryFailed:
        return "DiscoveryFailed";
    }
    return "?";
}

namespace
{

template <typename T>
nlohmann::json optionalToJson(const cetl::optional<T>& maybe_value)
{
    if (maybe_value.has_value())
    {
        return nlohmann::json(maybe_value.value());
    }
    return nullptr;
}

}  // namespace

void to_json(nlohmann::json& json, const DeviceType& device_type)
{
    json = toString(device_type);
}

void to_json(nlohmann::json& json, const ClientInfo& client_info)
{
    json = nlohmann::json{
        {"clientId", client_info.client_id},
        {"deviceType", client_info.device_type},
        {"connectedAt", client_info.connected_at},
        {"ipAddress", client_info.ip_address},
    };
}

void to_json(nlohmann::json& json, const ServerInfo& server_info)
{
    json = nlohmann::json{
        {"serverId", server_info.server_id},
        {"tenantId", server_info.tenant_id},
        {"connectedClients", server_info.connected_clients},
        {"serverTime", server_info.server_time},
    };
}

void from_json(const nlohmann::json& json, ServerInfo& server_info)
{
    json.at("serverId").get_to(server_info.server_id);
    json.at("tenantId").get_to(server_info.tenant_id);
    json.at("connectedClients").get_to(server_info.connected_clients);
    json.at("serverTime").get_to(server_info.server_time);
}

void to_json(nlohmann::json& json, const DiscoveredServer& server)
{
    json = nlohmann::json{
        {"name", server.name},
        {"ipAddress", server.ip_address},
        {"port", server.port},
        {"tenantId", optionalToJson(server.tenant_id)},
    };
}

void to_json(nlohmann::json& json, const LanServerStatus& status)
{
    json = nlohmann::json{
        {"isRunning", status.running},
        {"port", status.port},
        {"ipAddress", optionalToJson(status.ip_address)},
        {"mdnsRegistered", status.advertised},
        {"connectedClients", status.clients},
        {"startedAt", optionalToJson(status.started_at)},
        {"serverId", optionalToJson(status.server_id)},
    };
}

void to_json(nlohmann::json& json, const LanClientStatus& status)
{
    json = nlohmann::json{
        {"isConnected", status.connected},
        {"serverAddress", optionalToJson(status.server_address)},
        {"serverInfo", optionalToJson(status.server_info)},
        {"connectedAt", optionalToJson(status.connected_at)},
        {"deviceType", status.device_type},
        {"clientId", optionalToJson(status.client_id)},
    };
}

}  // namespace sdk
}  // namespace possync
