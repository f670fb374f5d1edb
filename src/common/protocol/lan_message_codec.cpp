//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "lan_message_codec.hpp"

#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace possync
{
namespace sdk
{

const char* toString(const LanMessage::Type type) noexcept
{
    switch (type)
    {
    case LanMessage::Type::OrderCreated:
        return "order_created";
    case LanMessage::Type::OrderStatusUpdate:
        return "order_status_update";
    case LanMessage::Type::SyncState:
        return "sync_state";
    case LanMessage::Type::Ping:
        return "ping";
    case LanMessage::Type::Pong:
        return "pong";
    case LanMessage::Type::Register:
        return "register";
    case LanMessage::Type::Registered:
        return "registered";
    case LanMessage::Type::Error:
        return "error";
    }
    return "?";
}

bool operator==(const LanMessage& lhs, const LanMessage& rhs)
{
    if (lhs.value_.index() != rhs.value_.index())
    {
        return false;
    }
    return cetl::visit(
        [&rhs](const auto& lhs_alt) {
            //
            using Alt = std::decay_t<decltype(lhs_alt)>;
            return lhs_alt == cetl::get<Alt>(rhs.value_);
        },
        lhs.value_);
}

}  // namespace sdk

namespace common
{
namespace protocol
{
namespace
{

using Json = nlohmann::json;

constexpr const char* TypeField = "type";

// MARK: Encoding of the variant specific fields.

void encodeFields(Json& json, const sdk::OrderCreated& msg)
{
    json["order"]         = msg.order;
    json["kitchen_order"] = msg.kitchen_order;
}

void encodeFields(Json& json, const sdk::OrderStatusUpdate& msg)
{
    json["order_id"]   = msg.order_id;
    json["status"]     = msg.status;
    json["updated_at"] = msg.updated_at;
}

void encodeFields(Json& json, const sdk::SyncState& msg)
{
    json["orders"] = msg.orders;
}

void encodeFields(Json&, const sdk::Ping&) {}

void encodeFields(Json&, const sdk::Pong&) {}

void encodeFields(Json& json, const sdk::Register& msg)
{
    json["device_type"] = msg.device_type;
    json["tenant_id"]   = msg.tenant_id;
}

void encodeFields(Json& json, const sdk::Registered& msg)
{
    json["client_id"]   = msg.client_id;
    json["server_info"] = msg.server_info;
}

void encodeFields(Json& json, const sdk::Error& msg)
{
    json["message"] = msg.message;
    json["code"]    = msg.code;
}

// MARK: Decoding of the variant specific fields.
// These may throw `nlohmann::json::exception` on missing or mistyped fields.

DecodeResult::Var decodeOrderCreated(const Json& json)
{
    return sdk::LanMessage{sdk::OrderCreated{json.at("order"), json.at("kitchen_order")}};
}

DecodeResult::Var decodeOrderStatusUpdate(const Json& json)
{
    return sdk::LanMessage{sdk::OrderStatusUpdate{json.at("order_id").get<std::string>(),
                                                  json.at("status").get<std::string>(),
                                                  json.at("updated_at").get<std::string>()}};
}

DecodeResult::Var decodeSyncState(const Json& json)
{
    const auto& orders = json.at("orders");
    if (!orders.is_array())
    {
        return DecodeFailure{"invalid 'sync_state' message: \"orders\" is not an array"};
    }
    return sdk::LanMessage{sdk::SyncState{orders.get<std::vector<Json>>()}};
}

DecodeResult::Var decodeRegister(const Json& json)
{
    const auto device_type_str = json.at("device_type").get<std::string>();
    const auto device_type     = sdk::parseDeviceType(device_type_str);
    if (!device_type)
    {
        return DecodeFailure{"invalid 'register' message: unknown device type '" + device_type_str + "'"};
    }
    return sdk::LanMessage{sdk::Register{device_type.value(), json.at("tenant_id").get<std::string>()}};
}

DecodeResult::Var decodeRegistered(const Json& json)
{
    return sdk::LanMessage{
        sdk::Registered{json.at("client_id").get<std::string>(), json.at("server_info").get<sdk::ServerInfo>()}};
}

DecodeResult::Var decodeError(const Json& json)
{
    return sdk::LanMessage{sdk::Error{json.at("message").get<std::string>(), json.at("code").get<std::string>()}};
}

}  // namespace

std::string encode(const sdk::LanMessage& message)
{
    Json json = Json::object();
    json[TypeField] = sdk::toString(message.type());
    cetl::visit(
        [&json](const auto& msg) {
            //
            encodeFields(json, msg);
        },
        message.value());
    // Malformed UTF-8 in text fields is replaced with U+FFFD instead of throwing.
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

DecodeResult::Var decode(const cetl::string_view payload)
{
    Json json = Json::parse(payload.data(), payload.data() + payload.size(), nullptr, false);
    if (json.is_discarded())
    {
        return DecodeFailure{"not a JSON document"};
    }
    if (!json.is_object())
    {
        return DecodeFailure{"not a JSON object"};
    }

    const auto type_it = json.find(TypeField);
    if ((type_it == json.end()) || !type_it->is_string())
    {
        return DecodeFailure{"missing \"type\" discriminant"};
    }
    const auto& type = type_it->get_ref<const std::string&>();

    try
    {
        if (type == "order_created")
        {
            return decodeOrderCreated(json);
        }
        if (type == "order_status_update")
        {
            return decodeOrderStatusUpdate(json);
        }
        if (type == "sync_state")
        {
            return decodeSyncState(json);
        }
        if (type == "ping")
        {
            return sdk::LanMessage{sdk::Ping{}};
        }
        if (type == "pong")
        {
            return sdk::LanMessage{sdk::Pong{}};
        }
        if (type == "register")
        {
            return decodeRegister(json);
        }
        if (type == "registered")
        {
            return decodeRegistered(json);
        }
        if (type == "error")
        {
            return decodeError(json);
        }
    } catch (const Json::exception& ex)
    {
        return DecodeFailure{"invalid '" + type + "' message: " + ex.what()};
    }

    return UnknownMessage{type};
}

}  // namespace protocol
}  // namespace common
}  // namespace possync
