//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "discovery_datagram.hpp"

#include "logging.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <map>
#include <string>

namespace possync
{
namespace common
{
namespace discovery
{
namespace
{

using Json = nlohmann::json;

const char* toString(const DiscoveryDatagram::Op op) noexcept
{
    switch (op)
    {
    case DiscoveryDatagram::Op::Query:
        return "query";
    case DiscoveryDatagram::Op::Announce:
        return "announce";
    case DiscoveryDatagram::Op::Goodbye:
        return "goodbye";
    }
    return "?";
}

cetl::optional<DiscoveryDatagram::Op> parseOp(const std::string& str)
{
    for (const auto op : {DiscoveryDatagram::Op::Query, DiscoveryDatagram::Op::Announce, DiscoveryDatagram::Op::Goodbye})
    {
        if (str == toString(op))
        {
            return op;
        }
    }
    return cetl::nullopt;
}

}  // namespace

constexpr int DiscoveryDatagram::ProtocolVersion;

DiscoveryDatagram DiscoveryDatagram::query(const std::string& service_type)
{
    DiscoveryDatagram datagram{};
    datagram.op                  = Op::Query;
    datagram.record.service_type = service_type;
    return datagram;
}

DiscoveryDatagram DiscoveryDatagram::announce(const sdk::ServiceRecord& record)
{
    return DiscoveryDatagram{Op::Announce, record};
}

DiscoveryDatagram DiscoveryDatagram::goodbye(const sdk::ServiceRecord& record)
{
    DiscoveryDatagram datagram{};
    datagram.op                   = Op::Goodbye;
    datagram.record.service_type  = record.service_type;
    datagram.record.instance_name = record.instance_name;
    return datagram;
}

std::string DiscoveryDatagram::encode() const
{
    Json json{
        {"v", ProtocolVersion},
        {"op", toString(op)},
        {"type", record.service_type},
    };
    switch (op)
    {
    case Op::Announce:
        json["name"] = record.instance_name;
        json["host"] = record.host;
        json["ip"]   = record.ip_address;
        json["port"] = record.port;
        json["txt"]  = record.properties;
        break;
    case Op::Goodbye:
        json["name"] = record.instance_name;
        break;
    case Op::Query:
        break;
    }
    // Malformed UTF-8 in text fields is replaced with U+FFFD instead of throwing.
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

cetl::optional<DiscoveryDatagram> DiscoveryDatagram::parse(const cetl::string_view payload)
{
    auto logger = getLogger("discovery");

    const Json json = Json::parse(payload.data(), payload.data() + payload.size(), nullptr, false);
    if (json.is_discarded() || !json.is_object())
    {
        logger->debug("Ignoring non-JSON datagram (size={}).", payload.size());
        return cetl::nullopt;
    }

    try
    {
        if (json.at("v").get<int>() != ProtocolVersion)
        {
            logger->debug("Ignoring datagram of unsupported version ({}).", json.at("v").dump());
            return cetl::nullopt;
        }
        const auto maybe_op = parseOp(json.at("op").get<std::string>());
        if (!maybe_op)
        {
            logger->debug("Ignoring datagram with unknown op ({}).", json.at("op").dump());
            return cetl::nullopt;
        }

        DiscoveryDatagram datagram{};
        datagram.op                  = maybe_op.value();
        datagram.record.service_type = json.at("type").get<std::string>();
        if (datagram.op != Op::Query)
        {
            datagram.record.instance_name = json.at("name").get<std::string>();
        }
        if (datagram.op == Op::Announce)
        {
            datagram.record.host       = json.value("host", std::string{});
            datagram.record.ip_address = json.value("ip", std::string{});
            const auto port            = json.at("port").get<std::int64_t>();
            if ((port <= 0) || (port > std::numeric_limits<std::uint16_t>::max()))
            {
                logger->debug("Ignoring announce with invalid port ({}).", port);
                return cetl::nullopt;
            }
            datagram.record.port = static_cast<std::uint16_t>(port);
            if (json.contains("txt"))
            {
                datagram.record.properties = json.at("txt").get<std::map<std::string, std::string>>();
            }
        }
        return datagram;

    } catch (const Json::exception& ex)
    {
        logger->debug("Ignoring malformed datagram: {}", ex.what());
        return cetl::nullopt;
    }
}

}  // namespace discovery
}  // namespace common
}  // namespace possync
