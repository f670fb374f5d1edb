//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "logging.hpp"

#include "possync/sdk/lan_settings.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace possync
{
namespace common
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getLanSettings() const -> sdk::LanSettings override
    {
        sdk::LanSettings settings{};

        settings.bind_host = find_or(root_, "lan", "bind_host", settings.bind_host);
        if (const auto port = findPort("lan", "port"))
        {
            settings.port = port.value();
        }
        settings.handshake_timeout    = findMillis(settings.handshake_timeout, "lan", "handshake_timeout_ms");
        settings.keepalive_interval   = findMillis(settings.keepalive_interval, "lan", "keepalive_interval_ms");
        settings.accept_poll_interval = findMillis(settings.accept_poll_interval, "lan", "accept_poll_interval_ms");
        settings.write_timeout        = findMillis(settings.write_timeout, "lan", "write_timeout_ms");
        if (const auto capacity = findImpl<std::int64_t>("lan", "outbox_capacity"))
        {
            if (capacity.value() > 0)
            {
                settings.outbox_capacity = static_cast<std::size_t>(capacity.value());
            }
            else
            {
                logger_->warn("Ignoring non-positive 'lan.outbox_capacity' (file='{}').", file_path_);
            }
        }

        settings.service_type      = find_or(root_, "discovery", "service_type", settings.service_type);
        settings.instance_prefix   = find_or(root_, "discovery", "instance_prefix", settings.instance_prefix);
        settings.discovery_timeout = findMillis(settings.discovery_timeout, "discovery", "timeout_ms");
        return settings;
    }

    auto getDiscoverySettings() const -> sdk::DiscoverySettings override
    {
        sdk::DiscoverySettings settings{};

        settings.group = find_or(root_, "discovery", "group", settings.group);
        if (const auto port = findPort("discovery", "port"))
        {
            settings.port = port.value();
        }
        if (const auto ttl = findImpl<std::int64_t>("discovery", "ttl"))
        {
            if ((ttl.value() >= 0) && (ttl.value() <= std::numeric_limits<std::uint8_t>::max()))
            {
                settings.ttl = static_cast<int>(ttl.value());
            }
            else
            {
                logger_->warn("Ignoring out of range 'discovery.ttl' (file='{}').", file_path_);
            }
        }
        return settings;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Missing or mistyped key - the caller falls back to its default.
            return cetl::nullopt;
        }
    }

    template <typename... Keys>
    std::chrono::milliseconds findMillis(const std::chrono::milliseconds default_value, Keys&&... keys) const
    {
        const auto millis = findImpl<std::int64_t>(std::forward<Keys>(keys)...);
        if (!millis)
        {
            return default_value;
        }
        if (millis.value() < 0)
        {
            logger_->warn("Ignoring negative timeout (file='{}', value={}).", file_path_, millis.value());
            return default_value;
        }
        return std::chrono::milliseconds{millis.value()};
    }

    cetl::optional<std::uint16_t> findPort(const char* const table, const char* const key) const
    {
        const auto port = findImpl<std::int64_t>(table, key);
        if (!port)
        {
            return cetl::nullopt;
        }
        if ((port.value() < 0) || (port.value() > std::numeric_limits<std::uint16_t>::max()))
        {
            logger_->warn("Ignoring out of range '{}.{}' (file='{}', value={}).", table, key, file_path_, port.value());
            return cetl::nullopt;
        }
        return static_cast<std::uint16_t>(port.value());
    }

    std::string file_path_;
    TomlValue   root_;
    LoggerPtr   logger_{getLogger("config")};

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    const auto logger = getLogger("config");

    if (!std::ifstream{file_path}.good())
    {
        logger->info("Config file is not found - using defaults (file='{}').", file_path);
        return std::make_shared<ConfigImpl>(std::move(file_path), ConfigImpl::TomlValue{ConfigImpl::TomlValue::table_type{}});
    }

    try
    {
        auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
        logger->debug("Config file is loaded (file='{}').", file_path);
        return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));

    } catch (const std::exception& ex)
    {
        logger->error("Failed to parse config file (file='{}'): {}", file_path, ex.what());
        return nullptr;
    }
}

}  // namespace common
}  // namespace possync
