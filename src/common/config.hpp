//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_CONFIG_HPP_INCLUDED
#define POSSYNC_COMMON_CONFIG_HPP_INCLUDED

#include "possync/sdk/lan_settings.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace possync
{
namespace common
{

/// Read-only view of the TOML configuration file.
///
/// Any missing (or mistyped) key falls back to its default value.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Loads the configuration file.
    ///
    /// A non-existing file is the same as an empty one.
    ///
    /// @return `nullptr` if the file exists but could not be parsed (see logs for the reason).
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Settings from the `[lan]` table, plus the service naming and timeout of the `[discovery]` one.
    CETL_NODISCARD virtual auto getLanSettings() const -> sdk::LanSettings = 0;

    /// Multicast group settings from the `[discovery]` table.
    CETL_NODISCARD virtual auto getDiscoverySettings() const -> sdk::DiscoverySettings = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_CONFIG_HPP_INCLUDED
