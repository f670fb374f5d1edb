//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SERVER_CONNECTION_REGISTRY_HPP_INCLUDED
#define POSSYNC_SERVER_CONNECTION_REGISTRY_HPP_INCLUDED

#include "possync/sdk/lan_types.hpp"
#include "transport/outbox.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace possync
{
namespace server
{

/// Record of a registered client connection.
///
/// Immutable once constructed; only the (internally synchronized) outbox changes over time.
///
class ClientSession final
{
public:
    using Ptr = std::shared_ptr<const ClientSession>;

    ClientSession(sdk::ClientInfo info, common::transport::Outbox::Ptr outbox)
        : info_{std::move(info)}
        , outbox_{std::move(outbox)}
    {
    }

    const sdk::ClientInfo& info() const noexcept
    {
        return info_;
    }

    const common::transport::Outbox::Ptr& outbox() const noexcept
    {
        return outbox_;
    }

private:
    const sdk::ClientInfo                info_;
    const common::transport::Outbox::Ptr outbox_;

};  // ClientSession

/// Thread-safe table of the currently registered sessions, keyed by client id.
///
class ConnectionRegistry final
{
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(ConnectionRegistry&&)                 = delete;
    ConnectionRegistry(const ConnectionRegistry&)            = delete;
    ConnectionRegistry& operator=(ConnectionRegistry&&)      = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    ~ConnectionRegistry() = default;

    /// @return `false` if a session with the same client id is already registered.
    ///
    bool insert(ClientSession::Ptr session);

    /// @return `false` if there was no such session (f.e. the registry was cleared meanwhile).
    ///
    bool remove(const std::string& client_id);

    void clear();

    std::size_t        size() const;
    ClientSession::Ptr find(const std::string& client_id) const;

    /// Snapshot of all registered clients, ordered by connection time.
    ///
    std::vector<sdk::ClientInfo> list() const;

private:
    mutable std::shared_timed_mutex                        mutex_;
    std::unordered_map<std::string, ClientSession::Ptr> sessions_;

};  // ConnectionRegistry

}  // namespace server
}  // namespace possync

#endif  // POSSYNC_SERVER_CONNECTION_REGISTRY_HPP_INCLUDED
