//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "connection_registry.hpp"

#include "possync/sdk/lan_types.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace possync
{
namespace server
{

bool ConnectionRegistry::insert(ClientSession::Ptr session)
{
    auto client_id = session->info().client_id;

    const std::unique_lock<std::shared_timed_mutex> lock{mutex_};
    return sessions_.emplace(std::move(client_id), std::move(session)).second;
}

bool ConnectionRegistry::remove(const std::string& client_id)
{
    ClientSession::Ptr removed;
    {
        const std::unique_lock<std::shared_timed_mutex> lock{mutex_};

        const auto it = sessions_.find(client_id);
        if (it == sessions_.end())
        {
            return false;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
    }
    // The record is released (maybe the last reference) outside of the lock.
    return true;
}

void ConnectionRegistry::clear()
{
    std::unordered_map<std::string, ClientSession::Ptr> cleared;
    {
        const std::unique_lock<std::shared_timed_mutex> lock{mutex_};
        cleared.swap(sessions_);
    }
}

std::size_t ConnectionRegistry::size() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{mutex_};
    return sessions_.size();
}

ClientSession::Ptr ConnectionRegistry::find(const std::string& client_id) const
{
    const std::shared_lock<std::shared_timed_mutex> lock{mutex_};

    const auto it = sessions_.find(client_id);
    return (it != sessions_.end()) ? it->second : nullptr;
}

std::vector<sdk::ClientInfo> ConnectionRegistry::list() const
{
    std::vector<sdk::ClientInfo> infos;
    {
        const std::shared_lock<std::shared_timed_mutex> lock{mutex_};

        infos.reserve(sessions_.size());
        for (const auto& id_and_session : sessions_)
        {
            infos.push_back(id_and_session.second->info());
        }
    }

    // RFC 3339 UTC timestamps of the same format are ordered lexicographically.
    std::sort(infos.begin(), infos.end(), [](const sdk::ClientInfo& lhs, const sdk::ClientInfo& rhs) {
        //
        return std::tie(lhs.connected_at, lhs.client_id) < std::tie(rhs.connected_at, rhs.client_id);
    });
    return infos;
}

}  // namespace server
}  // namespace possync
