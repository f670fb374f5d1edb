//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "broadcast_bus.hpp"

#include "protocol/lan_message_codec.hpp"
#include "transport/outbox.hpp"

#include "possync/sdk/lan_message.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace possync
{
namespace server
{

void BroadcastBus::subscribe(const std::string& client_id, common::transport::Outbox::Ptr outbox)
{
    const std::unique_lock<std::shared_timed_mutex> lock{mutex_};
    subscribers_[client_id] = std::move(outbox);
}

void BroadcastBus::unsubscribe(const std::string& client_id)
{
    const std::unique_lock<std::shared_timed_mutex> lock{mutex_};
    subscribers_.erase(client_id);
}

void BroadcastBus::clear()
{
    std::unordered_map<std::string, common::transport::Outbox::Ptr> cleared;
    {
        const std::unique_lock<std::shared_timed_mutex> lock{mutex_};
        cleared.swap(subscribers_);
    }
}

std::size_t BroadcastBus::publish(const sdk::LanMessage& message)
{
    const auto frame = std::make_shared<const std::string>(common::protocol::encode(message));

    const std::shared_lock<std::shared_timed_mutex> lock{mutex_};

    for (const auto& id_and_outbox : subscribers_)
    {
        if (id_and_outbox.second->push(frame))
        {
            logger_->warn("Outbox of client '{}' is full - dropped its oldest message (total_dropped={}).",
                          id_and_outbox.first,
                          id_and_outbox.second->droppedCount());
        }
    }

    logger_->trace("Published '{}' message to {} subscriber(s).", toString(message.type()), subscribers_.size());
    return subscribers_.size();
}

std::size_t BroadcastBus::subscriberCount() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{mutex_};
    return subscribers_.size();
}

}  // namespace server
}  // namespace possync
