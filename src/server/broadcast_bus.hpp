//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SERVER_BROADCAST_BUS_HPP_INCLUDED
#define POSSYNC_SERVER_BROADCAST_BUS_HPP_INCLUDED

#include "logging.hpp"
#include "transport/outbox.hpp"

#include "possync/sdk/lan_message.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace possync
{
namespace server
{

/// Fan-out of server messages to the outboxes of all subscribed sessions.
///
/// A message is encoded once, and the same immutable frame is shared by all outboxes.
/// Publishing never waits for any connection; a full outbox drops its oldest frame.
///
class BroadcastBus final
{
public:
    BroadcastBus() = default;

    BroadcastBus(BroadcastBus&&)                 = delete;
    BroadcastBus(const BroadcastBus&)            = delete;
    BroadcastBus& operator=(BroadcastBus&&)      = delete;
    BroadcastBus& operator=(const BroadcastBus&) = delete;

    ~BroadcastBus() = default;

    void subscribe(const std::string& client_id, common::transport::Outbox::Ptr outbox);
    void unsubscribe(const std::string& client_id);
    void clear();

    /// @return Number of subscribers the message was queued to.
    ///
    std::size_t publish(const sdk::LanMessage& message);

    std::size_t subscriberCount() const;

private:
    mutable std::shared_timed_mutex                                    mutex_;
    std::unordered_map<std::string, common::transport::Outbox::Ptr> subscribers_;
    common::LoggerPtr                                                  logger_{common::getLogger("server")};

};  // BroadcastBus

}  // namespace server
}  // namespace possync

#endif  // POSSYNC_SERVER_BROADCAST_BUS_HPP_INCLUDED
