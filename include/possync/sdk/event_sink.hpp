//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_SDK_EVENT_SINK_HPP_INCLUDED
#define POSSYNC_SDK_EVENT_SINK_HPP_INCLUDED

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace possync
{
namespace sdk
{

/// Names of the events published by the LAN server and client.
///
namespace events
{

/// Payload: `ClientInfo` JSON.
constexpr const char* LanClientConnected = "lan_client_connected";
/// Payload: client id string.
constexpr const char* LanClientDisconnected = "lan_client_disconnected";
/// Payload: `LanClientStatus` JSON.
constexpr const char* LanConnected = "lan_connected";
/// Payload: null.
constexpr const char* LanDisconnected = "lan_disconnected";
/// Payload: `{"order", "kitchenOrder"}`.
constexpr const char* LanOrderCreated = "lan_order_created";
/// Payload: `{"orderId", "status", "updatedAt"}`.
constexpr const char* LanOrderStatusUpdate = "lan_order_status_update";
/// Payload: `{"orders"}`.
constexpr const char* LanSyncState = "lan_sync_state";

}  // namespace events

/// Local notification sink of the hosting application.
///
/// `publish` is called from internal worker threads (never while internal locks are held),
/// so implementations must be thread-safe. Exceptions thrown by it are logged and dropped.
///
class EventSink
{
public:
    using Ptr = std::shared_ptr<EventSink>;

    EventSink(EventSink&&)                 = delete;
    EventSink(const EventSink&)            = delete;
    EventSink& operator=(EventSink&&)      = delete;
    EventSink& operator=(const EventSink&) = delete;

    virtual ~EventSink() = default;

    virtual void publish(const std::string& event_name, const nlohmann::json& payload) = 0;

protected:
    EventSink() = default;

};  // EventSink

}  // namespace sdk
}  // namespace possync

#endif  // POSSYNC_SDK_EVENT_SINK_HPP_INCLUDED
