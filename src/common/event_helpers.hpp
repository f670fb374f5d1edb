//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_EVENT_HELPERS_HPP_INCLUDED
#define POSSYNC_COMMON_EVENT_HELPERS_HPP_INCLUDED

#include "common_helpers.hpp"
#include "logging.hpp"

#include "possync/sdk/event_sink.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace possync
{
namespace common
{

/// Publishes the event to the sink; a failing sink must not break the calling worker.
///
inline void publishEvent(sdk::EventSink& sink, Logger& logger, const char* const name, const nlohmann::json& payload)
{
    logger.debug("Publishing '{}' event.", name);
    if (!performWithoutThrowing([&sink, name, &payload] {
            //
            sink.publish(name, payload);
        }))
    {
        logger.warn("Event sink has failed to handle '{}' event.", name);
    }
}

}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_EVENT_HELPERS_HPP_INCLUDED
