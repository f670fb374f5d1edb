//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "outbox.hpp"

#include "io/io.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace possync
{
namespace common
{
namespace transport
{

Outbox::Ptr Outbox::make(const std::size_t capacity)
{
    auto maybe_wake_fd = io::WakeFd::make();
    if (!maybe_wake_fd)
    {
        return nullptr;
    }
    return std::make_shared<Outbox>(capacity, std::move(maybe_wake_fd.value()));
}

Outbox::Outbox(const std::size_t capacity, io::WakeFd wake_fd)
    : capacity_{std::max<std::size_t>(capacity, 1)}
    , wake_fd_{std::move(wake_fd)}
{
}

bool Outbox::push(Frame frame)
{
    bool is_dropped = false;
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        if (frames_.size() >= capacity_)
        {
            frames_.pop_front();
            ++dropped_count_;
            is_dropped = true;
        }
        frames_.push_back(std::move(frame));
    }
    wake_fd_.notify();
    return is_dropped;
}

std::deque<Outbox::Frame> Outbox::takeAll()
{
    std::deque<Frame> taken;

    const std::lock_guard<std::mutex> lock{mutex_};
    wake_fd_.clear();
    taken.swap(frames_);
    return taken;
}

std::size_t Outbox::size() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return frames_.size();
}

std::size_t Outbox::droppedCount() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return dropped_count_;
}

}  // namespace transport
}  // namespace common
}  // namespace possync
