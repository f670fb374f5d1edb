//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_TRANSPORT_OUTBOX_HPP_INCLUDED
#define POSSYNC_COMMON_TRANSPORT_OUTBOX_HPP_INCLUDED

#include "io/io.hpp"

#include <cetl/cetl.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace possync
{
namespace common
{
namespace transport
{

/// Bounded FIFO of outgoing frames of a single connection.
///
/// Producers never block (beyond a short lock): when the outbox is full,
/// the oldest queued frame is dropped to make room for the new one.
/// The consumer waits for frames by polling `wakeFd()`, which is readable while frames are queued.
///
class Outbox final
{
public:
    using Ptr   = std::shared_ptr<Outbox>;
    using Frame = std::shared_ptr<const std::string>;

    /// @return `nullptr` if the wake-up descriptor could not be created.
    ///
    CETL_NODISCARD static Ptr make(const std::size_t capacity);

    Outbox(const std::size_t capacity, io::WakeFd wake_fd);

    Outbox(Outbox&&)                 = delete;
    Outbox(const Outbox&)            = delete;
    Outbox& operator=(Outbox&&)      = delete;
    Outbox& operator=(const Outbox&) = delete;

    ~Outbox() = default;

    /// Enqueues the frame.
    ///
    /// @return `true` if the oldest frame had to be dropped to make room.
    ///
    bool push(Frame frame);

    /// Takes all queued frames (in FIFO order), and resets the wake-up descriptor.
    ///
    std::deque<Frame> takeAll();

    int wakeFd() const noexcept
    {
        return wake_fd_.get();
    }

    std::size_t size() const;
    std::size_t droppedCount() const;

private:
    const std::size_t  capacity_;
    const io::WakeFd   wake_fd_;
    mutable std::mutex mutex_;
    std::deque<Frame>  frames_;
    std::size_t        dropped_count_{0};

};  // Outbox

}  // namespace transport
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_TRANSPORT_OUTBOX_HPP_INCLUDED
