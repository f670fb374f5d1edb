//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_IO_HPP_INCLUDED
#define POSSYNC_COMMON_IO_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <utility>

namespace possync
{
namespace common
{
namespace io
{

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    OwnFd& operator=(std::nullptr_t)
    {
        const OwnFd old{std::move(*this)};
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    int get() const noexcept
    {
        return fd_;
    }

    explicit operator bool() const noexcept
    {
        return fd_ >= 0;
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

/// One-shot, level-triggered notification primitive (on top of Linux `eventfd`).
///
/// Once notified, the descriptor stays readable for every `poll`-er until `clear` is called.
/// So the same instance could be used as a broadcast "stop" signal for several loops,
/// or (with `clear`) as a repeatable "wake up" signal for a single loop.
///
class WakeFd final
{
public:
    CETL_NODISCARD static cetl::optional<WakeFd> make();

    WakeFd(WakeFd&& other) noexcept            = default;
    WakeFd& operator=(WakeFd&& other) noexcept = default;

    WakeFd(const WakeFd&)            = delete;
    WakeFd& operator=(const WakeFd&) = delete;

    ~WakeFd() = default;

    int get() const noexcept
    {
        return fd_.get();
    }

    /// Makes the descriptor readable. Safe to call from any thread, any number of times.
    void notify() const noexcept;

    /// Consumes all pending notifications, so that the descriptor is not readable anymore.
    void clear() const noexcept;

    /// Non-blocking check whether there is a pending notification.
    CETL_NODISCARD bool isNotified() const noexcept;

private:
    explicit WakeFd(OwnFd fd)
        : fd_{std::move(fd)}
    {
    }

    OwnFd fd_;

};  // WakeFd

}  // namespace io
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_IO_HPP_INCLUDED
