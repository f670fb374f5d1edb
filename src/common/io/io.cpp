//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"
#include "possync/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace possync
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
        if (::close(fd_) < 0)
        {
            const int err = errno;
            getLogger("io")->error("Failed to close file descriptor {}: {}.", fd_, std::strerror(err));
        }

        fd_ = -1;
    }
}

OwnFd::~OwnFd()
{
    reset();
}

cetl::optional<WakeFd> WakeFd::make()
{
    const int raw_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (raw_fd < 0)
    {
        const int err = errno;
        getLogger("io")->error("Failed to create eventfd: {}.", std::strerror(err));
        return cetl::nullopt;
    }
    return WakeFd{OwnFd{raw_fd}};
}

void WakeFd::notify() const noexcept
{
    const std::uint64_t one = 1;
    if (const auto err = platform::posixSyscallError([this, &one] {
            //
            return ::write(fd_.get(), &one, sizeof(one));
        }))
    {
        // `EAGAIN` means the counter is saturated - it is readable anyway.
        if (err != EAGAIN)
        {
            getLogger("io")->error("Failed to notify eventfd (fd={}): {}.", fd_.get(), std::strerror(err));
        }
    }
}

void WakeFd::clear() const noexcept
{
    std::uint64_t counter = 0;
    if (const auto err = platform::posixSyscallError([this, &counter] {
            //
            return ::read(fd_.get(), &counter, sizeof(counter));
        }))
    {
        if (err != EAGAIN)
        {
            getLogger("io")->error("Failed to clear eventfd (fd={}): {}.", fd_.get(), std::strerror(err));
        }
    }
}

bool WakeFd::isNotified() const noexcept
{
    pollfd pfd{fd_.get(), POLLIN, 0};
    if (platform::pollFds(&pfd, 1, 0) != 0)
    {
        return false;
    }
    return (pfd.revents & POLLIN) != 0;
}

}  // namespace io
}  // namespace common
}  // namespace possync
