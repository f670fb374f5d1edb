//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_PLATFORM_POSIX_UTILS_HPP_INCLUDED
#define POSSYNC_PLATFORM_POSIX_UTILS_HPP_INCLUDED

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <limits>

namespace possync
{
namespace platform
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return Zero on success, otherwise the `errno` value of the failed call.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// Converts a (possibly negative) duration to a `poll` timeout in milliseconds.
///
/// Sub-millisecond remainders are rounded up, so that a positive duration never becomes a zero timeout.
///
template <typename Rep, typename Period>
int toPollTimeout(const std::chrono::duration<Rep, Period> duration)
{
    using std::chrono::milliseconds;

    if (duration <= duration.zero())
    {
        return 0;
    }
    auto timeout_ms = std::chrono::duration_cast<milliseconds>(duration);
    if (timeout_ms < duration)
    {
        ++timeout_ms;
    }
    const auto max_timeout = static_cast<milliseconds::rep>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(timeout_ms.count(), max_timeout));
}

/// Waits (with `EINTR` retries) until at least one of the given descriptors is ready, or the timeout expires.
///
/// @return Zero on success (including the timeout case - check `revents`), otherwise `errno` value.
///
inline int pollFds(pollfd* const fds, const nfds_t count, const int timeout_ms)
{
    return posixSyscallError([fds, count, timeout_ms] {
        //
        return ::poll(fds, count, timeout_ms);
    });
}

}  // namespace platform
}  // namespace possync

#endif  // POSSYNC_PLATFORM_POSIX_UTILS_HPP_INCLUDED
