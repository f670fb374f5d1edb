//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define POSSYNC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace possync
{
namespace common
{
namespace io
{

/// IPv4/IPv6 socket address, plus the handful of socket operations which depend on it.
///
/// Supported text forms (an optional `tcp://` or `ws://` scheme prefix is ignored):
/// - `1.2.3.4` or `1.2.3.4:5678`
/// - `::1` or `[::1]:5678`
/// - `*` or `*:5678` - dual-stack wildcard
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint);

    /// Makes an address from a raw one (f.e. as returned by `recvfrom` or `getsockname`).
    ///
    static cetl::optional<SocketAddress> fromRaw(const sockaddr* const addr, const socklen_t addr_len);

    /// Gets the address the given socket is bound to.
    ///
    static cetl::optional<SocketAddress> localOf(const OwnFd& socket_fd);

    /// Finds the first non-loopback IPv4 address of the local network interfaces.
    ///
    static cetl::optional<std::string> findLocalIpv4();

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isAnyInet() const noexcept
    {
        const auto family = asGenericAddr().sa_family;
        return (family == AF_INET) || (family == AF_INET6);
    }

    /// True for `*`, `0.0.0.0` and `::` addresses.
    bool isWildcard() const noexcept;

    std::uint16_t getPort() const noexcept;
    std::string   getHost() const;
    std::string   toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    SocketResult::Var socket(const int type) const;

    CETL_NODISCARD int bind(const OwnFd& socket_fd) const;
    CETL_NODISCARD int connect(const OwnFd& socket_fd) const;

    struct Accepted
    {
        OwnFd         fd;
        SocketAddress peer;
    };
    static cetl::optional<Accepted> accept(const OwnFd& server_fd);

    CETL_NODISCARD static int listen(const OwnFd& server_fd, const int backlog);
    CETL_NODISCARD static int enableReuseAddress(const OwnFd& socket_fd);

private:
    static void configureNoDelay(const OwnFd& fd);
    static int  extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port);
    static cetl::optional<ParseResult::Success> tryParseAsWildcard(const std::string& host, const std::uint16_t port);

    sockaddr& asGenericAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr&>(addr_storage_);
    }
    const sockaddr& asGenericAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr&>(addr_storage_);
    }
    sockaddr_in& asInetAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in&>(addr_storage_);
    }
    const sockaddr_in& asInetAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in&>(addr_storage_);
    }
    sockaddr_in6& asInet6Addr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in6&>(addr_storage_);
    }
    const sockaddr_in6& asInet6Addr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in6&>(addr_storage_);
    }

    bool             is_wildcard_;
    socklen_t        addr_len_;
    sockaddr_storage addr_storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
