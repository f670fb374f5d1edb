//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "possync/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ifaddrs.h>
#include <limits>
#include <net/if.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <utility>

namespace possync
{
namespace common
{
namespace io
{
namespace
{

const char* const SupportedSchemes[] = {"tcp://", "ws://"};  // NOLINT(*-avoid-c-arrays)

std::string stripScheme(const std::string& str)
{
    for (const auto* const scheme : SupportedSchemes)
    {
        const std::size_t scheme_len = std::strlen(scheme);
        if (0 == str.compare(0, scheme_len, scheme))
        {
            auto rest = str.substr(scheme_len);
            // Tolerate a trailing path (like `ws://1.2.3.4:3847/`).
            const auto slash_pos = rest.find('/');
            if (slash_pos != std::string::npos)
            {
                rest.resize(slash_pos);
            }
            return rest;
        }
    }
    return str;
}

}  // namespace

SocketAddress::SocketAddress() noexcept
    : is_wildcard_{false}
    , addr_len_{0}
    , addr_storage_{}
{
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    return {&asGenericAddr(), addr_len_};
}

cetl::optional<SocketAddress> SocketAddress::fromRaw(const sockaddr* const addr, const socklen_t addr_len)
{
    if ((addr == nullptr) || (addr_len > sizeof(sockaddr_storage)))
    {
        return cetl::nullopt;
    }
    if ((addr->sa_family != AF_INET) && (addr->sa_family != AF_INET6))
    {
        return cetl::nullopt;
    }

    SocketAddress result{};
    std::memcpy(&result.addr_storage_, addr, addr_len);
    result.addr_len_ = addr_len;
    return result;
}

cetl::optional<SocketAddress> SocketAddress::localOf(const OwnFd& socket_fd)
{
    sockaddr_storage storage{};
    socklen_t        storage_len = sizeof(storage);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto* const raw_addr = reinterpret_cast<sockaddr*>(&storage);
    if (::getsockname(socket_fd.get(), raw_addr, &storage_len) < 0)
    {
        const int err = errno;
        getLogger("io")->warn("Failed to get socket name (fd={}): {}.", socket_fd.get(), std::strerror(err));
        return cetl::nullopt;
    }
    return fromRaw(raw_addr, storage_len);
}

cetl::optional<std::string> SocketAddress::findLocalIpv4()
{
    ifaddrs* if_addrs = nullptr;
    if (::getifaddrs(&if_addrs) < 0)
    {
        const int err = errno;
        getLogger("io")->warn("Failed to list network interfaces: {}.", std::strerror(err));
        return cetl::nullopt;
    }

    cetl::optional<std::string> result;
    for (const ifaddrs* ifa = if_addrs; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if ((ifa->ifa_addr == nullptr) || (ifa->ifa_addr->sa_family != AF_INET))
        {
            continue;
        }
        if (((ifa->ifa_flags & IFF_UP) == 0) || ((ifa->ifa_flags & IFF_LOOPBACK) != 0))
        {
            continue;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto* const addr_in = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        std::array<char, INET_ADDRSTRLEN> buffer{};
        if (::inet_ntop(AF_INET, &addr_in->sin_addr, buffer.data(), buffer.size()) != nullptr)
        {
            getLogger("io")->trace("Local IPv4 address found (iface='{}', addr={}).", ifa->ifa_name, buffer.data());
            result = std::string{buffer.data()};
            break;
        }
    }

    ::freeifaddrs(if_addrs);
    return result;
}

bool SocketAddress::isWildcard() const noexcept
{
    if (is_wildcard_)
    {
        return true;
    }
    switch (asGenericAddr().sa_family)
    {
    case AF_INET:
        return asInetAddr().sin_addr.s_addr == htonl(INADDR_ANY);
    case AF_INET6:
        return 0 == std::memcmp(&asInet6Addr().sin6_addr, &in6addr_any, sizeof(in6addr_any));
    default:
        return false;
    }
}

std::uint16_t SocketAddress::getPort() const noexcept
{
    switch (asGenericAddr().sa_family)
    {
    case AF_INET:
        return ntohs(asInetAddr().sin_port);
    case AF_INET6:
        return ntohs(asInet6Addr().sin6_port);
    default:
        return 0;
    }
}

std::string SocketAddress::getHost() const
{
    if (is_wildcard_)
    {
        return "*";
    }

    std::array<char, INET6_ADDRSTRLEN> buffer{};
    switch (asGenericAddr().sa_family)
    {
    case AF_INET:
        if (::inet_ntop(AF_INET, &asInetAddr().sin_addr, buffer.data(), buffer.size()) != nullptr)
        {
            return buffer.data();
        }
        break;
    case AF_INET6: {
        const auto& addr6 = asInet6Addr().sin6_addr;
        if (IN6_IS_ADDR_V4MAPPED(&addr6))
        {
            // Peers of a dual-stack socket are reported as plain IPv4.
            in_addr addr4{};
            std::memcpy(&addr4, &addr6.s6_addr[12], sizeof(addr4));  // NOLINT(*-magic-numbers)
            if (::inet_ntop(AF_INET, &addr4, buffer.data(), buffer.size()) != nullptr)
            {
                return buffer.data();
            }
        }
        else if (::inet_ntop(AF_INET6, &addr6, buffer.data(), buffer.size()) != nullptr)
        {
            return buffer.data();
        }
        break;
    }
    default:
        break;
    }
    return {};
}

std::string SocketAddress::toString() const
{
    const auto host = getHost();
    if ((asGenericAddr().sa_family == AF_INET6) && (host.find(':') != std::string::npos))
    {
        return "[" + host + "]:" + std::to_string(getPort());
    }
    return host + ":" + std::to_string(getPort());
}

SocketAddress::SocketResult::Var SocketAddress::socket(const int type) const
{
    const bool is_stream   = (SOCK_STREAM == type);
    uint       socket_type = type;
#if __linux__
    socket_type |= static_cast<uint>(SOCK_NONBLOCK);
    socket_type |= static_cast<uint>(SOCK_CLOEXEC);
#endif

    OwnFd out_fd;

    const auto& addr_generic = asGenericAddr();
    if (const auto err = platform::posixSyscallError([socket_type, &addr_generic, &out_fd] {
            //
            const int fd = ::socket(addr_generic.sa_family, static_cast<int>(socket_type), 0);
            if (fd != -1)
            {
                out_fd = OwnFd{fd};
            }
            return fd;
        }))
    {
        getLogger("io")->error("Failed to create socket: {}.", std::strerror(err));
        return err;
    }

    // Disable Nagle's algorithm for TCP sockets, so that small order frames are sent immediately.
    //
    if (is_stream)
    {
        configureNoDelay(out_fd);
    }

    return out_fd;
}

int SocketAddress::bind(const OwnFd& socket_fd) const
{
    const int raw_fd = socket_fd.get();
    CETL_DEBUG_ASSERT(raw_fd != -1, "");

    // Disable IPv6-only mode for dual-stack sockets (aka wildcard).
    if (is_wildcard_)
    {
        if (const auto err = platform::posixSyscallError([raw_fd] {
                //
                int disable = 0;
                return ::setsockopt(raw_fd, IPPROTO_IPV6, IPV6_V6ONLY, &disable, sizeof(disable));
            }))
        {
            getLogger("io")->error("Failed to set IPV6_V6ONLY=0: {}.", std::strerror(err));
            return err;
        }
    }

    const auto err = platform::posixSyscallError([this, raw_fd] {
        //
        return ::bind(raw_fd, &asGenericAddr(), addr_len_);
    });
    if (err != 0)
    {
        getLogger("io")->error("Failed to bind to '{}': {}.", toString(), std::strerror(err));
    }
    return err;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    const int raw_fd = socket_fd.get();
    CETL_DEBUG_ASSERT(raw_fd != -1, "");

    const auto err = platform::posixSyscallError([this, raw_fd] {
        //
        return ::connect(raw_fd, &asGenericAddr(), addr_len_);
    });
    switch (err)
    {
    case 0:
    case EINPROGRESS: {
        return 0;
    }
    default: {
        getLogger("io")->error("Failed to connect to '{}': {}.", toString(), std::strerror(err));
        return err;
    }
    }
}

int SocketAddress::listen(const OwnFd& server_fd, const int backlog)
{
    const auto err = platform::posixSyscallError([&server_fd, backlog] {
        //
        return ::listen(server_fd.get(), backlog);
    });
    if (err != 0)
    {
        getLogger("io")->error("Failed to listen on socket (fd={}): {}.", server_fd.get(), std::strerror(err));
    }
    return err;
}

int SocketAddress::enableReuseAddress(const OwnFd& socket_fd)
{
    const auto err = platform::posixSyscallError([&socket_fd] {
        //
        int enable = 1;
        return ::setsockopt(socket_fd.get(), SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));
    });
    if (err != 0)
    {
        getLogger("io")->warn("Failed to set SO_REUSEADDR (fd={}): {}.", socket_fd.get(), std::strerror(err));
    }
    return err;
}

cetl::optional<SocketAddress::Accepted> SocketAddress::accept(const OwnFd& server_fd)
{
    CETL_DEBUG_ASSERT(server_fd.get() != -1, "");

    while (true)
    {
        SocketAddress peer{};
        peer.addr_len_ = sizeof(peer.addr_storage_);
#if __linux__
        OwnFd client_fd{
            ::accept4(server_fd.get(), &peer.asGenericAddr(), &peer.addr_len_, SOCK_NONBLOCK | SOCK_CLOEXEC)};
#else
        OwnFd client_fd{::accept(server_fd.get(), &peer.asGenericAddr(), &peer.addr_len_)};
#endif
        if (client_fd.get() >= 0)
        {
            configureNoDelay(client_fd);
            return Accepted{std::move(client_fd), peer};
        }

        const int err = errno;
        switch (err)
        {
        case EAGAIN:
#if EAGAIN != EWOULDBLOCK
        case EWOULDBLOCK:
#endif
        {
            // Not ready yet - just exit.
            return cetl::nullopt;
        }

        // The list of errors below is a guess of temporary network errors (vs permanent ones).
        //
        case EINTR:
        case ENETDOWN:
        case ETIMEDOUT:
        case EHOSTDOWN:
        case ENETUNREACH:
        case ECONNABORTED:
        case EHOSTUNREACH:
#ifdef EPROTO
        case EPROTO:  // not defined on OpenBSD
#endif
        {
            // Just log and retry.
            getLogger("io")->debug("Failed to accept connection; retrying (fd={}, err={}).", server_fd.get(), err);
            break;
        }

        default: {
            // Just log and exit.
            getLogger("io")->warn("Failed to accept connection (fd={}, err={}): {}.",
                                  server_fd.get(),
                                  err,
                                  std::strerror(err));
            return cetl::nullopt;
        }
        }  // switch err

    }  // while(true)
}

void SocketAddress::configureNoDelay(const OwnFd& fd)
{
    constexpr int enable = 1;

    if (const auto err = platform::posixSyscallError([&fd, &enable] {
            //
            return ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable));
        }))
    {
        getLogger("io")->warn("Failed to set TCP_NODELAY={} (fd={}, err={}): {}.",
                              enable,
                              fd.get(),
                              err,
                              std::strerror(err));
    }
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str, const std::uint16_t port_hint)
{
    // Extract the family, host, and port.
    //
    std::string   host;
    std::uint16_t port   = port_hint;
    const int     family = extractFamilyHostAndPort(stripScheme(str), host, port);
    if (family == AF_UNSPEC)
    {
        return EINVAL;
    }
    if (auto result = tryParseAsWildcard(host, port))
    {
        return *result;
    }

    // Convert the host string to inet address.
    //
    SocketAddress result{};
    void*         addr_target = nullptr;
    if (family == AF_INET6)
    {
        auto& result_inet6       = result.asInet6Addr();
        result.addr_len_         = sizeof(result_inet6);
        result_inet6.sin6_family = AF_INET6;
        result_inet6.sin6_port   = htons(port);
        addr_target              = &result_inet6.sin6_addr;
    }
    else
    {
        auto& result_inet4      = result.asInetAddr();
        result.addr_len_        = sizeof(result_inet4);
        result_inet4.sin_family = AF_INET;
        result_inet4.sin_port   = htons(port);
        addr_target             = &result_inet4.sin_addr;
    }
    const int convert_result = ::inet_pton(family, host.c_str(), addr_target);
    switch (convert_result)
    {
    case 1: {
        return result;
    }
    case 0: {
        getLogger("io")->error("Unsupported address (addr='{}').", host);
        return EINVAL;
    }
    default: {
        const int err = errno;
        getLogger("io")->error("Failed to parse address (addr='{}'): {}", host, std::strerror(err));
        return err;
    }
    }
}

int SocketAddress::extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port)
{
    int         family = AF_INET;
    std::string port_part;

    if (str.empty())
    {
        getLogger("io")->error("Empty address.");
        return AF_UNSPEC;
    }

    if (0 == str.find_first_of('['))
    {
        // IPv6 starts with a bracket when with a port.
        family = AF_INET6;

        const auto end_bracket_pos = str.find_last_of(']');
        if (end_bracket_pos == std::string::npos)
        {
            getLogger("io")->error("Invalid IPv6 address; unclosed '[' (addr='{}').", str);
            return AF_UNSPEC;
        }
        host = str.substr(1, end_bracket_pos - 1);

        if (str.size() > end_bracket_pos + 1)
        {
            const auto expected_colon_pos = end_bracket_pos + 1;
            if (str[expected_colon_pos] != ':')
            {
                getLogger("io")->error("Invalid IPv6 address; expected port suffix after ']': (addr='{}').", str);
                return AF_UNSPEC;
            }
            port_part = str.substr(end_bracket_pos + 2);
        }
    }
    else
    {
        const auto colon_pos = str.find_first_of(':');
        if (colon_pos != std::string::npos)
        {
            if (str.find_first_of(':', colon_pos + 1) != std::string::npos)
            {
                // There are at least two colons, so it must be an IPv6 address (without port).
                family = AF_INET6;
                host   = str;
            }
            else
            {
                // There is only one colon (and no brackets), so it must be an IPv4 address with a port.
                host      = str.substr(0, colon_pos);
                port_part = str.substr(colon_pos + 1);
            }
        }
        else
        {
            // There is no colon in the string, so it must be an IPv4 address (without port).
            host = str;
        }
    }

    // Parse the port if any; otherwise keep untouched (hint).
    //
    if (!port_part.empty())
    {
        char*               end_ptr    = nullptr;
        const std::uint64_t maybe_port = std::strtoull(port_part.c_str(), &end_ptr, 10);  // NOLINT(*-magic-numbers)
        if (*end_ptr != '\0')
        {
            getLogger("io")->error("Invalid port number (port='{}').", port_part);
            return AF_UNSPEC;
        }
        if (maybe_port > std::numeric_limits<std::uint16_t>::max())
        {
            getLogger("io")->error("Port number is too large (port={}).", maybe_port);
            return AF_UNSPEC;
        }
        port = static_cast<std::uint16_t>(maybe_port);
    }

    return family;
}

cetl::optional<SocketAddress::ParseResult::Success> SocketAddress::tryParseAsWildcard(const std::string&  host,
                                                                                      const std::uint16_t port)
{
    if (host != "*")
    {
        return cetl::nullopt;
    }

    SocketAddress result{};
    result.is_wildcard_    = true;
    auto& result_inet6     = result.asInet6Addr();
    result_inet6.sin6_port = htons(port);
    result.addr_len_       = sizeof(result_inet6);

    // IPv4 will be also enabled by IPV6_V6ONLY=0 (at `bind` method).
    result_inet6.sin6_family = AF_INET6;

    return result;
}

}  // namespace io
}  // namespace common
}  // namespace possync
