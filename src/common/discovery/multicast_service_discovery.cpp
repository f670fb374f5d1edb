//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "multicast_service_discovery.hpp"

#include "discovery_datagram.hpp"
#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"
#include "possync/platform/posix_utils.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <poll.h>
#include <set>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace possync
{
namespace common
{
namespace discovery
{
namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::size_t MaxDatagramSize = 65536;  // NOLINT(*-magic-numbers)

struct ReceivedDatagram
{
    DiscoveryDatagram datagram;
    std::string       source_ip;
    io::SocketAddress source;
};

sdk::Failure makeFailure(const std::string& what, const int err)
{
    return sdk::Failure{sdk::ErrorCode::DiscoveryFailed, what + ": " + std::strerror(err), {}};
}

io::SocketAddress::SocketResult::Var makeUdpSocket(const std::uint16_t port, const bool is_reusable)
{
    using ParseResult = io::SocketAddress::ParseResult;

    auto maybe_any = io::SocketAddress::parse("0.0.0.0", port);
    if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_any))
    {
        return *err;
    }
    const auto any_address = cetl::get<ParseResult::Success>(maybe_any);

    auto maybe_fd = any_address.socket(SOCK_DGRAM);
    if (const auto* const err = cetl::get_if<io::SocketAddress::SocketResult::Failure>(&maybe_fd))
    {
        return *err;
    }
    auto fd = cetl::get<io::SocketAddress::SocketResult::Success>(std::move(maybe_fd));

    // Several responders (f.e. of different tenants) may share the same host and group port.
    if (is_reusable)
    {
        if (const auto err = io::SocketAddress::enableReuseAddress(fd))
        {
            return err;
        }
    }
    if (const auto err = any_address.bind(fd))
    {
        return err;
    }
    return fd;
}

void configureMulticastSending(const io::OwnFd& fd, const int ttl, Logger& logger)
{
    if (const auto err = platform::posixSyscallError([&fd, ttl] {
            //
            return ::setsockopt(fd.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
        }))
    {
        logger.warn("Failed to set IP_MULTICAST_TTL={} (fd={}): {}.", ttl, fd.get(), std::strerror(err));
    }

    // Let browsers on the same host see our datagrams too.
    if (const auto err = platform::posixSyscallError([&fd] {
            //
            const int enable = 1;
            return ::setsockopt(fd.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &enable, sizeof(enable));
        }))
    {
        logger.warn("Failed to set IP_MULTICAST_LOOP (fd={}): {}.", fd.get(), std::strerror(err));
    }
}

void joinGroup(const io::OwnFd& fd, const io::SocketAddress& group_address, Logger& logger)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto* const group_in = reinterpret_cast<const sockaddr_in*>(group_address.getRaw().first);

    ip_mreq mreq{};
    mreq.imr_multiaddr        = group_in->sin_addr;
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (const auto err = platform::posixSyscallError([&fd, &mreq] {
            //
            return ::setsockopt(fd.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq));
        }))
    {
        // Not fatal: unicast replies to queries still work, and the host may get a route later.
        logger.warn("Failed to join multicast group '{}' (fd={}): {}.",
                    group_address.toString(),
                    fd.get(),
                    std::strerror(err));
    }
}

void sendDatagram(const io::OwnFd& fd, const DiscoveryDatagram& datagram, const io::SocketAddress& to, Logger& logger)
{
    const auto payload = datagram.encode();
    const auto raw_to  = to.getRaw();
    if (const auto err = platform::posixSyscallError([&fd, &payload, &raw_to] {
            //
            return ::sendto(fd.get(), payload.data(), payload.size(), MSG_DONTWAIT, raw_to.first, raw_to.second);
        }))
    {
        // Best effort - f.e. there might be no route to the multicast group on an isolated host.
        logger.warn("Failed to send discovery datagram to '{}' (fd={}): {}.", to.toString(), fd.get(), std::strerror(err));
        return;
    }
    logger.trace("Sent discovery datagram to '{}': {}", to.toString(), payload);
}

cetl::optional<ReceivedDatagram> receiveDatagram(const io::OwnFd& fd, Logger& logger)
{
    std::array<char, MaxDatagramSize> buffer{};
    sockaddr_storage                  source_storage{};
    socklen_t                         source_len = sizeof(source_storage);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto* const source_raw = reinterpret_cast<sockaddr*>(&source_storage);

    ssize_t bytes_read = 0;
    if (const auto err = platform::posixSyscallError([&] {
            //
            return bytes_read = ::recvfrom(fd.get(), buffer.data(), buffer.size(), MSG_DONTWAIT, source_raw, &source_len);
        }))
    {
        if ((err != EAGAIN) && (err != EWOULDBLOCK))
        {
            logger.debug("Failed to receive discovery datagram (fd={}): {}.", fd.get(), std::strerror(err));
        }
        return cetl::nullopt;
    }

    const auto maybe_source = io::SocketAddress::fromRaw(source_raw, source_len);
    if (!maybe_source)
    {
        return cetl::nullopt;
    }
    auto maybe_datagram = DiscoveryDatagram::parse(cetl::string_view{buffer.data(), static_cast<std::size_t>(bytes_read)});
    if (!maybe_datagram)
    {
        return cetl::nullopt;
    }
    return ReceivedDatagram{std::move(maybe_datagram.value()), maybe_source->getHost(), maybe_source.value()};
}

}  // namespace

// MARK: - Responder:

/// Answers queries on behalf of a registered service until it is unregistered.
///
class MulticastServiceDiscovery::ResponderImpl final : public Registration
{
public:
    ResponderImpl(sdk::ServiceRecord       record,
                  io::OwnFd                socket_fd,
                  io::WakeFd               stop_fd,
                  const io::SocketAddress& group_address,
                  LoggerPtr                logger)
        : record_{std::move(record)}
        , socket_fd_{std::move(socket_fd)}
        , stop_fd_{std::move(stop_fd)}
        , group_address_{group_address}
        , logger_{std::move(logger)}
        , is_active_{true}
    {
        // Unsolicited announcement, so that already browsing peers see us right away.
        sendDatagram(socket_fd_, DiscoveryDatagram::announce(record_), group_address_, *logger_);

        thread_ = std::thread([this] {
            //
            run();
        });
    }

    ResponderImpl(ResponderImpl&&)                 = delete;
    ResponderImpl(const ResponderImpl&)            = delete;
    ResponderImpl& operator=(ResponderImpl&&)      = delete;
    ResponderImpl& operator=(const ResponderImpl&) = delete;

    ~ResponderImpl() override
    {
        unregister();
    }

    // Registration

    void unregister() override
    {
        if (!is_active_.exchange(false))
        {
            return;
        }

        logger_->debug("Unregistering service '{}'.", record_.instance_name);
        sendDatagram(socket_fd_, DiscoveryDatagram::goodbye(record_), group_address_, *logger_);

        stop_fd_.notify();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    bool isActive() const override
    {
        return is_active_;
    }

private:
    void run()
    {
        logger_->debug("Responder of '{}' is running (fd={}).", record_.instance_name, socket_fd_.get());

        while (true)
        {
            std::array<pollfd, 2> pfds{{{socket_fd_.get(), POLLIN, 0}, {stop_fd_.get(), POLLIN, 0}}};
            if (const auto err = platform::pollFds(pfds.data(), pfds.size(), -1))
            {
                logger_->error("Responder poll failed (fd={}): {}.", socket_fd_.get(), std::strerror(err));
                break;
            }
            if ((pfds[1].revents & POLLIN) != 0)
            {
                break;
            }
            if (pfds[0].revents == 0)
            {
                continue;
            }

            const auto received = receiveDatagram(socket_fd_, *logger_);
            if (!received || (received->datagram.op != DiscoveryDatagram::Op::Query) ||
                (received->datagram.record.service_type != record_.service_type))
            {
                continue;
            }

            logger_->debug("Answering query of '{}'.", received->source.toString());
            sendDatagram(socket_fd_, DiscoveryDatagram::announce(record_), received->source, *logger_);
        }

        logger_->debug("Responder of '{}' is stopped.", record_.instance_name);
    }

    const sdk::ServiceRecord record_;
    const io::OwnFd          socket_fd_;
    const io::WakeFd         stop_fd_;
    const io::SocketAddress  group_address_;
    const LoggerPtr          logger_;
    std::atomic<bool>        is_active_;
    std::thread              thread_;

};  // ResponderImpl

// MARK: - Browser:

class MulticastServiceDiscovery::BrowserImpl final : public Browser
{
public:
    BrowserImpl(std::string                     service_type,
                const std::chrono::milliseconds timeout,
                io::OwnFd                       socket_fd,
                const io::SocketAddress&        group_address,
                LoggerPtr                       logger)
        : service_type_{std::move(service_type)}
        , timeout_{timeout}
        , socket_fd_{std::move(socket_fd)}
        , group_address_{group_address}
        , logger_{std::move(logger)}
    {
        restart();
    }

    BrowserImpl(BrowserImpl&&)                 = delete;
    BrowserImpl(const BrowserImpl&)            = delete;
    BrowserImpl& operator=(BrowserImpl&&)      = delete;
    BrowserImpl& operator=(const BrowserImpl&) = delete;

    ~BrowserImpl() override = default;

    // Browser

    cetl::optional<sdk::ServiceRecord> next() override
    {
        while (true)
        {
            const auto now = Clock::now();
            if (now >= deadline_)
            {
                return cetl::nullopt;
            }

            pollfd pfd{socket_fd_.get(), POLLIN, 0};
            if (const auto err = platform::pollFds(&pfd, 1, platform::toPollTimeout(deadline_ - now)))
            {
                logger_->warn("Browser poll failed (fd={}): {}.", socket_fd_.get(), std::strerror(err));
                deadline_ = now;
                return cetl::nullopt;
            }
            if ((pfd.revents & POLLIN) == 0)
            {
                continue;
            }

            auto received = receiveDatagram(socket_fd_, *logger_);
            if (!received || (received->datagram.op != DiscoveryDatagram::Op::Announce) ||
                (received->datagram.record.service_type != service_type_))
            {
                continue;
            }

            auto& record = received->datagram.record;
            if (!seen_names_.insert(record.instance_name).second)
            {
                continue;
            }
            if (record.ip_address.empty())
            {
                record.ip_address = received->source_ip;
            }

            logger_->debug("Resolved '{}' at {}:{}.", record.instance_name, record.ip_address, record.port);
            return std::move(record);
        }
    }

    void restart() override
    {
        seen_names_.clear();
        deadline_ = Clock::now() + timeout_;
        sendDatagram(socket_fd_, DiscoveryDatagram::query(service_type_), group_address_, *logger_);
    }

private:
    const std::string               service_type_;
    const std::chrono::milliseconds timeout_;
    const io::OwnFd                 socket_fd_;
    const io::SocketAddress         group_address_;
    const LoggerPtr                 logger_;
    Clock::time_point               deadline_;
    std::set<std::string>           seen_names_;

};  // BrowserImpl

// MARK: - MulticastServiceDiscovery:

sdk::ServiceDiscovery::Ptr MulticastServiceDiscovery::make(const sdk::DiscoverySettings& settings)
{
    using ParseResult = io::SocketAddress::ParseResult;

    auto maybe_group = io::SocketAddress::parse(settings.group, settings.port);
    if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_group))
    {
        getLogger("discovery")->error("Invalid multicast group '{}': {}.", settings.group, std::strerror(*err));
        return nullptr;
    }
    const auto group_address = cetl::get<ParseResult::Success>(maybe_group);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto* const group_in = reinterpret_cast<const sockaddr_in*>(group_address.getRaw().first);
    if ((group_in->sin_family != AF_INET) || !IN_MULTICAST(ntohl(group_in->sin_addr.s_addr)))
    {
        getLogger("discovery")->error("Not an IPv4 multicast group '{}'.", settings.group);
        return nullptr;
    }

    return std::make_shared<MulticastServiceDiscovery>(settings, group_address);
}

MulticastServiceDiscovery::MulticastServiceDiscovery(const sdk::DiscoverySettings& settings,
                                                     const io::SocketAddress&      group_address)
    : settings_{settings}
    , group_address_{group_address}
{
}

MulticastServiceDiscovery::RegisterResult::Var MulticastServiceDiscovery::registerService(
    const sdk::ServiceRecord& record)
{
    logger_->info("Registering service '{}' (type='{}', port={}).",
                  record.instance_name,
                  record.service_type,
                  record.port);

    auto maybe_fd = makeUdpSocket(settings_.port, true);
    if (const auto* const err = cetl::get_if<io::SocketAddress::SocketResult::Failure>(&maybe_fd))
    {
        logger_->error("Failed to create responder socket: {}.", std::strerror(*err));
        return makeFailure("Failed to create responder socket", *err);
    }
    auto socket_fd = cetl::get<io::SocketAddress::SocketResult::Success>(std::move(maybe_fd));

    auto maybe_stop_fd = io::WakeFd::make();
    if (!maybe_stop_fd)
    {
        return makeFailure("Failed to create responder stop signal", EMFILE);
    }

    configureMulticastSending(socket_fd, settings_.ttl, *logger_);
    joinGroup(socket_fd, group_address_, *logger_);

    Registration::Ptr registration = std::make_unique<ResponderImpl>(record,
                                                                     std::move(socket_fd),
                                                                     std::move(maybe_stop_fd.value()),
                                                                     group_address_,
                                                                     logger_);
    return std::move(registration);  // NOLINT(*-redundant-move)
}

MulticastServiceDiscovery::BrowseResult::Var MulticastServiceDiscovery::browse(const std::string& service_type,
                                                                               const std::chrono::milliseconds timeout)
{
    logger_->debug("Browsing for '{}' (timeout={}ms).", service_type, timeout.count());

    // Ephemeral port - responders reply to it directly.
    auto maybe_fd = makeUdpSocket(0, false);
    if (const auto* const err = cetl::get_if<io::SocketAddress::SocketResult::Failure>(&maybe_fd))
    {
        logger_->error("Failed to create browser socket: {}.", std::strerror(*err));
        return makeFailure("Failed to create browser socket", *err);
    }
    auto socket_fd = cetl::get<io::SocketAddress::SocketResult::Success>(std::move(maybe_fd));
    configureMulticastSending(socket_fd, settings_.ttl, *logger_);

    Browser::Ptr browser =
        std::make_unique<BrowserImpl>(service_type, timeout, std::move(socket_fd), group_address_, logger_);
    return std::move(browser);  // NOLINT(*-redundant-move)
}

}  // namespace discovery
}  // namespace common
}  // namespace possync
