//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "frame_socket.hpp"

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"
#include "possync/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <utility>

namespace possync
{
namespace common
{
namespace transport
{
namespace
{

constexpr std::uint32_t MsgHeaderSignature = 0x534E414C;  // 'LANS'

}  // namespace

constexpr std::size_t FrameSocket::MaxPayloadSize;

FrameSocket::ConnectResult::Var FrameSocket::connect(const io::SocketAddress&        address,
                                                     const std::chrono::milliseconds timeout)
{
    auto logger = getLogger("transport");

    auto maybe_fd = address.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<io::SocketAddress::SocketResult::Failure>(&maybe_fd))
    {
        return *err;
    }
    auto fd = cetl::get<io::SocketAddress::SocketResult::Success>(std::move(maybe_fd));

    if (const auto err = address.connect(fd))
    {
        return err;
    }

    // The socket is non-blocking, so the connect is most likely still in progress.
    //
    pollfd pfd{fd.get(), POLLOUT, 0};
    if (const auto err = platform::pollFds(&pfd, 1, platform::toPollTimeout(timeout)))
    {
        logger->error("Failed to await connection (fd={}): {}.", fd.get(), std::strerror(err));
        return err;
    }
    if (pfd.revents == 0)
    {
        logger->warn("Connection timed out (addr='{}').", address.toString());
        return ETIMEDOUT;
    }

    int       so_error     = 0;
    socklen_t so_error_len = sizeof(so_error);
    if (const auto err = platform::posixSyscallError([&fd, &so_error, &so_error_len] {
            //
            return ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &so_error_len);
        }))
    {
        logger->error("Failed to get socket error (fd={}): {}.", fd.get(), std::strerror(err));
        return err;
    }
    if (so_error != 0)
    {
        logger->warn("Failed to connect (addr='{}'): {}.", address.toString(), std::strerror(so_error));
        return so_error;
    }

    logger->debug("Connected (addr='{}', fd={}).", address.toString(), fd.get());
    return fd;
}

FrameSocket::FrameSocket(io::OwnFd fd)
{
    io_state_.fd = std::move(fd);
}

int FrameSocket::send(const cetl::string_view payload, const std::chrono::milliseconds timeout) const
{
    if (payload.empty() || (payload.size() > MaxPayloadSize))
    {
        logger_->error("Invalid msg payload size (fd={}, size={}).", fd(), payload.size());
        return EINVAL;
    }

    const IoState::MsgHeader msg_header{htonl(MsgHeaderSignature), htonl(static_cast<std::uint32_t>(payload.size()))};

    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    const std::array<iovec, 2> fragments{{
        {const_cast<IoState::MsgHeader*>(&msg_header), sizeof(msg_header)},
        {const_cast<char*>(payload.data()), payload.size()},
    }};
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    const std::size_t total_size = sizeof(msg_header) + payload.size();
    const auto        deadline   = Clock::now() + timeout;

    std::size_t sent_size = 0;
    while (sent_size < total_size)
    {
        // Skip fragments (or their parts) which were already sent.
        //
        std::array<iovec, 2> pending{};
        std::size_t          pending_count = 0;
        std::size_t          skip          = sent_size;
        for (const auto& fragment : fragments)
        {
            if (skip >= fragment.iov_len)
            {
                skip -= fragment.iov_len;
                continue;
            }
            // NOLINTNEXTLINE(*-pointer-arithmetic)
            pending[pending_count++] = {static_cast<std::uint8_t*>(fragment.iov_base) + skip, fragment.iov_len - skip};
            skip                     = 0;
        }

        msghdr msg{};
        msg.msg_iov    = pending.data();
        msg.msg_iovlen = pending_count;

        ssize_t bytes_sent = 0;
        const int err      = platform::posixSyscallError([this, &msg, &bytes_sent] {
            //
            return bytes_sent = ::sendmsg(fd(), &msg, MSG_DONTWAIT | MSG_NOSIGNAL);
        });
        if (err == 0)
        {
            sent_size += static_cast<std::size_t>(bytes_sent);
            continue;
        }
        if ((err != EAGAIN) && (err != EWOULDBLOCK))
        {
            logger_->warn("Failed to send msg (fd={}): {}.", fd(), std::strerror(err));
            return err;
        }

        // Socket buffer is full - wait until the peer drains it a bit.
        logger_->trace("Msg send would block (fd={}, sent={}/{}).", fd(), sent_size, total_size);
        if (const auto wait_err = waitWritable(deadline))
        {
            return wait_err;
        }
    }
    return 0;
}

int FrameSocket::waitWritable(const Clock::time_point deadline) const
{
    pollfd pfd{fd(), POLLOUT, 0};
    if (const auto err = platform::pollFds(&pfd, 1, platform::toPollTimeout(deadline - Clock::now())))
    {
        logger_->error("Failed to await writable socket (fd={}): {}.", fd(), std::strerror(err));
        return err;
    }
    if (pfd.revents == 0)
    {
        logger_->warn("Peer does not drain its socket - giving up (fd={}).", fd());
        return ETIMEDOUT;
    }
    // Any error condition will be reported by the next `sendmsg`.
    return 0;
}

int FrameSocket::receiveData(const PayloadHandler& handler)
{
    auto& io_state = io_state_;

    // 1. Receive and validate the message header.
    //
    if (auto* const msg_header_ptr = cetl::get_if<IoState::MsgHeader>(&io_state.rx_msg_part))
    {
        auto& msg_header = *msg_header_ptr;

        CETL_DEBUG_ASSERT(io_state.rx_partial_size < sizeof(msg_header), "");
        if (io_state.rx_partial_size < sizeof(msg_header))
        {
            // Try read remaining part of the message header.
            //
            ssize_t bytes_read = 0;
            if (const auto err = platform::posixSyscallError([&io_state, &bytes_read, &msg_header] {
                    //
                    // No lint b/c of low-level (potentially partial) reading.
                    // NOLINTNEXTLINE(*-reinterpret-cast, *-pointer-arithmetic)
                    auto* const dst_buf = reinterpret_cast<std::uint8_t*>(&msg_header) + io_state.rx_partial_size;
                    //
                    const auto bytes_to_read = sizeof(msg_header) - io_state.rx_partial_size;
                    return bytes_read        = ::recv(io_state.fd.get(), dst_buf, bytes_to_read, MSG_DONTWAIT);
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    // No data available yet - that's ok, the next attempt will try to read again.
                    //
                    logger_->trace("Msg header read would block (fd={}).", io_state.fd.get());
                    return 0;
                }
                logger_->warn("Failed to read msg header (fd={}): {}.", io_state.fd.get(), std::strerror(err));
                return err;
            }

            // Progress the partial read state.
            //
            io_state.rx_partial_size += bytes_read;
            CETL_DEBUG_ASSERT(io_state.rx_partial_size <= sizeof(msg_header), "");
            if (bytes_read == 0)
            {
                logger_->debug("Zero bytes of msg header read - end of stream (fd={}).", io_state.fd.get());
                return -1;  // EOF
            }
            if (io_state.rx_partial_size < sizeof(msg_header))
            {
                // Not enough data yet - that's ok, the next attempt will try to read the rest.
                return 0;
            }

            // Validate the message header.
            // Zero payload size is also considered invalid (b/c every frame carries a JSON object).
            //
            msg_header.signature    = ntohl(msg_header.signature);
            msg_header.payload_size = ntohl(msg_header.payload_size);
            if ((msg_header.signature != MsgHeaderSignature)  //
                || (msg_header.payload_size == 0) || (msg_header.payload_size > MaxPayloadSize))
            {
                logger_->error("Invalid msg header read - closing invalid stream (fd={}, payload_size={}).",
                               io_state.fd.get(),
                               msg_header.payload_size);
                return EINVAL;
            }
        }

        // Message header has been read and validated.
        // Switch to the next part - message payload.
        //
        io_state.rx_partial_size = 0;
        auto payload_buffer = std::make_unique<std::uint8_t[]>(msg_header.payload_size);  // NOLINT(*-avoid-c-arrays)
        io_state.rx_msg_part.emplace<IoState::MsgPayload>(
            IoState::MsgPayload{msg_header.payload_size, std::move(payload_buffer)});
    }

    // 2. Read message payload.
    //
    if (auto* const msg_payload_ptr = cetl::get_if<IoState::MsgPayload>(&io_state.rx_msg_part))
    {
        auto& msg_payload = *msg_payload_ptr;

        CETL_DEBUG_ASSERT(io_state.rx_partial_size < msg_payload.size, "");
        if (io_state.rx_partial_size < msg_payload.size)
        {
            ssize_t bytes_read = 0;
            if (const auto err = platform::posixSyscallError([&io_state, &bytes_read, &msg_payload] {
                    //
                    // NOLINTNEXTLINE(*-pointer-arithmetic)
                    std::uint8_t* const dst_buf = msg_payload.buffer.get() + io_state.rx_partial_size;
                    //
                    const auto bytes_to_read = msg_payload.size - io_state.rx_partial_size;
                    return bytes_read        = ::recv(io_state.fd.get(), dst_buf, bytes_to_read, MSG_DONTWAIT);
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    // No data available yet - that's ok, the next attempt will try to read again.
                    //
                    logger_->trace("Msg payload read would block (fd={}).", io_state.fd.get());
                    return 0;
                }
                logger_->warn("Failed to read msg payload (fd={}): {}.", io_state.fd.get(), std::strerror(err));
                return err;
            }

            // Progress the partial read state.
            //
            io_state.rx_partial_size += bytes_read;
            CETL_DEBUG_ASSERT(io_state.rx_partial_size <= msg_payload.size, "");
            if (bytes_read == 0)
            {
                logger_->debug("Zero bytes of msg payload read - end of stream (fd={}).", io_state.fd.get());
                return -1;  // EOF
            }
            if (io_state.rx_partial_size < msg_payload.size)
            {
                // Not enough data yet - that's ok, the next attempt will try to read the rest.
                return 0;
            }
        }

        // Message payload has been completely received.
        // Switch to the first part - the message header again.
        //
        io_state.rx_partial_size = 0;
        const auto payload       = std::move(msg_payload);
        io_state.rx_msg_part.emplace<IoState::MsgHeader>();

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        handler(cetl::string_view{reinterpret_cast<const char*>(payload.buffer.get()), payload.size});
    }

    return 0;
}

int FrameSocket::receiveOne(std::string& out_payload, const Clock::time_point deadline, const io::WakeFd* const cancel)
{
    bool is_received = false;
    while (!is_received)
    {
        std::array<pollfd, 2> pfds{{{fd(), POLLIN, 0}, {(cancel != nullptr) ? cancel->get() : -1, POLLIN, 0}}};
        if (const auto err = platform::pollFds(pfds.data(), pfds.size(), platform::toPollTimeout(deadline - Clock::now())))
        {
            logger_->error("Failed to await msg (fd={}): {}.", fd(), std::strerror(err));
            return err;
        }
        if ((pfds[1].revents & POLLIN) != 0)
        {
            return ECANCELED;
        }
        if (pfds[0].revents == 0)
        {
            return ETIMEDOUT;
        }

        if (const auto err = receiveData([&out_payload, &is_received](const auto payload) {
                //
                out_payload.assign(payload.data(), payload.size());
                is_received = true;
            }))
        {
            return err;
        }
    }
    return 0;
}

}  // namespace transport
}  // namespace common
}  // namespace possync
