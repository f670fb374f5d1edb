//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef POSSYNC_COMMON_TRANSPORT_FRAME_SOCKET_HPP_INCLUDED
#define POSSYNC_COMMON_TRANSPORT_FRAME_SOCKET_HPP_INCLUDED

#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace possync
{
namespace common
{
namespace transport
{

/// Message-oriented wrapper of a (non-blocking) stream socket.
///
/// Every frame is a fixed header (signature and payload size, both in network byte order)
/// followed by the payload bytes. Incoming frames are re-assembled across partial reads.
///
class FrameSocket final
{
public:
    using Clock          = std::chrono::steady_clock;
    using PayloadHandler = std::function<void(cetl::string_view)>;

    static constexpr std::size_t MaxPayloadSize = 1ULL << 20ULL;  // 1 MB

    struct ConnectResult
    {
        using Failure = int;  // aka errno
        using Success = io::OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Connects a new TCP socket to the given address, waiting at most the given timeout.
    ///
    static ConnectResult::Var connect(const io::SocketAddress& address, const std::chrono::milliseconds timeout);

    explicit FrameSocket(io::OwnFd fd);

    FrameSocket(FrameSocket&&) noexcept            = default;
    FrameSocket& operator=(FrameSocket&&) noexcept = default;

    FrameSocket(const FrameSocket&)            = delete;
    FrameSocket& operator=(const FrameSocket&) = delete;

    ~FrameSocket() = default;

    int fd() const noexcept
    {
        return io_state_.fd.get();
    }

    /// Writes one whole frame.
    ///
    /// If the socket buffer is full, waits (at most the given timeout) for the peer to drain it.
    ///
    /// @return Zero on success; otherwise `errno` value (`ETIMEDOUT` if the peer did not drain in time).
    ///
    CETL_NODISCARD int send(const cetl::string_view payload, const std::chrono::milliseconds timeout) const;

    /// Reads whatever part of the current frame is available without blocking.
    ///
    /// The handler is called once the current frame is complete.
    ///
    /// @return Zero on success (including "no data yet"), `-1` on end of stream, otherwise `errno` value.
    ///
    CETL_NODISCARD int receiveData(const PayloadHandler& handler);

    /// Waits for one complete frame.
    ///
    /// @param deadline Time point after which `ETIMEDOUT` is returned.
    /// @param cancel Optional signal which aborts the wait with `ECANCELED`.
    /// @return Zero on success, `-1` on end of stream, otherwise `errno` value.
    ///
    CETL_NODISCARD int receiveOne(std::string&               out_payload,
                                  const Clock::time_point    deadline,
                                  const io::WakeFd* const    cancel = nullptr);

private:
    struct IoState final
    {
        struct MsgHeader final
        {
            std::uint32_t signature{0};
            std::uint32_t payload_size{0};
        };
        struct MsgPayload final
        {
            std::size_t                     size{0};
            std::unique_ptr<std::uint8_t[]> buffer;  // NOLINT(*-avoid-c-arrays)
        };
        using MsgPart = cetl::variant<MsgHeader, MsgPayload>;

        io::OwnFd   fd;
        std::size_t rx_partial_size{0};
        MsgPart     rx_msg_part{MsgHeader{}};

    };  // IoState

    CETL_NODISCARD int waitWritable(const Clock::time_point deadline) const;

    IoState   io_state_;
    LoggerPtr logger_{getLogger("transport")};

};  // FrameSocket

}  // namespace transport
}  // namespace common
}  // namespace possync

#endif  // POSSYNC_COMMON_TRANSPORT_FRAME_SOCKET_HPP_INCLUDED
