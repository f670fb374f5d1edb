//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "lan_client.hpp"

#include "common_helpers.hpp"
#include "event_helpers.hpp"
#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"
#include "protocol/lan_message_codec.hpp"
#include "transport/frame_socket.hpp"

#include "possync/platform/posix_utils.hpp"
#include "possync/sdk/event_sink.hpp"
#include "possync/sdk/lan_message.hpp"
#include "possync/sdk/lan_settings.hpp"
#include "possync/sdk/lan_types.hpp"
#include "possync/sdk/service_discovery.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <poll.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace possync
{
namespace client
{
namespace
{

using Clock = common::transport::FrameSocket::Clock;

/// Registered connection, right after a successful handshake.
///
struct Established
{
    common::transport::FrameSocket socket;
    common::io::WakeFd             stop_fd;
    sdk::Registered                registered;
};

struct EstablishResult
{
    using Success = Established;
    using Failure = sdk::Failure;
    using Var     = cetl::variant<Success, Failure>;
};

/// Connects to the server, and performs the registration exchange.
///
EstablishResult::Var establish(const sdk::LanSettings& settings,
                               const std::string&      address,
                               const sdk::DeviceType   device_type,
                               const std::string&      tenant_id,
                               common::Logger&         logger)
{
    using common::io::SocketAddress;
    using common::transport::FrameSocket;
    using DecodeResult = common::protocol::DecodeResult;

    const auto parsed = SocketAddress::parse(address, sdk::DefaultLanPort);
    if (const auto* const err = cetl::get_if<SocketAddress::ParseResult::Failure>(&parsed))
    {
        return sdk::Failure{sdk::ErrorCode::InvalidAddress,
                            fmt::format("Invalid server address '{}': {}", address, std::strerror(*err)),
                            {}};
    }
    const auto& server_address = cetl::get<SocketAddress::ParseResult::Success>(parsed);

    auto connect_result = FrameSocket::connect(server_address, settings.handshake_timeout);
    if (const auto* const err = cetl::get_if<FrameSocket::ConnectResult::Failure>(&connect_result))
    {
        return sdk::Failure{sdk::ErrorCode::ConnectFailed,
                            fmt::format("Failed to connect to {}: {}", server_address.toString(), std::strerror(*err)),
                            {}};
    }
    FrameSocket socket{std::move(cetl::get<FrameSocket::ConnectResult::Success>(connect_result))};

    auto stop_fd = common::io::WakeFd::make();
    if (!stop_fd)
    {
        return sdk::Failure{sdk::ErrorCode::ConnectFailed, "Failed to create stop signal", {}};
    }

    const auto deadline = Clock::now() + settings.handshake_timeout;

    const sdk::LanMessage reg_msg{sdk::Register{device_type, tenant_id}};
    if (const auto err = socket.send(common::protocol::encode(reg_msg), settings.handshake_timeout))
    {
        return sdk::Failure{sdk::ErrorCode::ConnectFailed,
                            fmt::format("Failed to send registration: {}", std::strerror(err)),
                            {}};
    }

    std::string payload;
    if (const auto err = socket.receiveOne(payload, deadline))
    {
        if (err == ETIMEDOUT)
        {
            return sdk::Failure{sdk::ErrorCode::HandshakeTimeout, "Registration timed out", {}};
        }
        return sdk::Failure{sdk::ErrorCode::ConnectFailed,
                            (err == -1) ? std::string{"Server closed connection during registration"}
                                        : fmt::format("Failed to receive registration reply: {}", std::strerror(err)),
                            {}};
    }

    const auto reply = common::protocol::decode(payload);
    const auto* const message = cetl::get_if<DecodeResult::Success>(&reply);
    if (const auto* const registered = (message != nullptr) ? message->tryAs<sdk::Registered>() : nullptr)
    {
        logger.debug("Registered with server (client_id='{}', server_id='{}').",
                     registered->client_id,
                     registered->server_info.server_id);
        return Established{std::move(socket), std::move(*stop_fd), *registered};
    }
    if (const auto* const error = (message != nullptr) ? message->tryAs<sdk::Error>() : nullptr)
    {
        return sdk::Failure{sdk::ErrorCode::RegistrationRejected,
                            fmt::format("{} ({})", error->message, error->code),
                            error->code};
    }
    return sdk::Failure{sdk::ErrorCode::ConnectFailed, "Unexpected reply to registration", {}};
}

}  // namespace

// MARK: - Session

/// Connection thread of a registered client.
///
class LanClient::Session final
{
public:
    Session(LanClient& owner, common::transport::FrameSocket socket, common::io::WakeFd stop_fd)
        : owner_{owner}
        , socket_{std::move(socket)}
        , stop_fd_{std::move(stop_fd)}
    {
    }

    Session(Session&&)                 = delete;
    Session(const Session&)            = delete;
    Session& operator=(Session&&)      = delete;
    Session& operator=(const Session&) = delete;

    ~Session()
    {
        stop();
        join();
    }

    void start()
    {
        thread_ = std::thread{[this] {
            //
            common::performWithoutThrowing([this] {
                //
                run();
            });
            owner_.onSessionFinished(this);
        }};
    }

    void stop() const noexcept
    {
        stop_fd_.notify();
    }

    void join()
    {
        if (thread_.joinable() && (thread_.get_id() != std::this_thread::get_id()))
        {
            thread_.join();
        }
    }

private:
    using DecodeResult = common::protocol::DecodeResult;

    void run()
    {
        const auto keepalive  = owner_.settings_.keepalive_interval;
        auto       next_ping  = Clock::now() + keepalive;

        while (true)
        {
            std::array<pollfd, 2> pfds{{{socket_.fd(), POLLIN, 0}, {stop_fd_.get(), POLLIN, 0}}};
            if (const auto err =
                    platform::pollFds(pfds.data(), pfds.size(), platform::toPollTimeout(next_ping - Clock::now())))
            {
                logger_->error("Failed to poll server connection (fd={}): {}.", socket_.fd(), std::strerror(err));
                return;
            }
            if ((pfds[1].revents & POLLIN) != 0)
            {
                logger_->debug("Closing server connection b/c of disconnect (fd={}).", socket_.fd());
                return;
            }

            if (Clock::now() >= next_ping)
            {
                logger_->trace("Sending keepalive ping (fd={}).", socket_.fd());
                if (const auto err = socket_.send(common::protocol::encode(sdk::Ping{}), owner_.settings_.write_timeout))
                {
                    logger_->warn("Failed to send keepalive ping: {}.", std::strerror(err));
                    return;
                }
                next_ping = Clock::now() + keepalive;
            }

            if (pfds[0].revents != 0)
            {
                const auto err = socket_.receiveData([this](const cetl::string_view payload) {
                    //
                    dispatch(common::protocol::decode(payload));
                });
                if (err == -1)
                {
                    logger_->info("Server closed connection (fd={}).", socket_.fd());
                    return;
                }
                if (err != 0)
                {
                    logger_->warn("Failed to read from server (fd={}): {}.", socket_.fd(), std::strerror(err));
                    return;
                }
            }
        }
    }

    void dispatch(const DecodeResult::Var& result)
    {
        const auto* const message = cetl::get_if<DecodeResult::Success>(&result);
        if (message == nullptr)
        {
            if (const auto* const unknown = cetl::get_if<DecodeResult::Unknown>(&result))
            {
                logger_->debug("Ignoring unknown '{}' message from server.", unknown->type);
                return;
            }
            logger_->warn("Ignoring malformed message from server: {}.",
                          cetl::get<DecodeResult::Failure>(result).reason);
            return;
        }

        auto& sink = *owner_.sink_;
        switch (message->type())
        {
        case sdk::LanMessage::Type::OrderCreated: {
            const auto& order_created = *message->tryAs<sdk::OrderCreated>();
            common::publishEvent(sink,
                                 *logger_,
                                 sdk::events::LanOrderCreated,
                                 {{"order", order_created.order}, {"kitchenOrder", order_created.kitchen_order}});
            break;
        }
        case sdk::LanMessage::Type::OrderStatusUpdate: {
            const auto& update = *message->tryAs<sdk::OrderStatusUpdate>();
            common::publishEvent(sink,
                                 *logger_,
                                 sdk::events::LanOrderStatusUpdate,
                                 {{"orderId", update.order_id},
                                  {"status", update.status},
                                  {"updatedAt", update.updated_at}});
            break;
        }
        case sdk::LanMessage::Type::SyncState: {
            const auto& sync_state = *message->tryAs<sdk::SyncState>();
            common::publishEvent(sink, *logger_, sdk::events::LanSyncState, {{"orders", sync_state.orders}});
            break;
        }
        case sdk::LanMessage::Type::Pong:
            logger_->trace("Keepalive pong received.");
            break;
        default:
            logger_->debug("Ignoring '{}' message from server.", toString(message->type()));
            break;
        }
    }

    LanClient&                           owner_;
    common::transport::FrameSocket       socket_;
    const common::io::WakeFd             stop_fd_;
    std::thread                          thread_;
    common::LoggerPtr                    logger_{common::getLogger("client")};

};  // Session

// MARK: - LanClient

LanClient::LanClient(sdk::LanSettings settings, sdk::ServiceDiscovery::Ptr discovery, sdk::EventSink::Ptr sink)
    : settings_{std::move(settings)}
    , discovery_{std::move(discovery)}
    , sink_{std::move(sink)}
{
    CETL_DEBUG_ASSERT(discovery_, "");
    CETL_DEBUG_ASSERT(sink_, "");
}

LanClient::~LanClient()
{
    common::performWithoutThrowing([this] {
        //
        disconnect();

        const std::lock_guard<std::mutex> lifecycle_lock{lifecycle_mutex_};
        {
            const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
            if (session_)
            {
                retired_.push_back(std::move(session_));
            }
        }
        joinRetiredSessions();
    });
}

sdk::DiscoverResult::Var LanClient::discover(const cetl::optional<std::string>&               tenant_id,
                                             const cetl::optional<std::chrono::milliseconds>& timeout) const
{
    auto browse_result = discovery_->browse(settings_.service_type, timeout.value_or(settings_.discovery_timeout));
    if (auto* const failure = cetl::get_if<sdk::ServiceDiscovery::BrowseResult::Failure>(&browse_result))
    {
        logger_->warn("Failed to browse for LAN servers: {}.", failure->message);
        return std::move(*failure);
    }
    const auto browser = std::move(cetl::get<sdk::ServiceDiscovery::BrowseResult::Success>(browse_result));

    std::vector<sdk::DiscoveredServer> servers;
    while (const auto record = browser->next())
    {
        cetl::optional<std::string> server_tenant;
        const auto                  tenant_it = record->properties.find("tenant");
        if (tenant_it != record->properties.end())
        {
            server_tenant = tenant_it->second;
        }

        if (tenant_id && (server_tenant != tenant_id))
        {
            logger_->debug("Skipping server '{}' of another tenant.", record->instance_name);
            continue;
        }
        servers.push_back(sdk::DiscoveredServer{record->instance_name, record->ip_address, record->port, server_tenant});
    }

    logger_->debug("Discovered {} LAN server(s).", servers.size());
    return servers;
}

sdk::ConnectResult::Var LanClient::connect(const std::string&    address,
                                           const sdk::DeviceType device_type,
                                           const std::string&    tenant_id)
{
    const std::lock_guard<std::mutex> lifecycle_lock{lifecycle_mutex_};
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        if (state_ != State::Disconnected)
        {
            return sdk::Failure{sdk::ErrorCode::AlreadyConnected, "Already connected to a server", {}};
        }
        state_ = State::Connecting;

        // The previous session (if any) has finished by itself.
        if (session_)
        {
            retired_.push_back(std::move(session_));
        }
    }
    joinRetiredSessions();

    logger_->info("Connecting to LAN server (address='{}', device={}).", address, toString(device_type));
    auto result = common::performWithRollback(
        [this, &address, device_type, &tenant_id] {
            //
            return establish(settings_, address, device_type, tenant_id, *logger_);
        },
        [this] {
            const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
            state_ = State::Disconnected;
        });
    if (auto* const failure = cetl::get_if<EstablishResult::Failure>(&result))
    {
        logger_->warn("Failed to connect to LAN server: {}.", failure->message);

        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        state_ = State::Disconnected;
        return std::move(*failure);
    }
    auto& established = cetl::get<EstablishResult::Success>(result);

    sdk::LanClientStatus new_status{};
    new_status.connected      = true;
    new_status.server_address = address;
    new_status.server_info    = established.registered.server_info;
    new_status.connected_at   = common::nowRfc3339();
    new_status.device_type    = device_type;
    new_status.client_id      = established.registered.client_id;

    auto session = std::make_shared<Session>(*this, std::move(established.socket), std::move(established.stop_fd));
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        status_  = new_status;
        session_ = session;
        state_   = State::Connected;
    }

    logger_->info("Connected to LAN server (address='{}', client_id='{}').", address, *new_status.client_id);
    common::publishEvent(*sink_, *logger_, sdk::events::LanConnected, new_status);

    // Started only after `lan_connected`, so that `lan_disconnected` always follows it.
    session->start();
    return new_status;
}

void LanClient::disconnect()
{
    const std::lock_guard<std::mutex> lifecycle_lock{lifecycle_mutex_};

    std::shared_ptr<Session> session;
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        if (state_ == State::Disconnected)
        {
            return;
        }
        state_  = State::Disconnected;
        status_ = sdk::LanClientStatus{};
        session = std::move(session_);
    }

    if (session)
    {
        logger_->info("Disconnecting from LAN server.");
        session->stop();
        retired_.push_back(std::move(session));
    }
}

sdk::LanClientStatus LanClient::status() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    return status_;
}

LanClient::State LanClient::state() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    return state_;
}

void LanClient::joinRetiredSessions()
{
    for (const auto& session : retired_)
    {
        session->join();
    }
    retired_.clear();
}

void LanClient::onSessionFinished(const Session* const session)
{
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        if ((session_.get() == session) && (state_ == State::Connected))
        {
            state_  = State::Disconnected;
            status_ = sdk::LanClientStatus{};
        }
    }

    logger_->info("Disconnected from LAN server.");
    common::publishEvent(*sink_, *logger_, sdk::events::LanDisconnected, nullptr);
}

const char* toString(const LanClient::State state) noexcept
{
    switch (state)
    {
    case LanClient::State::Disconnected:
        return "disconnected";
    case LanClient::State::Connecting:
        return "connecting";
    case LanClient::State::Connected:
        return "connected";
    }
    return "?";
}

}  // namespace client
}  // namespace possync
