//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "lan_server.hpp"

#include "broadcast_bus.hpp"
#include "common_helpers.hpp"
#include "connection_registry.hpp"
#include "event_helpers.hpp"
#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "logging.hpp"
#include "protocol/lan_message_codec.hpp"
#include "registration_handshake.hpp"
#include "transport/frame_socket.hpp"
#include "transport/outbox.hpp"

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
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace possync
{
namespace server
{
namespace
{

constexpr int ListenBacklog = 16;

// Number of leading tenant characters in the advertised instance name.
constexpr std::size_t InstanceTenantChars = 8;

std::string getLocalHostName()
{
    std::array<char, 256> name{};  // NOLINT(*-magic-numbers)
    if ((::gethostname(name.data(), name.size() - 1) != 0) || (name.front() == '\0'))
    {
        return "localhost.local.";
    }
    return std::string{name.data()} + ".local.";
}

}  // namespace

/// State shared by the accept loop and all connection threads of a single server run.
///
struct LanServer::Context final
{
    Context(const sdk::LanSettings& settings_in,
            std::string             tenant_id_in,
            std::string             server_id_in,
            sdk::EventSink::Ptr     sink_in,
            common::io::WakeFd      stop_fd_in)
        : settings{settings_in}
        , tenant_id{std::move(tenant_id_in)}
        , server_id{std::move(server_id_in)}
        , sink{std::move(sink_in)}
        , stop_fd{std::move(stop_fd_in)}
    {
    }

    const sdk::LanSettings    settings;
    const std::string         tenant_id;
    const std::string         server_id;
    const sdk::EventSink::Ptr sink;

    /// Once notified, stays so - every loop of this run observes it.
    const common::io::WakeFd stop_fd;

    ConnectionRegistry registry;
    BroadcastBus       bus;
    common::LoggerPtr  logger{common::getLogger("server")};

};  // Context

// MARK: - Session

/// Serves a single accepted connection: registration handshake first, then the message loop.
///
class LanServer::Session final
{
public:
    Session(std::shared_ptr<Context> context, common::io::OwnFd fd, const common::io::SocketAddress& peer)
        : context_{std::move(context)}
        , socket_{std::move(fd)}
        , peer_ip_{peer.getHost()}
        , logger_{context_->logger}
    {
    }

    void run()
    {
        const auto session = handshake();
        if (!session)
        {
            return;
        }
        const auto& client_id = session->info().client_id;

        serve(*session->outbox());

        context_->bus.unsubscribe(client_id);
        if (!context_->registry.remove(client_id))
        {
            logger_->debug("Client '{}' was already removed from registry.", client_id);
        }
        logger_->info("Client disconnected (id='{}', peer={}).", client_id, peer_ip_);
        common::publishEvent(*context_->sink, *logger_, sdk::events::LanClientDisconnected, client_id);
    }

private:
    using DecodeResult = common::protocol::DecodeResult;

    ClientSession::Ptr handshake()
    {
        const auto& settings = context_->settings;

        std::string payload;
        const auto  deadline = common::transport::FrameSocket::Clock::now() + settings.handshake_timeout;
        if (const auto err = socket_.receiveOne(payload, deadline, &context_->stop_fd))
        {
            switch (err)
            {
            case ETIMEDOUT:
                logger_->info("Client has not registered in time - closing (peer={}).", peer_ip_);
                break;
            case ECANCELED:
                logger_->debug("Registration aborted by server stop (peer={}).", peer_ip_);
                break;
            case -1:
                logger_->debug("Client closed connection before registration (peer={}).", peer_ip_);
                break;
            default:
                logger_->warn("Failed to receive registration (peer={}): {}.", peer_ip_, std::strerror(err));
                break;
            }
            return nullptr;
        }

        const auto decision = RegistrationHandshake::evaluate(common::protocol::decode(payload), context_->tenant_id);
        if (const auto* const reject = cetl::get_if<RegistrationHandshake::Reject>(&decision))
        {
            logger_->warn("Rejecting client (peer={}): {}.", peer_ip_, reject->reply.message);
            // Connection is closed right after the reply, whether it was delivered or not.
            sendMessage(reject->reply);
            return nullptr;
        }
        const auto device_type = cetl::get<RegistrationHandshake::Admit>(decision).device_type;

        auto outbox = common::transport::Outbox::make(settings.outbox_capacity);
        if (!outbox)
        {
            logger_->error("Failed to create outbox for client (peer={}).", peer_ip_);
            return nullptr;
        }

        auto client_id = common::makeUuid();
        if (!sendMessage(RegistrationHandshake::makeRegistered(client_id,
                                                               context_->server_id,
                                                               context_->tenant_id,
                                                               context_->registry.size())))
        {
            return nullptr;
        }

        const auto session = std::make_shared<const ClientSession>(  //
            sdk::ClientInfo{client_id, device_type, common::nowRfc3339(), peer_ip_},
            outbox);
        if (!context_->registry.insert(session))
        {
            logger_->error("Duplicate client id '{}' - closing (peer={}).", client_id, peer_ip_);
            return nullptr;
        }
        context_->bus.subscribe(client_id, std::move(outbox));

        logger_->info("Client registered (id='{}', device={}, peer={}).", client_id, toString(device_type), peer_ip_);
        common::publishEvent(*context_->sink, *logger_, sdk::events::LanClientConnected, session->info());
        return session;
    }

    void serve(common::transport::Outbox& outbox)
    {
        while (true)
        {
            std::array<pollfd, 3> pfds{{
                {socket_.fd(), POLLIN, 0},
                {outbox.wakeFd(), POLLIN, 0},
                {context_->stop_fd.get(), POLLIN, 0},
            }};
            if (const auto err = platform::pollFds(pfds.data(), pfds.size(), -1))
            {
                logger_->error("Failed to poll client connection (peer={}): {}.", peer_ip_, std::strerror(err));
                return;
            }

            if ((pfds[2].revents & POLLIN) != 0)
            {
                logger_->debug("Closing client connection b/c of server stop (peer={}).", peer_ip_);
                return;
            }
            if (((pfds[1].revents & POLLIN) != 0) && !flushOutbox(outbox))
            {
                return;
            }
            if ((pfds[0].revents != 0) && !receiveFromClient())
            {
                return;
            }
        }
    }

    bool flushOutbox(common::transport::Outbox& outbox)
    {
        for (const auto& frame : outbox.takeAll())
        {
            if (const auto err = socket_.send(*frame, context_->settings.write_timeout))
            {
                logger_->warn("Failed to write to client (peer={}): {}.", peer_ip_, std::strerror(err));
                return false;
            }
        }
        return true;
    }

    bool receiveFromClient()
    {
        bool keep_going = true;

        const auto err = socket_.receiveData([this, &keep_going](const cetl::string_view payload) {
            //
            const auto result = common::protocol::decode(payload);
            if (const auto* const message = cetl::get_if<DecodeResult::Success>(&result))
            {
                if (message->type() == sdk::LanMessage::Type::Ping)
                {
                    keep_going = sendMessage(sdk::Pong{});
                    return;
                }
                logger_->debug("Ignoring '{}' message from client (peer={}).", toString(message->type()), peer_ip_);
            }
            else if (const auto* const unknown = cetl::get_if<DecodeResult::Unknown>(&result))
            {
                logger_->debug("Ignoring unknown '{}' message from client (peer={}).", unknown->type, peer_ip_);
            }
            else
            {
                logger_->warn("Ignoring malformed message from client (peer={}): {}.",
                              peer_ip_,
                              cetl::get<DecodeResult::Failure>(result).reason);
            }
        });
        if (err == -1)
        {
            logger_->debug("Client closed connection (peer={}).", peer_ip_);
            return false;
        }
        if (err != 0)
        {
            logger_->warn("Failed to read from client (peer={}): {}.", peer_ip_, std::strerror(err));
            return false;
        }
        return keep_going;
    }

    bool sendMessage(const sdk::LanMessage& message)
    {
        if (const auto err = socket_.send(common::protocol::encode(message), context_->settings.write_timeout))
        {
            logger_->warn("Failed to send '{}' message to client (peer={}): {}.",
                          toString(message.type()),
                          peer_ip_,
                          std::strerror(err));
            return false;
        }
        return true;
    }

    const std::shared_ptr<Context>    context_;
    common::transport::FrameSocket    socket_;
    const std::string                 peer_ip_;
    const common::LoggerPtr           logger_;

};  // Session

// MARK: - Instance

/// Everything which lives from a successful `start` till the matching `stop`.
///
class LanServer::Instance final
{
public:
    struct MakeResult
    {
        using Success = std::unique_ptr<Instance>;
        using Failure = sdk::Failure;
        using Var     = cetl::variant<Success, Failure>;
    };
    static MakeResult::Var make(const sdk::LanSettings&  settings,
                                sdk::ServiceDiscovery&   discovery,
                                const sdk::EventSink::Ptr& sink,
                                const std::string&       tenant_id);

    Instance(std::shared_ptr<Context>                 context,
             common::io::OwnFd                        listen_fd,
             sdk::ServiceDiscovery::Registration::Ptr advertisement,
             std::string                              ip_address,
             const std::uint16_t                      port)
        : context_{std::move(context)}
        , listen_fd_{std::move(listen_fd)}
        , advertisement_{std::move(advertisement)}
        , ip_address_{std::move(ip_address)}
        , port_{port}
        , started_at_{common::nowRfc3339()}
    {
    }

    Instance(Instance&&)                 = delete;
    Instance(const Instance&)            = delete;
    Instance& operator=(Instance&&)      = delete;
    Instance& operator=(const Instance&) = delete;

    ~Instance()
    {
        shutdown();
    }

    Context& context() const noexcept
    {
        return *context_;
    }

    const std::string& ipAddress() const noexcept
    {
        return ip_address_;
    }

    std::uint16_t port() const noexcept
    {
        return port_;
    }

    const std::string& startedAt() const noexcept
    {
        return started_at_;
    }

    bool isAdvertised() const
    {
        return advertisement_ && advertisement_->isActive();
    }

    void startAccepting()
    {
        accept_thread_ = std::thread{[this] {
            //
            runAcceptLoop();
        }};
    }

    /// Withdraws the advertisement, signals all loops to stop, and waits for them. Idempotent.
    ///
    void shutdown()
    {
        if (advertisement_)
        {
            advertisement_->unregister();
        }
        context_->stop_fd.notify();
        context_->registry.clear();
        context_->bus.clear();

        if (accept_thread_.joinable())
        {
            accept_thread_.join();
        }
    }

private:
    struct Worker
    {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> is_done;
    };

    void runAcceptLoop()
    {
        auto& logger = *context_->logger;
        logger.debug("Accepting connections (fd={}, port={}).", listen_fd_.get(), port_);

        while (true)
        {
            std::array<pollfd, 2> pfds{{{listen_fd_.get(), POLLIN, 0}, {context_->stop_fd.get(), POLLIN, 0}}};
            if (const auto err = platform::pollFds(pfds.data(),
                                                   pfds.size(),
                                                   platform::toPollTimeout(context_->settings.accept_poll_interval)))
            {
                logger.critical("Failed to poll listening socket (fd={}): {}.", listen_fd_.get(), std::strerror(err));
                break;
            }
            if ((pfds[1].revents & POLLIN) != 0)
            {
                break;
            }

            reapWorkers(false);

            if ((pfds[0].revents & POLLIN) != 0)
            {
                while (auto accepted = common::io::SocketAddress::accept(listen_fd_))
                {
                    spawnSession(std::move(*accepted));
                }
            }
        }

        reapWorkers(true);
        logger.debug("Accept loop is finished (port={}).", port_);
    }

    void spawnSession(common::io::SocketAddress::Accepted accepted)
    {
        context_->logger->debug("Accepted connection (fd={}, peer={}).",
                                accepted.fd.get(),
                                accepted.peer.toString());

        auto session = std::make_unique<Session>(context_, std::move(accepted.fd), accepted.peer);
        auto is_done = std::make_shared<std::atomic<bool>>(false);

        std::thread thread{[session = std::move(session), is_done] {
            //
            common::performWithoutThrowing([&session] {
                //
                session->run();
            });
            is_done->store(true);
        }};
        workers_.push_back(Worker{std::move(thread), std::move(is_done)});
    }

    void reapWorkers(const bool wait_all)
    {
        for (auto it = workers_.begin(); it != workers_.end();)
        {
            if (wait_all || it->is_done->load())
            {
                if (it->thread.joinable())
                {
                    it->thread.join();
                }
                it = workers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    const std::shared_ptr<Context>                 context_;
    const common::io::OwnFd                        listen_fd_;
    const sdk::ServiceDiscovery::Registration::Ptr advertisement_;
    const std::string                              ip_address_;
    const std::uint16_t                            port_;
    const std::string                              started_at_;
    std::thread                                    accept_thread_;
    std::list<Worker>                              workers_;  // only touched by the accept thread

};  // Instance

LanServer::Instance::MakeResult::Var LanServer::Instance::make(const sdk::LanSettings&    settings,
                                                               sdk::ServiceDiscovery&     discovery,
                                                               const sdk::EventSink::Ptr& sink,
                                                               const std::string&         tenant_id)
{
    using common::io::SocketAddress;

    const auto parsed = SocketAddress::parse(settings.bind_host, settings.port);
    if (const auto* const err = cetl::get_if<SocketAddress::ParseResult::Failure>(&parsed))
    {
        return sdk::Failure{sdk::ErrorCode::BindFailed,
                            fmt::format("Invalid bind address '{}': {}", settings.bind_host, std::strerror(*err)),
                            {}};
    }
    const auto& bind_address = cetl::get<SocketAddress::ParseResult::Success>(parsed);

    auto socket_result = bind_address.socket(SOCK_STREAM);
    if (const auto* const err = cetl::get_if<SocketAddress::SocketResult::Failure>(&socket_result))
    {
        return sdk::Failure{sdk::ErrorCode::BindFailed,
                            fmt::format("Failed to create socket: {}", std::strerror(*err)),
                            {}};
    }
    auto listen_fd = std::move(cetl::get<SocketAddress::SocketResult::Success>(socket_result));

    // Not fatal - only quick restarts are affected.
    (void) SocketAddress::enableReuseAddress(listen_fd);

    if (const auto err = bind_address.bind(listen_fd))
    {
        return sdk::Failure{sdk::ErrorCode::BindFailed,
                            fmt::format("Failed to bind to {}: {}", bind_address.toString(), std::strerror(err)),
                            {}};
    }
    if (const auto err = SocketAddress::listen(listen_fd, ListenBacklog))
    {
        return sdk::Failure{sdk::ErrorCode::BindFailed,
                            fmt::format("Failed to listen on {}: {}", bind_address.toString(), std::strerror(err)),
                            {}};
    }

    // The actual port differs from the configured one if the latter is zero.
    const auto          local_address = SocketAddress::localOf(listen_fd);
    const std::uint16_t port          = local_address ? local_address->getPort() : settings.port;
    const std::string   ip_address    = bind_address.isWildcard()
                                            ? SocketAddress::findLocalIpv4().value_or(std::string{"127.0.0.1"})
                                            : bind_address.getHost();

    auto stop_fd = common::io::WakeFd::make();
    if (!stop_fd)
    {
        return sdk::Failure{sdk::ErrorCode::BindFailed, "Failed to create stop signal", {}};
    }

    auto server_id = common::makeUuid();

    const auto instance_name = fmt::format("{}-{}",
                                           settings.instance_prefix,
                                           common::utf8Prefix(tenant_id, InstanceTenantChars));

    const sdk::ServiceRecord record{settings.service_type,
                                    instance_name,
                                    getLocalHostName(),
                                    ip_address,
                                    port,
                                    {{"tenant", tenant_id}, {"server_id", server_id}}};
    auto register_result = discovery.registerService(record);
    if (const auto* const failure = cetl::get_if<sdk::ServiceDiscovery::RegisterResult::Failure>(&register_result))
    {
        return sdk::Failure{sdk::ErrorCode::AdvertiseFailed,
                            fmt::format("Failed to advertise LAN server: {}", failure->message),
                            {}};
    }
    auto advertisement = std::move(cetl::get<sdk::ServiceDiscovery::RegisterResult::Success>(register_result));

    auto context = std::make_shared<Context>(settings, tenant_id, std::move(server_id), sink, std::move(*stop_fd));

    auto instance = std::make_unique<Instance>(std::move(context),
                                               std::move(listen_fd),
                                               std::move(advertisement),
                                               ip_address,
                                               port);
    instance->startAccepting();
    return std::move(instance);  // NOLINT(*-redundant-move)
}

// MARK: - LanServer

LanServer::LanServer(sdk::LanSettings settings, sdk::ServiceDiscovery::Ptr discovery, sdk::EventSink::Ptr sink)
    : settings_{std::move(settings)}
    , discovery_{std::move(discovery)}
    , sink_{std::move(sink)}
{
    CETL_DEBUG_ASSERT(discovery_, "");
    CETL_DEBUG_ASSERT(sink_, "");
}

LanServer::~LanServer()
{
    common::performWithoutThrowing([this] {
        //
        stop();
    });
}

sdk::StartResult::Var LanServer::start(const std::string& tenant_id)
{
    const std::lock_guard<std::mutex> lifecycle_lock{lifecycle_mutex_};
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        if (state_ != State::Stopped)
        {
            return sdk::Failure{sdk::ErrorCode::AlreadyRunning, "LAN server is already running", {}};
        }
        state_ = State::Starting;
    }

    auto result = common::performWithRollback(
        [this, &tenant_id] {
            //
            return Instance::make(settings_, *discovery_, sink_, tenant_id);
        },
        [this] {
            const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
            state_ = State::Stopped;
        });

    const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
    if (auto* const failure = cetl::get_if<Instance::MakeResult::Failure>(&result))
    {
        logger_->error("Failed to start LAN server: {}.", failure->message);
        state_ = State::Stopped;
        return std::move(*failure);
    }

    running_ = std::move(cetl::get<Instance::MakeResult::Success>(result));
    state_   = State::Running;

    auto address = fmt::format("tcp://{}:{}", running_->ipAddress(), running_->port());
    logger_->info("LAN server is running (address='{}', tenant='{}', server_id='{}').",
                  address,
                  tenant_id,
                  running_->context().server_id);
    return address;
}

void LanServer::stop()
{
    const std::lock_guard<std::mutex> lifecycle_lock{lifecycle_mutex_};

    std::unique_ptr<Instance> instance;
    {
        const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
        if (!running_)
        {
            return;
        }
        state_   = State::Stopping;
        instance = std::move(running_);
    }

    // Connection threads publish their disconnect events while winding down,
    // so no lock (except the lifecycle one) is held here.
    instance->shutdown();
    instance.reset();

    const std::unique_lock<std::shared_timed_mutex> lock{state_mutex_};
    state_ = State::Stopped;
    logger_->info("LAN server is stopped.");
}

sdk::BroadcastResult::Var LanServer::broadcast(const sdk::LanMessage& message)
{
    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    if ((state_ != State::Running) || !running_)
    {
        return sdk::Failure{sdk::ErrorCode::NotRunning, "LAN server is not running", {}};
    }

    const std::size_t count = running_->context().bus.publish(message);
    logger_->debug("Broadcast '{}' message to {} client(s).", toString(message.type()), count);
    return count;
}

sdk::BroadcastResult::Var LanServer::broadcastOrderCreated(nlohmann::json order, nlohmann::json kitchen_order)
{
    return broadcast(sdk::OrderCreated{std::move(order), std::move(kitchen_order)});
}

sdk::BroadcastResult::Var LanServer::broadcastOrderStatus(const std::string& order_id, const std::string& status)
{
    return broadcast(sdk::OrderStatusUpdate{order_id, status, common::nowRfc3339()});
}

sdk::LanServerStatus LanServer::status() const
{
    sdk::LanServerStatus out{};
    out.port = settings_.port;

    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    if ((state_ == State::Running) && running_)
    {
        out.running    = true;
        out.port       = running_->port();
        out.ip_address = running_->ipAddress();
        out.advertised = running_->isAdvertised();
        out.clients    = running_->context().registry.list();
        out.started_at = running_->startedAt();
        out.server_id  = running_->context().server_id;
    }
    return out;
}

std::vector<sdk::ClientInfo> LanServer::clients() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    if (!running_)
    {
        return {};
    }
    return running_->context().registry.list();
}

LanServer::State LanServer::state() const
{
    const std::shared_lock<std::shared_timed_mutex> lock{state_mutex_};
    return state_;
}

const char* toString(const LanServer::State state) noexcept
{
    switch (state)
    {
    case LanServer::State::Stopped:
        return "stopped";
    case LanServer::State::Starting:
        return "starting";
    case LanServer::State::Running:
        return "running";
    case LanServer::State::Stopping:
        return "stopping";
    }
    return "?";
}

}  // namespace server
}  // namespace possync
