//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include "config.hpp"
#include "protocol/lan_message_codec.hpp"

#include <possync/sdk/event_sink.hpp>
#include <possync/sdk/lan_message.hpp>
#include <possync/sdk/lan_sync.hpp>
#include <possync/sdk/lan_types.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <signal.h>  // NOLINT
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace
{

using Json = nlohmann::json;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

/// Prints every event as a JSON line to stdout.
///
class StdoutSink final : public possync::sdk::EventSink
{
public:
    bool isDisconnected() const noexcept
    {
        return is_disconnected_;
    }

    // EventSink

    void publish(const std::string& event_name, const Json& payload) override
    {
        if (event_name == possync::sdk::events::LanDisconnected)
        {
            is_disconnected_ = true;
        }

        const std::lock_guard<std::mutex> lock{mutex_};
        std::cout << Json{{"event", event_name}, {"payload", payload}}.dump() << std::endl;
    }

private:
    std::mutex        mutex_;
    std::atomic<bool> is_disconnected_{false};

};  // StdoutSink

struct CommandLine
{
    std::string              config_file{"./possync.toml"};
    std::vector<std::string> positional;
};

/// Splits arguments into `KEY=value` options (handled here or by the logging setup) and positional ones.
///
CommandLine parseCommandLine(const int argc, const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    CommandLine cmd_line;
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cmd_line.config_file = arg_str.substr(config_file_prefix.size());
        }
        else if ((0 != arg_str.compare(0, 13, "SPDLOG_LEVEL=")) &&        // NOLINT(*-magic-numbers)
                 (0 != arg_str.compare(0, 19, "SPDLOG_FLUSH_LEVEL=")))  // NOLINT(*-magic-numbers)
        {
            cmd_line.positional.push_back(arg_str);
        }
    }
    return cmd_line;
}

void printUsage()
{
    std::cerr << "Usage: possync [CONFIG_FILE=<path>] [SPDLOG_LEVEL=<levels>] <command>\n"
                 "Commands:\n"
                 "  server <tenant_id>                             run LAN server, broadcast JSON lines from stdin\n"
                 "  client <address> <pos|kds|bds|manager> <tenant_id>  connect to LAN server, print its events\n"
                 "  discover [tenant_id]                           list LAN servers on the local network\n";
}

int reportFailure(const possync::sdk::Failure& failure)
{
    spdlog::error("Command failed ({}): {}", toString(failure.code), failure.message);
    std::cerr << "Error (" << toString(failure.code) << "): " << failure.message << '\n';
    return EXIT_FAILURE;
}

/// Makes a message out of a line of stdin.
///
/// A JSON object with a known "type" is taken as is; any other JSON value is an order.
///
cetl::optional<possync::sdk::LanMessage> parseInputLine(const std::string& line)
{
    using possync::common::protocol::DecodeResult;

    auto json = Json::parse(line, nullptr, false);
    if (json.is_discarded())
    {
        std::cerr << "Skipping line which is not JSON.\n";
        return cetl::nullopt;
    }

    if (json.is_object() && json.contains("type"))
    {
        auto result = possync::common::protocol::decode(line);
        if (auto* const message = cetl::get_if<DecodeResult::Success>(&result))
        {
            return std::move(*message);
        }
        if (const auto* const unknown = cetl::get_if<DecodeResult::Unknown>(&result))
        {
            std::cerr << "Skipping message of unknown type '" << unknown->type << "'.\n";
            return cetl::nullopt;
        }
        std::cerr << "Skipping malformed message: " << cetl::get<DecodeResult::Failure>(result).reason << '\n';
        return cetl::nullopt;
    }

    return possync::sdk::LanMessage{possync::sdk::OrderCreated{json, json}};
}

/// Reads stdin line by line (without blocking signal handling) and broadcasts each line.
///
void pumpStdin(possync::sdk::LanSync& lan_sync)
{
    constexpr int poll_timeout_ms = 200;

    std::string                pending;
    std::array<char, 4096>     buffer{};  // NOLINT(*-magic-numbers)
    while (g_running != 0)
    {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const int poll_result = ::poll(&pfd, 1, poll_timeout_ms);
        if (poll_result < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::error("Failed to poll stdin: {}", std::strerror(errno));
            return;
        }
        if (poll_result == 0)
        {
            continue;
        }

        const auto bytes_read = ::read(STDIN_FILENO, buffer.data(), buffer.size());
        if (bytes_read < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::error("Failed to read stdin: {}", std::strerror(errno));
            return;
        }
        if (bytes_read == 0)
        {
            spdlog::debug("End of stdin.");
            return;
        }
        pending.append(buffer.data(), static_cast<std::size_t>(bytes_read));

        std::size_t eol_pos = 0;
        while ((eol_pos = pending.find('\n')) != std::string::npos)
        {
            const auto line = pending.substr(0, eol_pos);
            pending.erase(0, eol_pos + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }

            if (auto message = parseInputLine(line))
            {
                auto result = lan_sync.broadcast(*message);
                if (const auto* const failure = cetl::get_if<possync::sdk::BroadcastResult::Failure>(&result))
                {
                    std::cerr << "Broadcast failed: " << failure->message << '\n';
                }
                else
                {
                    spdlog::info("Broadcast '{}' to {} client(s).",
                                 toString(message->type()),
                                 cetl::get<possync::sdk::BroadcastResult::Success>(result));
                }
            }
        }
    }
}

int runServer(possync::sdk::LanSync& lan_sync, const std::string& tenant_id)
{
    auto result = lan_sync.start(tenant_id);
    if (const auto* const failure = cetl::get_if<possync::sdk::StartResult::Failure>(&result))
    {
        return reportFailure(*failure);
    }
    std::cerr << "LAN server is listening at " << cetl::get<possync::sdk::StartResult::Success>(result) << '\n';

    pumpStdin(lan_sync);

    if (g_running == 0)
    {
        spdlog::debug("Received termination signal.");
    }
    lan_sync.stop();
    return EXIT_SUCCESS;
}

int runClient(possync::sdk::LanSync&   lan_sync,
              const StdoutSink&        sink,
              const std::string&       address,
              const std::string&       device_name,
              const std::string&       tenant_id)
{
    using std::chrono_literals::operator""ms;

    const auto device_type = possync::sdk::parseDeviceType(device_name);
    if (!device_type)
    {
        std::cerr << "Unknown device type '" << device_name << "'.\n";
        return EXIT_FAILURE;
    }

    auto result = lan_sync.connect(address, *device_type, tenant_id);
    if (const auto* const failure = cetl::get_if<possync::sdk::ConnectResult::Failure>(&result))
    {
        return reportFailure(*failure);
    }

    while ((g_running != 0) && !sink.isDisconnected())
    {
        std::this_thread::sleep_for(100ms);
    }
    lan_sync.disconnect();
    return EXIT_SUCCESS;
}

int runDiscover(possync::sdk::LanSync& lan_sync, const cetl::optional<std::string>& tenant_id)
{
    auto result = lan_sync.discover(tenant_id, cetl::nullopt);
    if (const auto* const failure = cetl::get_if<possync::sdk::DiscoverResult::Failure>(&result))
    {
        return reportFailure(*failure);
    }
    for (const auto& server : cetl::get<possync::sdk::DiscoverResult::Success>(result))
    {
        std::cout << Json(server).dump() << '\n';
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    setupSignalHandlers();
    setupBootstrapLogging();

    const auto cmd_line = parseCommandLine(argc, argv);
    const auto config   = possync::common::Config::make(cmd_line.config_file);
    if (!config)
    {
        std::cerr << "Failed to load config file '" << cmd_line.config_file << "'.\n";
        return EXIT_FAILURE;
    }
    setupLogging(argc, argv, *config);

    const auto& args = cmd_line.positional;
    if (args.empty())
    {
        printUsage();
        return EXIT_FAILURE;
    }

    spdlog::info("possync started (command='{}').", args.front());
    int result = EXIT_SUCCESS;
    try
    {
        const auto sink     = std::make_shared<StdoutSink>();
        const auto lan_sync = possync::sdk::LanSync::make(config->getLanSettings(), config->getDiscoverySettings(), sink);
        if (!lan_sync)
        {
            spdlog::critical("Failed to create LAN sync.");
            std::cerr << "Failed to create LAN sync.\n";
            return EXIT_FAILURE;
        }

        const auto& command = args.front();
        if ((command == "server") && (args.size() == 2))
        {
            result = runServer(*lan_sync, args[1]);
        }
        else if ((command == "client") && (args.size() == 4))
        {
            result = runClient(*lan_sync, *sink, args[1], args[2], args[3]);
        }
        else if ((command == "discover") && (args.size() <= 2))
        {
            result = runDiscover(*lan_sync,
                                 (args.size() == 2) ? cetl::make_optional(args[1]) : cetl::optional<std::string>{});
        }
        else
        {
            printUsage();
            result = EXIT_FAILURE;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("possync terminated.");

    return result;
}
