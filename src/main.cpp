#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "health/health_reporter.hpp"
#include "server/health_server.hpp"
#include "server/listen_address.hpp"
#include "server/stream_server.hpp"
#include "shutdown/posix_signal_source.hpp"
#include "shutdown/shutdown_coordinator.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace streamgate;

namespace {

struct CommandLine {
    std::string config_file = "config/streamgate.toml";
    std::optional<std::string> address;
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    bool have_config = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--address") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--address requires a host:port value");
            }
            cli.address = argv[++i];
        } else if (arg.starts_with("--address=")) {
            cli.address = std::string(arg.substr(std::string_view("--address=").size()));
        } else if (arg.starts_with("--")) {
            throw std::invalid_argument(std::format("Unknown option: {}", arg));
        } else if (!have_config) {
            cli.config_file = std::string(arg);
            have_config = true;
        } else {
            throw std::invalid_argument(std::format("Unexpected argument: {}", arg));
        }
    }
    return cli;
}

StreamgateConfig load_config(const CommandLine& cli) {
    StreamgateConfig config;
    if (std::filesystem::exists(cli.config_file)) {
        utils::log::info(std::format("Loading configuration from {}", cli.config_file));
        auto result = ConfigLoader::load_from_file(cli.config_file);
        if (!result.success) {
            throw std::runtime_error(result.error_message);
        }
        config = std::move(result.config);
    } else {
        utils::log::warn(std::format("Config file {} not found, using defaults", cli.config_file));
    }

    if (cli.address) {
        config.server.address = *cli.address;
        // Re-run validation so a bad override is reported like a bad file
        const auto errors = ConfigLoader::validate_config(config);
        if (!errors.empty()) {
            throw std::runtime_error(errors.front());
        }
    }
    return config;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto cli = parse_command_line(argc, argv);

        utils::log::info("streamgate starting...");

        // [1/5] Configuration
        const auto config = load_config(cli);
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        const auto grace = config.shutdown.grace_period();
        utils::log::info(std::format("Grace period: {}", grace.to_string()));

        // [2/5] Signals, installed before any thread exists
        std::vector<int> signals;
        signals.reserve(config.shutdown.signals.size());
        for (const auto& name : config.shutdown.signals) {
            signals.push_back(signal_from_name(name));
        }
        auto signal_source = std::make_shared<PosixSignalSource>(std::move(signals));

        // [3/5] Components
        auto health = std::make_shared<HealthReporter>();
        health->set_status("", ServingStatus::SERVING);

        auto stream_server = std::make_shared<StreamServer>(
            StreamServerConfig{
                .address = ListenAddress::parse(config.server.address),
                .max_connections = static_cast<uint32_t>(config.server.max_connections),
            },
            health);

        std::unique_ptr<HealthServer> health_server;
        if (config.health.enabled) {
            health_server = std::make_unique<HealthServer>(
                ListenAddress::parse(config.health.address), health);
        }

        ShutdownCoordinator coordinator(stream_server,
                                        ShutdownCoordinator::Config{.grace_period = grace});
        coordinator.add_shutdown_listener([health] { health->set_all_not_serving(); });

        // [4/5] Serve
        stream_server->start();
        if (health_server) {
            health_server->start();
        }
        coordinator.watch(signal_source);

        utils::log::info(std::format("server listening on {}",
            ListenAddress{ListenAddress::parse(config.server.address).host,
                          stream_server->bound_port()}.to_string()));

        // [5/5] Block until a signal arrives and the drain race is decided
        const auto outcome = coordinator.await_termination();
        int exit_code = EXIT_SUCCESS;
        if (outcome == ShutdownCoordinator::Outcome::GRACEFUL) {
            utils::log::info("all streams drained, exiting");
        } else {
            utils::log::warn(std::format("exiting with {} stream(s) still open",
                                         stream_server->active_streams()));
            exit_code = static_cast<int>(config.shutdown.forced_exit_code);
        }

        stream_server->stop();
        if (health_server) {
            health_server->stop();
        }
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return EXIT_FAILURE;
    }
}
