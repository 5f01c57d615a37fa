#include <catch2/catch_test_macros.hpp>
#include "server/stream_server.hpp"
#include "shutdown/shutdown_coordinator.hpp"
#include "mocks/line_client.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

using namespace streamgate;
using namespace streamgate::testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<StreamServer> start_server(uint32_t max_connections = 16,
                                           std::shared_ptr<const HealthReporter> health = nullptr) {
    auto server = std::make_shared<StreamServer>(
        StreamServerConfig{
            .address = ListenAddress{"127.0.0.1", 0},
            .max_connections = max_connections,
        },
        std::move(health));
    server->start();
    return server;
}

bool eventually(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

bool is_ready(const std::shared_future<void>& f) {
    return f.wait_for(0ms) == std::future_status::ready;
}

} // anonymous namespace

TEST_CASE("StreamServer: binds an ephemeral port and serves", "[stream_server]") {
    auto server = start_server();
    REQUIRE(server->bound_port() != 0);

    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    CHECK(client.request("PING") == "PONG");
    CHECK(client.request("stream data") == "stream data");
    CHECK(server->active_streams() == 1);

    CHECK(client.request("QUIT") == "BYE");
    CHECK(eventually([&] { return server->active_streams() == 0; }));
    server->stop();
}

TEST_CASE("StreamServer: HEALTH uses the shared reporter", "[stream_server][health]") {
    auto health = std::make_shared<HealthReporter>();
    health->set_status("", ServingStatus::SERVING);
    auto server = start_server(16, health);

    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    CHECK(client.request("HEALTH") == "SERVING");

    health->set_all_not_serving();
    CHECK(client.request("HEALTH") == "NOT_SERVING");
    server->stop();
}

TEST_CASE("StreamServer: graceful close lets streams finish", "[stream_server][shutdown]") {
    auto server = start_server();
    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    REQUIRE(client.request("PING") == "PONG");

    server->stop_accepting();
    server->begin_graceful_close();

    CHECK(client.read_line() == "GOAWAY");
    auto drained = server->drained();
    CHECK_FALSE(is_ready(drained));

    // New connections are refused once accepting stopped
    LineClient late(server->bound_port());
    CHECK_FALSE(late.connected());

    // The in-flight stream still completes its work
    CHECK(client.request("PING") == "PONG");
    CHECK(client.request("QUIT") == "BYE");
    CHECK(drained.wait_for(2000ms) == std::future_status::ready);
    CHECK(server->stats().aborted == 0);
    server->stop();
}

TEST_CASE("StreamServer: force_close_all disconnects live streams", "[stream_server][shutdown]") {
    auto server = start_server();
    LineClient a(server->bound_port());
    LineClient b(server->bound_port());
    REQUIRE(a.connected());
    REQUIRE(b.connected());
    REQUIRE(a.request("PING") == "PONG");
    REQUIRE(b.request("PING") == "PONG");

    server->stop_accepting();
    server->begin_graceful_close();
    CHECK(a.read_line() == "GOAWAY");
    CHECK(b.read_line() == "GOAWAY");

    server->force_close_all();
    CHECK_FALSE(a.read_line().has_value());
    CHECK_FALSE(b.read_line().has_value());
    CHECK(server->drained().wait_for(2000ms) == std::future_status::ready);
    CHECK(server->stats().aborted == 2);
    server->stop();
}

TEST_CASE("StreamServer: max_connections rejects extra clients", "[stream_server]") {
    auto server = start_server(1);
    LineClient first(server->bound_port());
    REQUIRE(first.connected());
    REQUIRE(first.request("PING") == "PONG");

    LineClient second(server->bound_port());
    // The kernel completes the handshake; the server then closes it
    CHECK_FALSE(second.request("PING").has_value());

    CHECK(first.request("PING") == "PONG");
    server->stop();
}

TEST_CASE("StreamServer: drained immediately with no streams", "[stream_server][shutdown]") {
    auto server = start_server();
    server->stop_accepting();
    server->begin_graceful_close();
    CHECK(is_ready(server->drained()));
    server->stop();
}

TEST_CASE("StreamServer: stop aborts what is left", "[stream_server]") {
    auto server = start_server();
    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    REQUIRE(client.request("PING") == "PONG");

    server->stop();
    CHECK_FALSE(client.read_line().has_value());
    CHECK(server->active_streams() == 0);
}

TEST_CASE("StreamServer: coordinator drains a cooperative client", "[stream_server][shutdown][integration]") {
    auto server = start_server();
    ShutdownCoordinator coordinator(server,
        ShutdownCoordinator::Config{.grace_period = GracePeriod::from_millis(5000)});

    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    REQUIRE(client.request("PING") == "PONG");

    std::thread peer([&] {
        // Finish as soon as the server asks
        if (client.read_line() == "GOAWAY") {
            (void)client.request("QUIT");
        }
    });

    CHECK(coordinator.request_shutdown());
    const auto start = std::chrono::steady_clock::now();
    CHECK(coordinator.await_termination() == ShutdownCoordinator::Outcome::GRACEFUL);
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
    peer.join();
    server->stop();
}

TEST_CASE("StreamServer: coordinator forces an idle client", "[stream_server][shutdown][integration]") {
    auto server = start_server();
    ShutdownCoordinator coordinator(server,
        ShutdownCoordinator::Config{.grace_period = GracePeriod::from_millis(200)});

    LineClient client(server->bound_port());
    REQUIRE(client.connected());
    REQUIRE(client.request("PING") == "PONG");

    CHECK(coordinator.request_shutdown());
    CHECK(client.read_line() == "GOAWAY");
    CHECK(coordinator.await_termination() == ShutdownCoordinator::Outcome::FORCED);

    // The client ignored GOAWAY and is cut off
    CHECK_FALSE(client.read_line().has_value());
    CHECK(server->drained().wait_for(2000ms) == std::future_status::ready);
    server->stop();
}
