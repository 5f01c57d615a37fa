#include <catch2/catch_test_macros.hpp>
#include "server/health_server.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <memory>

using namespace streamgate;

namespace {

struct RunningHealthServer {
    std::shared_ptr<HealthReporter> health = std::make_shared<HealthReporter>();
    HealthServer server{ListenAddress{"127.0.0.1", 0}, health};

    RunningHealthServer() { server.start(); }
    ~RunningHealthServer() { server.stop(); }

    httplib::Client client() const {
        httplib::Client cli("127.0.0.1", server.bound_port());
        cli.set_read_timeout(2, 0);
        return cli;
    }
};

} // anonymous namespace

TEST_CASE("HealthServer: overall SERVING is 200", "[health_server]") {
    RunningHealthServer fixture;
    fixture.health->set_status("", ServingStatus::SERVING);
    REQUIRE(fixture.server.bound_port() != 0);

    auto cli = fixture.client();
    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->body == R"({"service":"","status":"SERVING"})");
    CHECK(res->get_header_value("Content-Type") == "application/json");
}

TEST_CASE("HealthServer: NOT_SERVING is 503", "[health_server]") {
    RunningHealthServer fixture;
    fixture.health->set_status("", ServingStatus::SERVING);
    fixture.health->set_all_not_serving();

    auto cli = fixture.client();
    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 503);
    CHECK(res->body == R"({"service":"","status":"NOT_SERVING"})");
}

TEST_CASE("HealthServer: per-service query", "[health_server]") {
    RunningHealthServer fixture;
    fixture.health->set_status("echo", ServingStatus::SERVING);

    auto cli = fixture.client();
    auto serving = cli.Get("/health?service=echo");
    REQUIRE(serving);
    CHECK(serving->status == 200);
    CHECK(serving->body == R"({"service":"echo","status":"SERVING"})");

    auto unknown = cli.Get("/health?service=nope");
    REQUIRE(unknown);
    CHECK(unknown->status == 503);
    CHECK(unknown->body == R"({"service":"nope","status":"SERVICE_UNKNOWN"})");
}

TEST_CASE("HealthServer: stop is idempotent", "[health_server]") {
    auto health = std::make_shared<HealthReporter>();
    HealthServer server(ListenAddress{"127.0.0.1", 0}, health);
    server.start();
    server.stop();
    server.stop();
}
