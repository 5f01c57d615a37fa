#pragma once

#include "health/health_reporter.hpp"
#include "server/listen_address.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace streamgate {

/**
 * @brief HTTP health endpoint
 *
 *   GET /health[?service=name] -> {"service":"name","status":"SERVING"}
 *
 * 200 when SERVING, 503 otherwise. Keeps serving through the drain so load
 * balancers observe NOT_SERVING; stopped once the coordinator has terminated.
 */
class HealthServer {
public:
    HealthServer(ListenAddress address, std::shared_ptr<const HealthReporter> health);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    /// Binds synchronously, then serves on a background thread.
    /// @throws std::runtime_error if the address cannot be bound
    void start();

    void stop();

    [[nodiscard]] uint16_t bound_port() const { return bound_port_.load(); }

private:
    void handle_health(const httplib::Request& req, httplib::Response& res) const;

    ListenAddress address_;
    std::shared_ptr<const HealthReporter> health_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::jthread listen_thread_;
};

} // namespace streamgate
