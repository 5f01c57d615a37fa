#pragma once

#include "health/health_reporter.hpp"
#include "server/listen_address.hpp"
#include "shutdown/iconnection_tracker.hpp"
#include "shutdown/stream_tracker.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace streamgate {

struct StreamServerConfig {
    ListenAddress address;
    uint32_t max_connections = 1024;
};

/**
 * @brief TCP server of long-lived line streams, one thread per connection
 *
 * Implements IConnectionTracker over its own StreamTracker so the
 * ShutdownCoordinator can drive it directly:
 * - stop_accepting():       close the listening socket, join the accept thread
 * - begin_graceful_close(): GOAWAY to every live stream
 * - force_close_all():      shutdown(SHUT_RDWR) every live stream
 */
class StreamServer : public IConnectionTracker {
public:
    StreamServer(StreamServerConfig config, std::shared_ptr<const HealthReporter> health);

    ~StreamServer() override;

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    // Non-blocking: binds, listens, spawns the accept thread
    void start();

    // Stop accepting, abort what is left, join every thread
    void stop();

    void stop_accepting() override;
    void begin_graceful_close() override;
    [[nodiscard]] std::shared_future<void> drained() override;
    void force_close_all() override;

    /// Actual listening port (differs from config when port 0 was requested)
    [[nodiscard]] uint16_t bound_port() const { return bound_port_.load(); }

    [[nodiscard]] size_t active_streams() const { return tracker_.live_count(); }

    [[nodiscard]] StreamTracker::Stats stats() const { return tracker_.stats(); }

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void reap_finished_workers();

    StreamServerConfig config_;
    std::shared_ptr<const HealthReporter> health_;
    StreamTracker tracker_;

    // Server socket
    int server_fd_ = -1;
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};

    // Thread management
    std::jthread accept_thread_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace streamgate
