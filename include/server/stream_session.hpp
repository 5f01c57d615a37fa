#pragma once

#include "health/health_reporter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace streamgate {

/**
 * @brief One long-lived, newline-delimited bidirectional stream
 *
 * Line protocol:
 *   PING               -> PONG
 *   HEALTH [service]   -> SERVING | NOT_SERVING | SERVICE_UNKNOWN
 *   QUIT               -> BYE, then the session ends
 *   anything else      -> echoed back
 *
 * request_close() and abort() are called from the shutdown path on another
 * thread. request_close() writes GOAWAY once and lets the peer finish;
 * abort() shuts the socket down so run() returns.
 *
 * Owns the socket: closed on destruction.
 */
class StreamSession {
public:
    enum class State : uint8_t {
        OPEN,
        CLOSING,
        CLOSED
    };

    static constexpr size_t kMaxLineLength = 64 * 1024;

    StreamSession(int fd, std::string remote_addr,
                  std::shared_ptr<const HealthReporter> health);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Run the session (blocking, called from worker thread)
    void run();

    void request_close();
    void abort();

    [[nodiscard]] State state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::string& remote_addr() const { return remote_addr_; }
    [[nodiscard]] uint64_t lines_handled() const { return lines_handled_; }

    /// Reply for one request line; std::nullopt ends the session.
    [[nodiscard]] static std::optional<std::string> handle_line(
        std::string_view line, const HealthReporter* health);

private:
    [[nodiscard]] bool read_line(std::string& line);
    bool send_line(std::string_view line);
    void flush_goaway_locked();

    int fd_;
    std::string remote_addr_;
    std::shared_ptr<const HealthReporter> health_;

    std::atomic<State> state_{State::OPEN};
    std::atomic<bool> aborted_{false};
    bool goaway_sent_ = false;       // guarded by write_mutex_
    std::mutex write_mutex_;

    std::string read_buffer_;
    uint64_t lines_handled_ = 0;
};

} // namespace streamgate
