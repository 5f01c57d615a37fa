#pragma once

#include "shutdown/grace_period.hpp"
#include "shutdown/iconnection_tracker.hpp"
#include "shutdown/isignal_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace streamgate {

/**
 * @brief Bounded-grace shutdown state machine
 *
 *   ACCEPTING --request_shutdown()--> DRAINING --drained------> TERMINATED (GRACEFUL)
 *                                              --grace elapsed-> TERMINATED (FORCED)
 *
 * On entering DRAINING the tracker is told to stop accepting, then to begin
 * graceful close. The drain future is then raced against the grace deadline
 * (measured from entering DRAINING) in a single wait_until(); the thread that
 * runs the race is the only one that can decide the outcome, so a late drain
 * never produces a second outcome and force_close_all() is issued at most once.
 *
 * A ZERO grace period skips the race: force_close_all() runs inside
 * request_shutdown() and the coordinator terminates there.
 *
 * Thread-safety: request_shutdown() may be called from any thread, any number
 * of times. await_termination() must be called exactly once.
 */
class ShutdownCoordinator {
public:
    enum class State : uint8_t {
        ACCEPTING,
        DRAINING,
        TERMINATED
    };

    enum class Outcome : uint8_t {
        GRACEFUL,
        FORCED
    };

    struct Config {
        GracePeriod grace_period;
    };

    using ShutdownListener = std::function<void()>;

    /// @throws std::invalid_argument if tracker is null or its drain future is invalid
    explicit ShutdownCoordinator(std::shared_ptr<IConnectionTracker> tracker);
    ShutdownCoordinator(std::shared_ptr<IConnectionTracker> tracker, const Config& config);

    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// Invoked once on entering DRAINING, before the tracker stops accepting.
    void add_shutdown_listener(ShutdownListener listener);

    /**
     * @brief Forward every request from a signal source to request_shutdown()
     *
     * Spawns a watcher thread, stopped and joined by the destructor.
     * @throws std::logic_error if a source is already being watched
     */
    void watch(std::shared_ptr<ISignalSource> source);

    /**
     * @brief Begin shutdown. Idempotent.
     * @return true if this call performed the ACCEPTING -> DRAINING transition
     */
    bool request_shutdown();

    /**
     * @brief Block until TERMINATED.
     * @return GRACEFUL if the streams drained first, FORCED if the grace period ran out
     * @throws std::logic_error when called more than once
     */
    [[nodiscard]] Outcome await_termination();

    [[nodiscard]] State state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::optional<Outcome> outcome() const;

    /// Time spent in DRAINING, available once TERMINATED.
    [[nodiscard]] std::optional<std::chrono::milliseconds> drain_duration() const;

    [[nodiscard]] const GracePeriod& grace_period() const { return config_.grace_period; }

private:
    void force_close();
    void finish(Outcome outcome);
    void watch_loop(std::stop_token stop, const std::shared_ptr<ISignalSource>& source);

    std::shared_ptr<IConnectionTracker> tracker_;
    Config config_;
    std::shared_future<void> drained_;

    std::atomic<State> state_{State::ACCEPTING};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ShutdownListener> listeners_;
    bool drain_armed_ = false;
    bool awaited_ = false;
    std::optional<Outcome> outcome_;
    std::chrono::steady_clock::time_point draining_since_{};
    std::chrono::steady_clock::time_point terminated_at_{};

    std::jthread watch_thread_;
};

[[nodiscard]] const char* shutdown_state_to_string(ShutdownCoordinator::State state);
[[nodiscard]] const char* shutdown_outcome_to_string(ShutdownCoordinator::Outcome outcome);

} // namespace streamgate
