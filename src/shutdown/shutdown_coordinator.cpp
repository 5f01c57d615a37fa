#include "shutdown/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <string_view>

namespace streamgate {

namespace {

// Tracker failures are the tracker's concern: log them, never retry.
template<typename Fn>
void issue_command(std::string_view name, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Shutdown: {} failed: {}", name, e.what()));
    }
}

} // anonymous namespace

ShutdownCoordinator::ShutdownCoordinator(std::shared_ptr<IConnectionTracker> tracker)
    : ShutdownCoordinator(std::move(tracker), Config{}) {}

ShutdownCoordinator::ShutdownCoordinator(std::shared_ptr<IConnectionTracker> tracker,
                                         const Config& config)
    : tracker_(std::move(tracker)),
      config_(config) {
    if (!tracker_) {
        throw std::invalid_argument("ShutdownCoordinator requires a connection tracker");
    }
    drained_ = tracker_->drained();
    if (!drained_.valid()) {
        throw std::invalid_argument("Connection tracker returned an invalid drain future");
    }
}

ShutdownCoordinator::~ShutdownCoordinator() {
    if (watch_thread_.joinable()) {
        watch_thread_.request_stop();
        watch_thread_.join();
    }
}

void ShutdownCoordinator::add_shutdown_listener(ShutdownListener listener) {
    std::lock_guard lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ShutdownCoordinator::watch(std::shared_ptr<ISignalSource> source) {
    if (!source) {
        throw std::invalid_argument("ShutdownCoordinator::watch requires a signal source");
    }
    if (watch_thread_.joinable()) {
        throw std::logic_error("ShutdownCoordinator is already watching a signal source");
    }
    watch_thread_ = std::jthread([this, source = std::move(source)](std::stop_token stop) {
        watch_loop(std::move(stop), source);
    });
}

void ShutdownCoordinator::watch_loop(std::stop_token stop,
                                     const std::shared_ptr<ISignalSource>& source) {
    while (!stop.stop_requested()) {
        std::optional<int> signal;
        try {
            signal = source->wait(stop);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Shutdown: signal source failed, no longer watching: {}",
                                          e.what()));
            return;
        }
        if (!signal) break;

        if (request_shutdown()) {
            utils::log::info(std::format("Received signal {}, shutdown requested", *signal));
        } else {
            utils::log::info(std::format("Received signal {}, shutdown already {}",
                *signal, shutdown_state_to_string(state())));
        }
    }
}

bool ShutdownCoordinator::request_shutdown() {
    auto expected = State::ACCEPTING;
    if (!state_.compare_exchange_strong(expected, State::DRAINING,
                                        std::memory_order_acq_rel)) {
        return false;
    }

    std::vector<ShutdownListener> listeners;
    {
        std::lock_guard lock(mutex_);
        draining_since_ = std::chrono::steady_clock::now();
        listeners = listeners_;
    }

    // Drain wait is armed on every exit, including exceptions issue_command lets through
    struct ArmGuard {
        ShutdownCoordinator* sc;
        ~ArmGuard() {
            {
                std::lock_guard lock(sc->mutex_);
                sc->drain_armed_ = true;
            }
            sc->cv_.notify_all();
        }
    } arm_guard{this};

    utils::log::info("Shutting down, draining traffic");

    for (const auto& listener : listeners) {
        issue_command("shutdown listener", listener);
    }
    issue_command("stop_accepting", [this] { tracker_->stop_accepting(); });
    issue_command("begin_graceful_close", [this] { tracker_->begin_graceful_close(); });

    if (config_.grace_period.is_zero()) {
        utils::log::warn("Grace period is zero, forcing shutdown");
        force_close();
        finish(Outcome::FORCED);
        return true;
    }
    return true;
}

ShutdownCoordinator::Outcome ShutdownCoordinator::await_termination() {
    std::unique_lock lock(mutex_);
    if (awaited_) {
        throw std::logic_error("ShutdownCoordinator::await_termination() may only be called once");
    }
    awaited_ = true;

    cv_.wait(lock, [this] { return drain_armed_ || outcome_.has_value(); });
    if (outcome_) {
        return *outcome_;
    }
    const auto draining_since = draining_since_;
    lock.unlock();

    auto outcome = Outcome::GRACEFUL;
    if (config_.grace_period.is_infinite()) {
        utils::log::info("Waiting for all streams to drain (no grace deadline)");
        drained_.wait();
    } else {
        const auto grace = config_.grace_period.duration();
        utils::log::info(std::format("Waiting up to {} ms for streams to drain", grace.count()));
        // draining_since + grace must not overflow the clock's representation
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::time_point::max() - draining_since);
        if (grace >= headroom) {
            drained_.wait();
        } else if (drained_.wait_until(draining_since + grace) != std::future_status::ready) {
            outcome = Outcome::FORCED;
        }
    }

    if (outcome == Outcome::FORCED) {
        utils::log::warn("Grace period exhausted, forcing shutdown");
        force_close();
    }
    finish(outcome);
    return outcome;
}

void ShutdownCoordinator::force_close() {
    issue_command("force_close_all", [this] { tracker_->force_close_all(); });
}

void ShutdownCoordinator::finish(Outcome outcome) {
    std::chrono::milliseconds took{};
    {
        std::lock_guard lock(mutex_);
        outcome_ = outcome;
        terminated_at_ = std::chrono::steady_clock::now();
        took = std::chrono::duration_cast<std::chrono::milliseconds>(
            terminated_at_ - draining_since_);
        state_.store(State::TERMINATED, std::memory_order_release);
    }
    cv_.notify_all();

    utils::log::info(std::format("Shutdown complete: {} after {} ms",
        shutdown_outcome_to_string(outcome), took.count()));
}

std::optional<ShutdownCoordinator::Outcome> ShutdownCoordinator::outcome() const {
    std::lock_guard lock(mutex_);
    return outcome_;
}

std::optional<std::chrono::milliseconds> ShutdownCoordinator::drain_duration() const {
    std::lock_guard lock(mutex_);
    if (!outcome_) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        terminated_at_ - draining_since_);
}

const char* shutdown_state_to_string(ShutdownCoordinator::State state) {
    switch (state) {
        case ShutdownCoordinator::State::ACCEPTING:  return "accepting";
        case ShutdownCoordinator::State::DRAINING:   return "draining";
        case ShutdownCoordinator::State::TERMINATED: return "terminated";
    }
    return "unknown";
}

const char* shutdown_outcome_to_string(ShutdownCoordinator::Outcome outcome) {
    switch (outcome) {
        case ShutdownCoordinator::Outcome::GRACEFUL: return "graceful";
        case ShutdownCoordinator::Outcome::FORCED:   return "forced";
    }
    return "unknown";
}

} // namespace streamgate
