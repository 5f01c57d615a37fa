#pragma once

#include "shutdown/iconnection_tracker.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace streamgate {

/**
 * @brief Counted registry of live streams
 *
 * Each stream holds a StreamLease for as long as it is alive. When the live
 * count collapses to zero after begin_graceful_close(), the drain future
 * becomes ready (exactly once). Opening is refused once stop_accepting() or
 * begin_graceful_close() has been called, so the drain can only move toward
 * zero.
 *
 * Hooks run under the registry lock: a stream cannot be deregistered while
 * its hook runs, so a hook may safely touch resources the stream releases
 * after its lease. Hooks must not call back into the tracker.
 *
 * The tracker must outlive every lease it hands out.
 */
class StreamTracker : public IConnectionTracker {
public:
    struct StreamHooks {
        std::function<void()> on_close_requested;
        std::function<void()> on_abort;
    };

    struct Stats {
        uint64_t opened = 0;
        uint64_t rejected = 0;
        uint64_t aborted = 0;
    };

    class StreamLease {
    public:
        StreamLease() = default;
        ~StreamLease();

        StreamLease(StreamLease&& other) noexcept;
        StreamLease& operator=(StreamLease&& other) noexcept;

        StreamLease(const StreamLease&) = delete;
        StreamLease& operator=(const StreamLease&) = delete;

        /// Deregister now instead of at destruction. Safe to call twice.
        void release();

        [[nodiscard]] uint64_t id() const { return id_; }
        explicit operator bool() const { return tracker_ != nullptr; }

    private:
        friend class StreamTracker;
        StreamLease(StreamTracker* tracker, uint64_t id)
            : tracker_(tracker), id_(id) {}

        StreamTracker* tracker_ = nullptr;
        uint64_t id_ = 0;
    };

    StreamTracker();
    ~StreamTracker() override = default;

    StreamTracker(const StreamTracker&) = delete;
    StreamTracker& operator=(const StreamTracker&) = delete;

    /// Register a stream. Returns std::nullopt once shutdown has begun.
    [[nodiscard]] std::optional<StreamLease> try_open(StreamHooks hooks = {});

    void stop_accepting() override;
    void begin_graceful_close() override;
    [[nodiscard]] std::shared_future<void> drained() override;
    void force_close_all() override;

    [[nodiscard]] size_t live_count() const;
    [[nodiscard]] bool is_accepting() const;
    [[nodiscard]] Stats stats() const;

private:
    void close_stream(uint64_t id);
    void fire_drained_locked();

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, StreamHooks> streams_;
    uint64_t next_id_ = 1;
    bool accepting_ = true;
    bool closing_ = false;
    bool drain_fired_ = false;
    Stats stats_;

    std::promise<void> drained_promise_;
    std::shared_future<void> drained_;
};

} // namespace streamgate
