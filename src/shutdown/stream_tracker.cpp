#include "shutdown/stream_tracker.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace streamgate {

// ============================================================================
// StreamLease
// ============================================================================

StreamTracker::StreamLease::~StreamLease() {
    release();
}

StreamTracker::StreamLease::StreamLease(StreamLease&& other) noexcept
    : tracker_(std::exchange(other.tracker_, nullptr)),
      id_(std::exchange(other.id_, 0)) {}

StreamTracker::StreamLease& StreamTracker::StreamLease::operator=(StreamLease&& other) noexcept {
    if (this != &other) {
        release();
        tracker_ = std::exchange(other.tracker_, nullptr);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void StreamTracker::StreamLease::release() {
    if (tracker_) {
        std::exchange(tracker_, nullptr)->close_stream(id_);
    }
}

// ============================================================================
// StreamTracker
// ============================================================================

StreamTracker::StreamTracker()
    : drained_(drained_promise_.get_future().share()) {}

std::optional<StreamTracker::StreamLease> StreamTracker::try_open(StreamHooks hooks) {
    std::lock_guard lock(mutex_);
    if (!accepting_ || closing_) {
        ++stats_.rejected;
        return std::nullopt;
    }
    const uint64_t id = next_id_++;
    streams_.emplace(id, std::move(hooks));
    ++stats_.opened;
    return StreamLease(this, id);
}

void StreamTracker::close_stream(uint64_t id) {
    std::lock_guard lock(mutex_);
    streams_.erase(id);
    if (closing_ && streams_.empty()) {
        fire_drained_locked();
    }
}

void StreamTracker::stop_accepting() {
    std::lock_guard lock(mutex_);
    accepting_ = false;
}

void StreamTracker::begin_graceful_close() {
    std::lock_guard lock(mutex_);
    if (closing_) return;
    closing_ = true;
    accepting_ = false;

    utils::log::debug(std::format("Stream tracker: asking {} live streams to close",
                                  streams_.size()));
    for (auto& [id, hooks] : streams_) {
        if (hooks.on_close_requested) {
            hooks.on_close_requested();
        }
    }

    if (streams_.empty()) {
        fire_drained_locked();
    }
}

std::shared_future<void> StreamTracker::drained() {
    return drained_;
}

void StreamTracker::force_close_all() {
    std::lock_guard lock(mutex_);
    accepting_ = false;
    for (auto& [id, hooks] : streams_) {
        if (hooks.on_abort) {
            hooks.on_abort();
        }
        ++stats_.aborted;
    }
    if (!streams_.empty()) {
        utils::log::warn(std::format("Stream tracker: aborted {} streams", streams_.size()));
    }
}

void StreamTracker::fire_drained_locked() {
    if (drain_fired_) return;
    drain_fired_ = true;
    drained_promise_.set_value();
}

size_t StreamTracker::live_count() const {
    std::lock_guard lock(mutex_);
    return streams_.size();
}

bool StreamTracker::is_accepting() const {
    std::lock_guard lock(mutex_);
    return accepting_;
}

StreamTracker::Stats StreamTracker::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace streamgate
