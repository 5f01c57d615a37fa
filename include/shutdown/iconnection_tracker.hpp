#pragma once

#include <future>

namespace streamgate {

/**
 * @brief Abstract connection/stream tracker driven by the ShutdownCoordinator
 *
 * The tracker owns the live stream set; the coordinator only issues commands
 * and observes a single "drained" event. Implementations: StreamTracker
 * (in-process registry) and StreamServer (TCP streams).
 *
 * Call order during shutdown:
 *   stop_accepting() -> begin_graceful_close() -> drained() raced against
 *   the grace deadline -> force_close_all() if the deadline won.
 */
class IConnectionTracker {
public:
    virtual ~IConnectionTracker() = default;

    /// Refuse all new connections/streams from now on.
    virtual void stop_accepting() = 0;

    /// Ask every live connection/stream to finish and close on its own.
    virtual void begin_graceful_close() = 0;

    /// Ready once zero live streams remain after begin_graceful_close().
    [[nodiscard]] virtual std::shared_future<void> drained() = 0;

    /// Abort every connection/stream still alive. The coordinator calls this at most once.
    virtual void force_close_all() = 0;
};

} // namespace streamgate
