#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace streamgate {

enum class ServingStatus : uint8_t {
    SERVING,
    NOT_SERVING,
    SERVICE_UNKNOWN
};

[[nodiscard]] const char* serving_status_to_string(ServingStatus status);

/**
 * @brief Per-service health status registry
 *
 * The empty service name "" is the overall server status. Services that were
 * never registered report SERVICE_UNKNOWN. Readers (health endpoints, stream
 * sessions) take a shared lock; writers are rare (startup, shutdown).
 */
class HealthReporter {
public:
    HealthReporter() = default;

    void set_status(const std::string& service, ServingStatus status);

    [[nodiscard]] ServingStatus status(const std::string& service = "") const;

    /// Flip every registered service, including "", to NOT_SERVING.
    void set_all_not_serving();

    [[nodiscard]] std::unordered_map<std::string, ServingStatus> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ServingStatus> statuses_;
};

} // namespace streamgate
