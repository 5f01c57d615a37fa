#pragma once

#include "shutdown/grace_period.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace streamgate {

// ============================================================================
// [server]
// ============================================================================

struct ServerConfig {
    std::string address = "[::]:50051";
    // Raw TOML integers; range-checked by ConfigLoader::validate_config
    int64_t max_connections = 1024;
};

// ============================================================================
// [shutdown]
// ============================================================================

struct ShutdownConfig {
    // std::nullopt = infinite. Kept raw so a negative value reaches validation.
    std::optional<int64_t> grace_period_ms = 1000;
    int64_t forced_exit_code = 0;
    std::vector<std::string> signals = {"SIGINT", "SIGTERM"};

    /// @throws std::invalid_argument if grace_period_ms is negative
    [[nodiscard]] GracePeriod grace_period() const {
        return grace_period_ms ? GracePeriod::from_millis(*grace_period_ms)
                               : GracePeriod::infinite();
    }
};

// ============================================================================
// [health]
// ============================================================================

struct HealthConfig {
    bool enabled = true;
    std::string address = "0.0.0.0:8081";
};

// ============================================================================
// [logging]
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// StreamgateConfig - Complete parsed configuration
// ============================================================================

struct StreamgateConfig {
    ServerConfig server;
    ShutdownConfig shutdown;
    HealthConfig health;
    LoggingConfig logging;
};

} // namespace streamgate
