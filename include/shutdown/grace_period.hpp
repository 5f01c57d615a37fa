#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace streamgate {

/**
 * @brief Maximum time to wait for in-flight streams before forcing shutdown
 *
 * Three shapes:
 * - INFINITE: wait for drain forever
 * - ZERO:     force immediately, never wait
 * - BOUNDED:  wait up to duration()
 *
 * bounded(0ms) normalizes to ZERO, so callers only ever branch on kind().
 * Negative durations are rejected at construction.
 */
class GracePeriod {
public:
    enum class Kind : uint8_t {
        INFINITE,
        ZERO,
        BOUNDED
    };

    /// Default: bounded 1 second.
    GracePeriod();

    [[nodiscard]] static GracePeriod infinite();
    [[nodiscard]] static GracePeriod zero();

    /// @throws std::invalid_argument if duration is negative
    [[nodiscard]] static GracePeriod bounded(std::chrono::milliseconds duration);

    /// @throws std::invalid_argument if ms is negative
    [[nodiscard]] static GracePeriod from_millis(int64_t ms);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool is_infinite() const { return kind_ == Kind::INFINITE; }
    [[nodiscard]] bool is_zero() const { return kind_ == Kind::ZERO; }

    /// Zero for ZERO, the bound for BOUNDED, milliseconds::max() for INFINITE.
    [[nodiscard]] std::chrono::milliseconds duration() const { return duration_; }

    /// "infinite", "0ms" or "<n>ms"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const GracePeriod& other) const = default;

private:
    GracePeriod(Kind kind, std::chrono::milliseconds duration)
        : kind_(kind), duration_(duration) {}

    Kind kind_;
    std::chrono::milliseconds duration_;
};

} // namespace streamgate
