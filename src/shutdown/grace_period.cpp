#include "shutdown/grace_period.hpp"

#include <format>
#include <stdexcept>

namespace streamgate {

GracePeriod::GracePeriod()
    : kind_(Kind::BOUNDED), duration_(std::chrono::milliseconds{1000}) {}

GracePeriod GracePeriod::infinite() {
    return {Kind::INFINITE, std::chrono::milliseconds::max()};
}

GracePeriod GracePeriod::zero() {
    return {Kind::ZERO, std::chrono::milliseconds{0}};
}

GracePeriod GracePeriod::bounded(std::chrono::milliseconds duration) {
    if (duration.count() < 0) {
        throw std::invalid_argument(
            std::format("grace period must not be negative, got {}ms", duration.count()));
    }
    if (duration.count() == 0) {
        return zero();
    }
    return {Kind::BOUNDED, duration};
}

GracePeriod GracePeriod::from_millis(int64_t ms) {
    return bounded(std::chrono::milliseconds{ms});
}

std::string GracePeriod::to_string() const {
    switch (kind_) {
        case Kind::INFINITE: return "infinite";
        case Kind::ZERO:     return "0ms";
        case Kind::BOUNDED:  return std::format("{}ms", duration_.count());
    }
    return "unknown";
}

} // namespace streamgate
