#include "health/health_reporter.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace streamgate {

const char* serving_status_to_string(ServingStatus status) {
    switch (status) {
        case ServingStatus::SERVING:         return "SERVING";
        case ServingStatus::NOT_SERVING:     return "NOT_SERVING";
        case ServingStatus::SERVICE_UNKNOWN: return "SERVICE_UNKNOWN";
    }
    return "SERVICE_UNKNOWN";
}

void HealthReporter::set_status(const std::string& service, ServingStatus status) {
    std::unique_lock lock(mutex_);
    statuses_[service] = status;
}

ServingStatus HealthReporter::status(const std::string& service) const {
    std::shared_lock lock(mutex_);
    const auto it = statuses_.find(service);
    return (it != statuses_.end()) ? it->second : ServingStatus::SERVICE_UNKNOWN;
}

void HealthReporter::set_all_not_serving() {
    std::unique_lock lock(mutex_);
    statuses_[""] = ServingStatus::NOT_SERVING;
    for (auto& [service, value] : statuses_) {
        value = ServingStatus::NOT_SERVING;
    }
    utils::log::info(std::format("Health: {} services marked NOT_SERVING", statuses_.size()));
}

std::unordered_map<std::string, ServingStatus> HealthReporter::snapshot() const {
    std::shared_lock lock(mutex_);
    return statuses_;
}

} // namespace streamgate
