#include "connectivity_status.h"

#include <spdlog/spdlog.h>

namespace assist {

void ConnectivityStatus::markSuccess(const std::string& source, WallClock::time_point at) {
    std::lock_guard lock(mutex_);
    auto& s = sources_[source];
    if (s.degraded) {
        spdlog::info("Connectivity: {} recovered after {} failure(s)", source,
                     s.consecutive_failures);
    }
    s.degraded = false;
    s.consecutive_failures = 0;
    s.last_error.clear();
    s.last_success = at;
}

void ConnectivityStatus::markFailure(const std::string& source, const std::string& error,
                                     WallClock::time_point at) {
    std::lock_guard lock(mutex_);
    auto& s = sources_[source];
    if (!s.degraded) {
        spdlog::warn("Connectivity: {} degraded: {}", source, error);
    }
    s.degraded = true;
    s.consecutive_failures++;
    s.last_error = error;
    s.last_failure = at;
}

void ConnectivityStatus::markStale(const std::string& source, const std::string& reason) {
    std::lock_guard lock(mutex_);
    auto& s = sources_[source];
    if (!s.degraded) {
        spdlog::warn("Connectivity: {} stale: {}", source, reason);
    }
    s.degraded = true;
    s.last_error = reason;
}

bool ConnectivityStatus::degraded() const {
    std::lock_guard lock(mutex_);
    for (const auto& [name, s] : sources_) {
        if (s.degraded) return true;
    }
    return false;
}

bool ConnectivityStatus::degraded(const std::string& source) const {
    std::lock_guard lock(mutex_);
    auto it = sources_.find(source);
    return it != sources_.end() && it->second.degraded;
}

std::map<std::string, ConnectivityStatus::Source> ConnectivityStatus::snapshot() const {
    std::lock_guard lock(mutex_);
    return sources_;
}

}  // namespace assist
