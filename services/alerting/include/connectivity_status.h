#pragma once

#include "alert_types.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace assist {

/// Per-source health of the external inputs (sensor endpoints, detector
/// feed). Failures degrade a source; they never touch safety state.
class ConnectivityStatus {
public:
    struct Source {
        bool degraded = false;
        int consecutive_failures = 0;
        std::string last_error;
        std::optional<WallClock::time_point> last_success;
        std::optional<WallClock::time_point> last_failure;
    };

    void markSuccess(const std::string& source, WallClock::time_point at = WallClock::now());
    void markFailure(const std::string& source, const std::string& error,
                     WallClock::time_point at = WallClock::now());

    /// Degraded without a new failure, e.g. a silent feed
    void markStale(const std::string& source, const std::string& reason);

    bool degraded() const;
    bool degraded(const std::string& source) const;

    std::map<std::string, Source> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Source> sources_;
};

}  // namespace assist
