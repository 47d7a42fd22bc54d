#pragma once

#include "alert_types.h"

#include <chrono>
#include <mutex>
#include <unordered_map>

namespace assist {

/// Suppresses repeat proximity alerts per AlertKey within a cooldown window.
/// A single exclusive lock covers the map; admit() is called from the
/// detection path, size()/clear() from diagnostics and tests.
class CooldownTracker {
public:
    using Duration = std::chrono::duration<double>;

    explicit CooldownTracker(Duration window = std::chrono::seconds(3),
                             bool escalation_bypass = false);

    /// True iff no prior admission exists for the key or at least `window`
    /// has elapsed since it (measured on event timestamps; a timestamp earlier
    /// than the stamp counts as elapsed). With escalation bypass enabled, a
    /// strictly more severe zone is also admitted.
    /// Admission stamps the key; rejections leave it unchanged.
    bool admit(const ProximityEvent& event);

    size_t size() const;
    void clear();

    Duration window() const { return window_; }
    bool escalationBypass() const { return escalation_bypass_; }

private:
    struct Entry {
        WallClock::time_point admitted_at;
        ProximityZone zone;
    };

    Duration window_;
    bool escalation_bypass_;

    mutable std::mutex mutex_;
    std::unordered_map<AlertKey, Entry, AlertKeyHash> last_admitted_;
};

}  // namespace assist
