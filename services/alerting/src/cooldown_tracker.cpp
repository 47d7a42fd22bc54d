#include "cooldown_tracker.h"

#include <spdlog/spdlog.h>

namespace assist {

CooldownTracker::CooldownTracker(Duration window, bool escalation_bypass)
    : window_(window)
    , escalation_bypass_(escalation_bypass)
{
}

bool CooldownTracker::admit(const ProximityEvent& event) {
    AlertKey key{event.object_type, event.direction};

    std::lock_guard lock(mutex_);
    auto it = last_admitted_.find(key);
    if (it == last_admitted_.end()) {
        last_admitted_.emplace(std::move(key), Entry{event.timestamp, event.zone});
        return true;
    }

    auto elapsed = std::chrono::duration_cast<Duration>(event.timestamp - it->second.admitted_at);
    // A clock step backwards restarts the window instead of muting the key
    bool expired = elapsed >= window_ || elapsed < Duration::zero();
    bool escalated = escalation_bypass_ && event.zone > it->second.zone;

    if (!expired && !escalated) {
        spdlog::debug("Cooldown: suppressed {} {} ({:.1f}s since last)",
                      event.object_type, toString(event.direction), elapsed.count());
        return false;
    }

    it->second = Entry{event.timestamp, event.zone};
    return true;
}

size_t CooldownTracker::size() const {
    std::lock_guard lock(mutex_);
    return last_admitted_.size();
}

void CooldownTracker::clear() {
    std::lock_guard lock(mutex_);
    last_admitted_.clear();
}

}  // namespace assist
