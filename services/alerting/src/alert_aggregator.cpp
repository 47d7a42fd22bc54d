#include "alert_aggregator.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace assist {

AlertAggregator::AlertAggregator(std::shared_ptr<PersistenceSink> sink, size_t capacity)
    : sink_(std::move(sink))
    , capacity_(capacity > 0 ? capacity : 1)
{
}

void AlertAggregator::addListener(Listener listener) {
    listeners_.push_back(std::move(listener));
}

bool AlertAggregator::publish(Alert alert) {
    if (alert.category == AlertCategory::Response) {
        return publishResponse(alert.message);
    }

    if (alert.category == AlertCategory::Proximity && alert.zone == ProximityZone::Far) {
        std::lock_guard lock(mutex_);
        stats_.dropped_far++;
        return false;
    }

    bool queued;
    {
        std::lock_guard lock(mutex_);
        queued = enqueueLocked(alert);
        if (queued) {
            stats_.published++;
            last_alert_ = alert;
        }
    }
    if (!queued) return false;
    cv_.notify_one();

    // Only alerts that will be announced are recorded and fanned out
    if (sink_) sink_->recordAlert(alert);
    for (const auto& listener : listeners_) {
        try {
            listener(alert);
        } catch (const std::exception& e) {
            spdlog::error("Aggregator: listener failed: {}", e.what());
        }
    }
    return true;
}

bool AlertAggregator::publishResponse(const std::string& text) {
    bool queued;
    {
        std::lock_guard lock(mutex_);
        queued = enqueueLocked(Alert::response(text));
    }
    if (queued) cv_.notify_one();
    return queued;
}

bool AlertAggregator::enqueueLocked(Alert alert) {
    if (closed_) {
        spdlog::debug("Aggregator: closed, not queueing '{}'", alert.message);
        return false;
    }

    alert.sequence = next_sequence_++;
    int rank = alert.rank();

    if (queue_.size() >= capacity_) {
        // Evict the newest of the lowest-ranked proximity items; safety and
        // response items are never evicted.
        auto victim = queue_.end();
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (it->category != AlertCategory::Proximity) continue;
            if (victim == queue_.end() || it->rank() <= victim->rank()) victim = it;
        }

        bool incoming_is_proximity = alert.category == AlertCategory::Proximity;
        if (victim == queue_.end() || (incoming_is_proximity && rank <= victim->rank())) {
            if (incoming_is_proximity) {
                stats_.evicted++;
                spdlog::warn("Aggregator: queue full, dropping '{}'", alert.message);
                return false;
            }
        } else {
            spdlog::warn("Aggregator: queue full, evicting '{}'", victim->message);
            queue_.erase(victim);
            stats_.evicted++;
        }
    }

    // Insert before the first strictly lower rank: FIFO within a rank,
    // promotion ahead of lower ranks
    auto pos = std::find_if(queue_.begin(), queue_.end(),
                            [rank](const Alert& queued) { return queued.rank() < rank; });
    queue_.insert(pos, std::move(alert));
    return true;
}

std::optional<Alert> AlertAggregator::next() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (closed_) return std::nullopt;

    in_flight_ = std::move(queue_.front());
    queue_.erase(queue_.begin());
    stats_.delivered++;
    return in_flight_;
}

std::optional<Alert> AlertAggregator::tryNext() {
    std::lock_guard lock(mutex_);
    if (closed_ || queue_.empty()) return std::nullopt;

    in_flight_ = std::move(queue_.front());
    queue_.erase(queue_.begin());
    stats_.delivered++;
    return in_flight_;
}

void AlertAggregator::complete() {
    std::lock_guard lock(mutex_);
    in_flight_.reset();
}

size_t AlertAggregator::supersede(SafetyType type) {
    std::lock_guard lock(mutex_);
    auto removed = std::remove_if(queue_.begin(), queue_.end(), [type](const Alert& a) {
        return a.category == AlertCategory::Safety && a.safety_type == type &&
               a.transition == SafetyTransitionKind::Raised;
    });
    size_t count = static_cast<size_t>(std::distance(removed, queue_.end()));
    queue_.erase(removed, queue_.end());
    stats_.superseded += count;
    if (count > 0) {
        spdlog::info("Aggregator: superseded {} queued {} alert(s)", count, toString(type));
    }
    return count;
}

void AlertAggregator::close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    cv_.notify_all();
    spdlog::info("Aggregator: closed");
}

bool AlertAggregator::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t AlertAggregator::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::optional<Alert> AlertAggregator::inFlight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

std::vector<Alert> AlertAggregator::snapshot() const {
    std::lock_guard lock(mutex_);
    return queue_;
}

std::optional<Alert> AlertAggregator::lastAlert() const {
    std::lock_guard lock(mutex_);
    return last_alert_;
}

AlertAggregator::Stats AlertAggregator::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace assist
