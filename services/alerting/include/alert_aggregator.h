#pragma once

#include "alert_types.h"
#include "persistence_sink.h"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace assist {

/// Single severity-ordered alert stream for the Announcer.
///
/// publish() queues the alert, then records it through the PersistenceSink
/// and notifies listeners. Rejected alerts (closed, or full of higher-ranked
/// items) are neither recorded nor broadcast. The queue is kept sorted by rank; a new item is
/// inserted after every queued item of equal or higher rank, so ties stay
/// FIFO and a higher-severity arrival is promoted ahead of lower-severity
/// items still waiting. The item handed out by next() is in flight until
/// complete() and is never reordered or interrupted.
class AlertAggregator {
public:
    using Listener = std::function<void(const Alert&)>;

    struct Stats {
        uint64_t published = 0;
        uint64_t dropped_far = 0;
        uint64_t evicted = 0;
        uint64_t superseded = 0;
        uint64_t delivered = 0;
    };

    explicit AlertAggregator(std::shared_ptr<PersistenceSink> sink = nullptr,
                             size_t capacity = 32);

    AlertAggregator(const AlertAggregator&) = delete;
    AlertAggregator& operator=(const AlertAggregator&) = delete;

    /// Called for every recorded alert (proximity and safety). Register
    /// before producers start.
    void addListener(Listener listener);

    /// Non-blocking. Far-zone alerts are never queued. Returns true if queued.
    bool publish(Alert alert);

    /// Immediate spoken reply to a voice command. Outranks every queued alert
    /// but waits for the current utterance. Not recorded as an alert.
    bool publishResponse(const std::string& text);

    /// Blocks until an item is available or close() is called. Returns
    /// nullopt once closed.
    std::optional<Alert> next();

    /// Non-blocking variant of next()
    std::optional<Alert> tryNext();

    /// Marks the in-flight item as spoken
    void complete();

    /// Drop queued (not yet spoken) raise alerts of this type. Used when the
    /// event is acknowledged before its raise was announced. Returns count.
    size_t supersede(SafetyType type);

    /// Wakes next() and rejects further publishes
    void close();

    bool closed() const;
    size_t pending() const;
    std::optional<Alert> inFlight() const;

    /// Queued alerts in delivery order
    std::vector<Alert> snapshot() const;

    /// Most recent alert announced or queued, for "repeat"
    std::optional<Alert> lastAlert() const;

    Stats stats() const;

private:
    bool enqueueLocked(Alert alert);

    std::shared_ptr<PersistenceSink> sink_;
    size_t capacity_;
    std::vector<Listener> listeners_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Alert> queue_;          // sorted by rank desc, then sequence
    std::optional<Alert> in_flight_;
    std::optional<Alert> last_alert_;
    uint64_t next_sequence_ = 1;
    bool closed_ = false;
    Stats stats_;
};

}  // namespace assist
