#pragma once

#include "alert_aggregator.h"
#include "alert_types.h"
#include "cooldown_tracker.h"
#include "mqtt_client.h"
#include "persistence_sink.h"
#include "proximity_classifier.h"
#include "safety_monitor.h"

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace assist {

/// Alert pipeline orchestration: detections → classify → cooldown →
/// aggregator, safety raises and acknowledgements → monitor → aggregator.
/// Every path records through the PersistenceSink. A per-type lock makes a
/// safety transition and its enqueue atomic; no lock is held across I/O.
class AlertCoordinator {
public:
    struct BatchResult {
        size_t classified = 0;
        size_t announced = 0;
        size_t suppressed = 0;
        size_t far = 0;
    };

    using AcknowledgeListener = std::function<void(SafetyType)>;

    AlertCoordinator(ProximityClassifier classifier,
                     std::shared_ptr<CooldownTracker> cooldown,
                     std::shared_ptr<SafetyMonitor> monitor,
                     std::shared_ptr<AlertAggregator> aggregator,
                     std::shared_ptr<PersistenceSink> sink,
                     std::shared_ptr<sightline::MqttClient> mqtt = nullptr);
    ~AlertCoordinator();

    AlertCoordinator(const AlertCoordinator&) = delete;
    AlertCoordinator& operator=(const AlertCoordinator&) = delete;

    /// Subscribe to caregiver acknowledge topics
    void start();
    void stop();

    /// Called after every successful acknowledge (e.g. to clear the flag on
    /// the sensor service). Set before start().
    void setAcknowledgeListener(AcknowledgeListener listener);

    /// One inference cycle. Far objects and cooldown rejections are recorded
    /// as detections but not announced.
    BatchResult onDetections(const std::vector<DetectionEvent>& batch);

    /// True if this produced a new incident (announced + recorded)
    bool raiseSafety(SafetyType type, std::optional<AssistanceKind> assistance = std::nullopt,
                     WallClock::time_point at = WallClock::now());

    /// Idempotent. True if the event was Active and is now Acknowledged.
    bool acknowledge(SafetyType type, WallClock::time_point at = WallClock::now());

    /// Classified objects of the most recent batch
    std::vector<ProximityEvent> latestScene() const;
    std::optional<WallClock::time_point> latestSceneTime() const;

    std::shared_ptr<SafetyMonitor> monitor() const { return monitor_; }
    std::shared_ptr<AlertAggregator> aggregator() const { return aggregator_; }
    std::shared_ptr<PersistenceSink> sink() const { return sink_; }

private:
    void publishSafetyState(SafetyType type);
    std::mutex& transitionMutex(SafetyType type);

    ProximityClassifier classifier_;
    std::shared_ptr<CooldownTracker> cooldown_;
    std::shared_ptr<SafetyMonitor> monitor_;
    std::shared_ptr<AlertAggregator> aggregator_;
    std::shared_ptr<PersistenceSink> sink_;
    std::shared_ptr<sightline::MqttClient> mqtt_;
    AcknowledgeListener on_acknowledge_;

    std::array<std::mutex, 3> transition_mutexes_;   // one per SafetyType

    mutable std::mutex scene_mutex_;
    std::vector<ProximityEvent> scene_;
    std::optional<WallClock::time_point> scene_time_;

    std::atomic<bool> running_{false};
};

}  // namespace assist
