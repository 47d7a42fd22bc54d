#include "alert_coordinator.h"
#include "api_json.h"

#include <spdlog/spdlog.h>

namespace assist {

AlertCoordinator::AlertCoordinator(ProximityClassifier classifier,
                                   std::shared_ptr<CooldownTracker> cooldown,
                                   std::shared_ptr<SafetyMonitor> monitor,
                                   std::shared_ptr<AlertAggregator> aggregator,
                                   std::shared_ptr<PersistenceSink> sink,
                                   std::shared_ptr<sightline::MqttClient> mqtt)
    : classifier_(std::move(classifier))
    , cooldown_(std::move(cooldown))
    , monitor_(std::move(monitor))
    , aggregator_(std::move(aggregator))
    , sink_(std::move(sink))
    , mqtt_(std::move(mqtt))
{
    if (mqtt_) {
        auto mqtt = mqtt_;
        aggregator_->addListener([mqtt](const Alert& alert) {
            mqtt->publish(mqtt->topicPrefix() + "/alert", api_json::alert(alert).dump());
        });
    }
}

AlertCoordinator::~AlertCoordinator() {
    stop();
}

void AlertCoordinator::setAcknowledgeListener(AcknowledgeListener listener) {
    on_acknowledge_ = std::move(listener);
}

void AlertCoordinator::start() {
    running_ = true;

    if (!mqtt_) {
        spdlog::info("AlertCoordinator: MQTT disabled, acknowledge over HTTP only");
        return;
    }

    auto prefix = mqtt_->topicPrefix();
    mqtt_->subscribe({prefix + "/safety/+/acknowledge"},
                     [this, prefix](const std::string& topic, const std::string&) {
        if (!running_) return;

        // <prefix>/safety/<type>/acknowledge
        auto start = prefix.size() + std::string("/safety/").size();
        auto end = topic.find('/', start);
        if (end == std::string::npos) return;

        auto type = parseSafetyType(topic.substr(start, end - start));
        if (!type) {
            spdlog::warn("AlertCoordinator: acknowledge for unknown type on {}", topic);
            return;
        }
        acknowledge(*type);
    });

    for (auto type : {SafetyType::Fall, SafetyType::Emergency, SafetyType::Assistance}) {
        publishSafetyState(type);
    }

    spdlog::info("AlertCoordinator: started, listening on {}/safety/+/acknowledge", prefix);
}

void AlertCoordinator::stop() {
    if (!running_.exchange(false)) return;
    spdlog::info("AlertCoordinator: stopped");
}

AlertCoordinator::BatchResult AlertCoordinator::onDetections(
        const std::vector<DetectionEvent>& batch) {
    BatchResult result;
    std::vector<ProximityEvent> scene;
    WallClock::time_point batch_time = WallClock::now();

    for (const auto& detection : batch) {
        auto event = classifier_.classify(detection);
        if (!event) continue;

        result.classified++;
        batch_time = event->timestamp;
        scene.push_back(*event);

        if (event->zone == ProximityZone::Far) {
            result.far++;
            sink_->recordDetection(*event, false);
            continue;
        }

        if (!cooldown_->admit(*event)) {
            result.suppressed++;
            sink_->recordDetection(*event, false);
            continue;
        }

        bool queued = aggregator_->publish(Alert::proximity(*event));
        sink_->recordDetection(*event, queued);
        if (queued) result.announced++;
    }

    {
        std::lock_guard lock(scene_mutex_);
        scene_ = std::move(scene);
        scene_time_ = batch_time;
    }

    if (result.announced > 0) {
        spdlog::info("AlertCoordinator: {} object(s), {} announced, {} suppressed, {} far",
                     result.classified, result.announced, result.suppressed, result.far);
    }
    return result;
}

bool AlertCoordinator::raiseSafety(SafetyType type, std::optional<AssistanceKind> assistance,
                                   WallClock::time_point at) {
    // Transition and enqueue are one step per type, so an acknowledgement
    // can never be queued ahead of the raise it answers
    std::lock_guard lock(transitionMutex(type));
    auto transition = monitor_->raise(type, assistance, at);
    if (!transition) return false;

    aggregator_->publish(Alert::safety(type, transition->kind, transition->assistance,
                                       transition->at));
    publishSafetyState(type);
    return true;
}

bool AlertCoordinator::acknowledge(SafetyType type, WallClock::time_point at) {
    {
        std::lock_guard lock(transitionMutex(type));
        auto transition = monitor_->acknowledge(type, at);
        if (!transition) return false;

        // A raise still waiting in the queue is stale once acknowledged
        aggregator_->supersede(type);
        aggregator_->publish(Alert::safety(type, transition->kind, transition->assistance,
                                           transition->at));
        publishSafetyState(type);
    }

    if (on_acknowledge_) on_acknowledge_(type);
    return true;
}

std::mutex& AlertCoordinator::transitionMutex(SafetyType type) {
    return transition_mutexes_[static_cast<size_t>(type)];
}

void AlertCoordinator::publishSafetyState(SafetyType type) {
    if (!mqtt_) return;
    mqtt_->publish(mqtt_->topicPrefix() + "/safety/" + toString(type),
                   api_json::safetyState(monitor_->snapshot(type)).dump(), 1, true);
}

std::vector<ProximityEvent> AlertCoordinator::latestScene() const {
    std::lock_guard lock(scene_mutex_);
    return scene_;
}

std::optional<WallClock::time_point> AlertCoordinator::latestSceneTime() const {
    std::lock_guard lock(scene_mutex_);
    return scene_time_;
}

}  // namespace assist
