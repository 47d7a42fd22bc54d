#include "detection_feed.h"
#include "time_utils.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace assist {

namespace {

constexpr const char* kDetectorSource = "detector";

}  // anonymous namespace

DetectionFeed::DetectionFeed(std::shared_ptr<sightline::MqttClient> mqtt,
                             std::shared_ptr<AlertCoordinator> coordinator,
                             std::shared_ptr<ConnectivityStatus> connectivity,
                             std::chrono::milliseconds inference_interval)
    : mqtt_(std::move(mqtt))
    , coordinator_(std::move(coordinator))
    , connectivity_(std::move(connectivity))
    , inference_interval_(inference_interval)
    , last_batch_(std::chrono::steady_clock::now())
{
}

DetectionFeed::~DetectionFeed() {
    stop();
}

void DetectionFeed::start() {
    if (running_.exchange(true)) return;

    {
        std::lock_guard lock(mutex_);
        last_batch_ = std::chrono::steady_clock::now();
    }
    watchdog_ = std::thread(&DetectionFeed::watchdogLoop, this);

    if (!mqtt_) {
        spdlog::warn("DetectionFeed: MQTT disabled, no detections will arrive");
        return;
    }

    auto topic = mqtt_->topicPrefix() + "/detections";
    mqtt_->subscribe({topic}, [this](const std::string&, const std::string& payload) {
        if (!running_) return;
        handlePayload(payload);
    });

    spdlog::info("DetectionFeed: listening on {}", topic);
}

void DetectionFeed::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();
    spdlog::info("DetectionFeed: stopped after {} batches", batches_.load());
}

std::optional<std::vector<DetectionEvent>> DetectionFeed::parseBatch(
        const std::string& payload, WallClock::time_point received_at) {
    try {
        auto msg = json::parse(payload);
        int frame_width = msg.value("frame_width", 0);
        int frame_height = msg.value("frame_height", 0);
        if (frame_width <= 0 || frame_height <= 0) {
            spdlog::warn("DetectionFeed: batch without frame dimensions");
            return std::nullopt;
        }

        auto timestamp = received_at;
        if (msg.contains("timestamp") && msg["timestamp"].is_string()) {
            if (auto parsed = sightline::time_utils::parse_iso8601(msg["timestamp"].get<std::string>())) {
                timestamp = *parsed;
            }
        }

        std::vector<DetectionEvent> batch;
        for (const auto& det : msg.value("detections", json::array())) {
            auto cls = det.value("class", std::string{});
            if (cls.empty() || !det.contains("bbox")) continue;

            const auto& bbox = det["bbox"];
            batch.push_back(DetectionEvent::fromBox(
                cls, det.value("confidence", 0.0f),
                bbox.value("x1", 0.0f), bbox.value("y1", 0.0f),
                bbox.value("x2", 0.0f), bbox.value("y2", 0.0f),
                frame_width, frame_height, timestamp));
        }
        return batch;
    } catch (const json::exception& e) {
        spdlog::error("DetectionFeed: failed to parse batch: {}", e.what());
        return std::nullopt;
    }
}

bool DetectionFeed::handlePayload(const std::string& payload) {
    auto batch = parseBatch(payload, WallClock::now());
    if (!batch) return false;

    {
        std::lock_guard lock(mutex_);
        last_batch_ = std::chrono::steady_clock::now();
    }
    batches_++;
    connectivity_->markSuccess(kDetectorSource);

    try {
        coordinator_->onDetections(*batch);
    } catch (const std::exception& e) {
        spdlog::error("DetectionFeed: batch processing failed: {}", e.what());
        return false;
    }
    return true;
}

void DetectionFeed::watchdogLoop() {
    auto limit = inference_interval_ * 3;

    std::unique_lock lock(mutex_);
    while (running_) {
        cv_.wait_for(lock, inference_interval_, [this] { return !running_.load(); });
        if (!running_) break;

        auto silent = std::chrono::steady_clock::now() - last_batch_;
        if (silent > limit) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(silent).count();
            lock.unlock();
            connectivity_->markStale(kDetectorSource,
                                     "no detections for " + std::to_string(seconds) + "s");
            lock.lock();
        }
    }
}

}  // namespace assist
