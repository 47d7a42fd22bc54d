#pragma once

#include "alert_coordinator.h"
#include "connectivity_status.h"
#include "mqtt_client.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace assist {

/// Detection batches from the external detector over MQTT
/// (<prefix>/detections). A watchdog thread marks the detector source
/// degraded when no batch has arrived for three inference intervals.
class DetectionFeed {
public:
    DetectionFeed(std::shared_ptr<sightline::MqttClient> mqtt,
                  std::shared_ptr<AlertCoordinator> coordinator,
                  std::shared_ptr<ConnectivityStatus> connectivity,
                  std::chrono::milliseconds inference_interval);
    ~DetectionFeed();

    DetectionFeed(const DetectionFeed&) = delete;
    DetectionFeed& operator=(const DetectionFeed&) = delete;

    void start();
    void stop();

    /// Parse and dispatch one payload. Returns false if malformed.
    bool handlePayload(const std::string& payload);

    /// {frame_width, frame_height, detections:[{class, confidence, bbox:{x1,y1,x2,y2}}]}
    static std::optional<std::vector<DetectionEvent>> parseBatch(const std::string& payload,
                                                                 WallClock::time_point received_at);

    uint64_t batchesReceived() const { return batches_; }

private:
    void watchdogLoop();

    std::shared_ptr<sightline::MqttClient> mqtt_;
    std::shared_ptr<AlertCoordinator> coordinator_;
    std::shared_ptr<ConnectivityStatus> connectivity_;
    std::chrono::milliseconds inference_interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::steady_clock::time_point last_batch_;

    std::atomic<uint64_t> batches_{0};
    std::thread watchdog_;
    std::atomic<bool> running_{false};
};

}  // namespace assist
