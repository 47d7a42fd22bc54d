#pragma once

#include "config_manager.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <mqtt/async_client.h>

namespace sightline {

/// Paho MQTT async_client wrapper with auto-reconnect.
/// Publishes are fire-and-forget. Subscriptions may be registered before the
/// broker is reachable and are (re)issued on every connect. Retained
/// publishes are cached and replayed on reconnect so subscribers always see
/// the latest safety state, even if it changed while the broker was down.
class MqttClient : public mqtt::callback {
public:
    using MessageCallback = std::function<void(const std::string& topic,
                                               const std::string& payload)>;

    struct Stats {
        uint64_t received = 0;
        uint64_t published = 0;
        uint64_t dropped = 0;   // publish while disconnected (not retained)
    };

    explicit MqttClient(const MqttConfig& config);
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    /// Blocking connect with a 10 s timeout. Failure is logged, not thrown;
    /// the client keeps reconnecting in the background.
    bool connect();

    /// Publishes "offline" to <prefix>/status first
    void disconnect();

    /// Safe from any thread, including Paho callbacks
    void publish(const std::string& topic, const std::string& payload,
                 int qos = 1, bool retain = false);

    /// Exact filters win over wildcard filters when both match a topic
    void subscribe(const std::vector<std::string>& topics,
                   MessageCallback callback, int qos = 1);

    bool isConnected() const;

    Stats stats() const;

    const std::string& topicPrefix() const { return config_.topic_prefix; }

    /// MQTT topic filter match (+ one level, # remainder including the parent)
    static bool topicMatches(const std::string& filter, const std::string& topic);

private:
    struct Subscription {
        std::string filter;
        MessageCallback callback;
        int qos;
    };

    void subscribeAll(bool wait);

    // mqtt::callback overrides (Paho's internal thread)
    void connected(const std::string& cause) override;
    void connection_lost(const std::string& cause) override;
    void message_arrived(mqtt::const_message_ptr msg) override;

    MqttConfig config_;
    std::string status_topic_;
    std::unique_ptr<mqtt::async_client> client_;
    mqtt::connect_options conn_opts_;

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    std::map<std::string, std::string> retained_;   // topic → last payload

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace sightline
