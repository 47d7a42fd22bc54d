#include "mqtt_client.h"

#include <spdlog/spdlog.h>

#include <string_view>
#include <unistd.h>

namespace sightline {

namespace {

std::vector<std::string_view> levels(std::string_view s) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        auto slash = s.find('/', start);
        out.push_back(s.substr(start, slash == std::string_view::npos ? slash : slash - start));
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return out;
}

bool hasWildcard(const std::string& filter) {
    return filter.find_first_of("+#") != std::string::npos;
}

}  // anonymous namespace

MqttClient::MqttClient(const MqttConfig& config)
    : config_(config)
    , status_topic_(config.topic_prefix + "/status")
{
    std::string broker_uri = "tcp://" + config_.broker + ":" + std::to_string(config_.port);
    std::string client_id = config_.client_id + "_" + std::to_string(::getpid());

    client_ = std::make_unique<mqtt::async_client>(broker_uri, client_id);
    client_->set_callback(*this);

    // Dashboards watch <prefix>/status; the broker flips it if we die
    mqtt::will_options will(status_topic_, std::string("offline"), 1, true);

    conn_opts_ = mqtt::connect_options_builder()
        .automatic_reconnect(std::chrono::seconds(1), std::chrono::seconds(30))
        .clean_session(true)
        .keep_alive_interval(std::chrono::seconds(30))
        .connect_timeout(std::chrono::seconds(10))
        .will(std::move(will))
        .finalize();

    if (!config_.username.empty()) {
        conn_opts_.set_user_name(config_.username);
        conn_opts_.set_password(config_.password);
    }
}

MqttClient::~MqttClient() {
    disconnect();
}

bool MqttClient::connect() {
    try {
        spdlog::info("MQTT: connecting to {}:{} as {}", config_.broker, config_.port,
                     client_->get_client_id());
        client_->connect(conn_opts_)->wait_for(std::chrono::seconds(10));
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: connect failed: {} (retrying in background)", e.what());
        return false;
    }

    if (!client_->is_connected()) {
        spdlog::warn("MQTT: broker not reachable yet (retrying in background)");
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (!client_ || !client_->is_connected()) return;

    try {
        client_->publish(status_topic_, std::string("offline"), 1, true)
            ->wait_for(std::chrono::seconds(2));
        client_->disconnect()->wait_for(std::chrono::seconds(2));
        spdlog::info("MQTT: disconnected ({} received, {} published, {} dropped)",
                     received_.load(), published_.load(), dropped_.load());
    } catch (const mqtt::exception& e) {
        spdlog::debug("MQTT: disconnect error: {}", e.what());
    }
}

void MqttClient::publish(const std::string& topic, const std::string& payload,
                         int qos, bool retain) {
    if (retain) {
        std::lock_guard lock(mutex_);
        retained_[topic] = payload;
    }

    if (!client_ || !client_->is_connected()) {
        if (!retain) dropped_++;
        return;
    }

    try {
        client_->publish(topic, payload.data(), payload.size(), qos, retain);
        published_++;
    } catch (const mqtt::exception& e) {
        dropped_++;
        spdlog::debug("MQTT: publish to {} failed: {}", topic, e.what());
    }
}

void MqttClient::subscribe(const std::vector<std::string>& topics,
                           MessageCallback callback, int qos) {
    {
        std::lock_guard lock(mutex_);
        for (const auto& topic : topics) {
            subscriptions_.push_back({topic, callback, qos});
        }
    }

    if (!isConnected()) {
        for (const auto& t : topics) {
            spdlog::info("MQTT: {} registered, subscribing once connected", t);
        }
        return;
    }

    try {
        auto filters = mqtt::string_collection::create(topics);
        std::vector<int> qos_levels(topics.size(), qos);
        client_->subscribe(filters, qos_levels)->wait_for(std::chrono::seconds(5));
        for (const auto& t : topics) {
            spdlog::info("MQTT: subscribed to {}", t);
        }
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: subscribe failed: {}", e.what());
    }
}

bool MqttClient::isConnected() const {
    return client_ && client_->is_connected();
}

MqttClient::Stats MqttClient::stats() const {
    return {received_.load(), published_.load(), dropped_.load()};
}

void MqttClient::subscribeAll(bool wait) {
    std::vector<std::string> filters;
    std::vector<int> qos_levels;
    {
        std::lock_guard lock(mutex_);
        for (const auto& sub : subscriptions_) {
            filters.push_back(sub.filter);
            qos_levels.push_back(sub.qos);
        }
    }
    if (filters.empty()) return;

    try {
        auto tok = client_->subscribe(mqtt::string_collection::create(filters), qos_levels);
        if (wait) tok->wait_for(std::chrono::seconds(5));
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: re-subscribe failed: {}", e.what());
    }
}

void MqttClient::connected(const std::string& cause) {
    spdlog::info("MQTT: connected ({})", cause.empty() ? "initial" : cause);

    // No token waits on Paho's callback thread
    subscribeAll(false);

    std::map<std::string, std::string> retained;
    {
        std::lock_guard lock(mutex_);
        retained = retained_;
    }
    try {
        client_->publish(status_topic_, std::string("online"), 1, true);
        for (const auto& [topic, payload] : retained) {
            client_->publish(topic, payload.data(), payload.size(), 1, true);
        }
    } catch (const mqtt::exception& e) {
        spdlog::warn("MQTT: replaying retained state failed: {}", e.what());
    }
    if (!retained.empty()) {
        spdlog::info("MQTT: replayed {} retained topic(s)", retained.size());
    }
}

void MqttClient::connection_lost(const std::string& cause) {
    spdlog::warn("MQTT: connection lost: {} (reconnecting)", cause.empty() ? "unknown" : cause);
}

void MqttClient::message_arrived(mqtt::const_message_ptr msg) {
    const auto& topic = msg->get_topic();
    received_++;

    // Run the handler outside the lock so it may publish or subscribe
    MessageCallback handler;
    {
        std::lock_guard lock(mutex_);
        const Subscription* best = nullptr;
        for (const auto& sub : subscriptions_) {
            if (!topicMatches(sub.filter, topic)) continue;
            if (!best || (hasWildcard(best->filter) && !hasWildcard(sub.filter))) best = &sub;
        }
        if (best) handler = best->callback;
    }
    if (!handler) {
        spdlog::debug("MQTT: no handler for {}", topic);
        return;
    }

    try {
        handler(topic, msg->get_payload_str());
    } catch (const std::exception& e) {
        spdlog::error("MQTT: handler error for {}: {}", topic, e.what());
    }
}

bool MqttClient::topicMatches(const std::string& filter, const std::string& topic) {
    auto f = levels(filter);
    auto t = levels(topic);

    for (size_t i = 0; i < f.size(); ++i) {
        if (f[i] == "#") return true;   // also matches the parent level
        if (i >= t.size()) return false;
        if (f[i] != "+" && f[i] != t[i]) return false;
    }
    return f.size() == t.size();
}

}  // namespace sightline
