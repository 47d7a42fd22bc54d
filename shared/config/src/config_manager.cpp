#include "config_manager.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>

namespace sightline {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) out = node[key].as<T>();
}

}  // anonymous namespace

AppConfig ConfigManager::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    return parse(text);
}

AppConfig ConfigManager::parse(const std::string& yaml_text) {
    AppConfig config;
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid config YAML: ") + e.what());
    }

    try {
        auto api = root["api"];
        read(api, "host", config.api.host);
        read(api, "port", config.api.port);
        read(api, "threads", config.api.threads);

        auto db = root["database"];
        read(db, "enabled", config.database.enabled);
        read(db, "host", config.database.host);
        read(db, "port", config.database.port);
        read(db, "user", config.database.user);
        read(db, "password", config.database.password);
        read(db, "database", config.database.database);
        read(db, "pool_size", config.database.pool_size);

        auto mqtt = root["mqtt"];
        read(mqtt, "enabled", config.mqtt.enabled);
        read(mqtt, "broker", config.mqtt.broker);
        read(mqtt, "port", config.mqtt.port);
        read(mqtt, "username", config.mqtt.username);
        read(mqtt, "password", config.mqtt.password);
        read(mqtt, "topic_prefix", config.mqtt.topic_prefix);
        read(mqtt, "client_id", config.mqtt.client_id);

        auto logging = root["logging"];
        read(logging, "level", config.logging.level);
        read(logging, "file", config.logging.file);
        read(logging, "max_bytes", config.logging.max_bytes);
        read(logging, "backup_count", config.logging.backup_count);

        auto sensors = root["sensors"];
        read(sensors, "enabled", config.sensors.enabled);
        read(sensors, "base_url", config.sensors.base_url);
        read(sensors, "safety_poll_ms", config.sensors.safety_poll_ms);
        read(sensors, "environment_poll_ms", config.sensors.environment_poll_ms);
        read(sensors, "timeout_ms", config.sensors.timeout_ms);
        read(sensors, "max_backoff_ms", config.sensors.max_backoff_ms);
        read(sensors, "forward_acknowledge", config.sensors.forward_acknowledge);

        auto detection = root["detection"];
        read(detection, "classes", config.detection.classes);
        read(detection, "classes_file", config.detection.classes_file);
        read(detection, "inference_interval_ms", config.detection.inference_interval_ms);
        read(detection, "critical_threshold", config.detection.critical_threshold);
        read(detection, "warning_threshold", config.detection.warning_threshold);
        read(detection, "left_boundary", config.detection.left_boundary);
        read(detection, "right_boundary", config.detection.right_boundary);

        auto alerts = root["alerts"];
        read(alerts, "cooldown_seconds", config.alerts.cooldown_seconds);
        read(alerts, "escalation_bypasses_cooldown", config.alerts.escalation_bypasses_cooldown);
        read(alerts, "queue_capacity", config.alerts.queue_capacity);

        auto speech = root["speech"];
        read(speech, "enabled", config.speech.enabled);
        read(speech, "tts_endpoint", config.speech.tts_endpoint);
        read(speech, "stt_endpoint", config.speech.stt_endpoint);
        read(speech, "voice", config.speech.voice);
        read(speech, "tts_timeout_seconds", config.speech.tts_timeout_seconds);
        read(speech, "stt_timeout_seconds", config.speech.stt_timeout_seconds);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid config value: ") + e.what());
    }

    validate(config);
    return config;
}

void ConfigManager::validate(const AppConfig& config) {
    const auto& d = config.detection;
    if (!(d.warning_threshold > 0.0 && d.warning_threshold < d.critical_threshold
          && d.critical_threshold <= 1.0)) {
        throw std::runtime_error("detection thresholds must satisfy 0 < warning < critical <= 1");
    }
    if (!(d.left_boundary > 0.0 && d.left_boundary < d.right_boundary
          && d.right_boundary < 1.0)) {
        throw std::runtime_error("direction boundaries must satisfy 0 < left < right < 1");
    }
    if (d.inference_interval_ms <= 0) {
        throw std::runtime_error("detection.inference_interval_ms must be positive");
    }
    if (config.alerts.cooldown_seconds < 0) {
        throw std::runtime_error("alerts.cooldown_seconds must not be negative");
    }
    if (config.alerts.queue_capacity == 0) {
        throw std::runtime_error("alerts.queue_capacity must be positive");
    }
    const auto& s = config.sensors;
    if (s.safety_poll_ms <= 0 || s.environment_poll_ms <= 0 || s.timeout_ms <= 0) {
        throw std::runtime_error("sensor poll intervals and timeout must be positive");
    }
    if (s.max_backoff_ms < s.safety_poll_ms) {
        throw std::runtime_error("sensors.max_backoff_ms must be >= sensors.safety_poll_ms");
    }
    if (config.api.port <= 0 || config.api.port > 65535) {
        throw std::runtime_error("api.port out of range");
    }
}

std::vector<std::string> ConfigManager::resolveClasses(const DetectionConfig& detection) {
    std::vector<std::string> classes;

    if (!detection.classes.empty()) {
        classes = detection.classes;
    } else if (!detection.classes_file.empty()) {
        std::ifstream file(detection.classes_file);
        if (!file) {
            throw std::runtime_error("cannot open class list: " + detection.classes_file);
        }
        std::string line;
        while (std::getline(file, line)) {
            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] == '#') continue;
            auto last = line.find_last_not_of(" \t\r");
            classes.push_back(line.substr(first, last - first + 1));
        }
    }

    if (classes.empty()) {
        throw std::runtime_error("no relevant object classes configured");
    }
    return classes;
}

}  // namespace sightline
