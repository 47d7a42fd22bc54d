#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sightline {

struct ApiConfig {
    std::string host = "0.0.0.0";
    int port = 5001;
    int threads = 2;
};

struct DatabaseConfig {
    bool enabled = true;
    std::string host = "localhost";
    int port = 5432;
    std::string user = "sightline";
    std::string password;
    std::string database = "sightline";
    int pool_size = 2;
};

struct MqttConfig {
    bool enabled = true;
    std::string broker = "localhost";
    int port = 1883;
    std::string username;
    std::string password;
    std::string topic_prefix = "sightline";
    std::string client_id = "sightline_alerts";
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
    size_t max_bytes = 10 * 1024 * 1024;
    size_t backup_count = 3;
};

/// Pi sensor service polled for safety and environmental readings
struct SensorConfig {
    bool enabled = true;
    std::string base_url = "http://127.0.0.1:5000";
    int safety_poll_ms = 2000;
    int environment_poll_ms = 30000;
    int timeout_ms = 2000;
    int max_backoff_ms = 30000;
    bool forward_acknowledge = true;
};

struct DetectionConfig {
    std::vector<std::string> classes;
    std::string classes_file;
    int inference_interval_ms = 5000;
    double critical_threshold = 0.60;
    double warning_threshold = 0.40;
    double left_boundary = 0.33;
    double right_boundary = 0.67;
};

struct AlertConfig {
    double cooldown_seconds = 3.0;
    bool escalation_bypasses_cooldown = false;
    size_t queue_capacity = 32;
};

struct SpeechConfig {
    bool enabled = false;
    std::string tts_endpoint = "http://127.0.0.1:5002/speak";
    std::string stt_endpoint = "http://127.0.0.1:5002/listen";
    std::string voice;
    int tts_timeout_seconds = 20;
    int stt_timeout_seconds = 15;
};

struct AppConfig {
    ApiConfig api;
    DatabaseConfig database;
    MqttConfig mqtt;
    LoggingConfig logging;
    SensorConfig sensors;
    DetectionConfig detection;
    AlertConfig alerts;
    SpeechConfig speech;
};

/// YAML configuration loader. Throws std::runtime_error on unreadable files,
/// malformed YAML, or values that fail validation.
struct ConfigManager {
    static AppConfig load(const std::string& path);

    static AppConfig parse(const std::string& yaml_text);

    static void validate(const AppConfig& config);

    /// Relevant object classes: inline list, else one class per line from
    /// classes_file. Throws if the result is empty or the file is unreadable.
    static std::vector<std::string> resolveClasses(const DetectionConfig& detection);
};

}  // namespace sightline
