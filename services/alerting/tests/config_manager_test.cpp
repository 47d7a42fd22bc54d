#include <catch2/catch_all.hpp>
#include "config_manager.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace sightline;

namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}  // namespace

TEST_CASE("ConfigManager::parse uses defaults for an empty document", "[config]") {
    auto config = ConfigManager::parse("{}");
    CHECK(config.api.port == 5001);
    CHECK(config.alerts.cooldown_seconds == Catch::Approx(3.0));
    CHECK_FALSE(config.alerts.escalation_bypasses_cooldown);
    CHECK(config.detection.critical_threshold == Catch::Approx(0.60));
    CHECK(config.detection.warning_threshold == Catch::Approx(0.40));
    CHECK(config.sensors.safety_poll_ms == 2000);
    CHECK(config.mqtt.topic_prefix == "sightline");
    CHECK_FALSE(config.speech.enabled);
}

TEST_CASE("ConfigManager::parse reads every section", "[config]") {
    auto config = ConfigManager::parse(R"(
api:
  port: 8080
database:
  enabled: false
mqtt:
  broker: mqtt.lan
  topic_prefix: assist
sensors:
  base_url: http://pi.local:5000
  safety_poll_ms: 1000
  max_backoff_ms: 8000
detection:
  classes: [person, car, chair]
  critical_threshold: 0.7
  warning_threshold: 0.5
alerts:
  cooldown_seconds: 5
  escalation_bypasses_cooldown: true
  queue_capacity: 8
speech:
  enabled: true
  voice: en-US-1
)");

    CHECK(config.api.port == 8080);
    CHECK_FALSE(config.database.enabled);
    CHECK(config.mqtt.broker == "mqtt.lan");
    CHECK(config.mqtt.topic_prefix == "assist");
    CHECK(config.sensors.base_url == "http://pi.local:5000");
    CHECK(config.sensors.max_backoff_ms == 8000);
    CHECK(config.detection.classes.size() == 3);
    CHECK(config.detection.critical_threshold == Catch::Approx(0.7));
    CHECK(config.alerts.cooldown_seconds == Catch::Approx(5.0));
    CHECK(config.alerts.escalation_bypasses_cooldown);
    CHECK(config.alerts.queue_capacity == 8);
    CHECK(config.speech.enabled);
    CHECK(config.speech.voice == "en-US-1");
}

TEST_CASE("ConfigManager::parse rejects invalid values", "[config]") {
    CHECK_THROWS_AS(ConfigManager::parse("detection: [unclosed"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::parse("api:\n  port: not-a-number\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::parse("detection:\n  warning_threshold: 0.8\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::parse("detection:\n  left_boundary: 0.7\n"),
                    std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::parse("alerts:\n  queue_capacity: 0\n"), std::runtime_error);
    CHECK_THROWS_AS(ConfigManager::parse("sensors:\n  max_backoff_ms: 100\n"),
                    std::runtime_error);
}

TEST_CASE("ConfigManager::load fails on a missing file", "[config]") {
    CHECK_THROWS_AS(ConfigManager::load("/nonexistent/sightline.yaml"), std::runtime_error);
}

TEST_CASE("ConfigManager::resolveClasses prefers the inline list", "[config]") {
    DetectionConfig detection;
    detection.classes = {"person", "dog"};
    detection.classes_file = "/nonexistent/classes";
    auto classes = ConfigManager::resolveClasses(detection);
    REQUIRE(classes.size() == 2);
    CHECK(classes[1] == "dog");
}

TEST_CASE("ConfigManager::resolveClasses reads one class per line", "[config]") {
    auto path = writeTempFile("sightline_classes_test",
                              "# obstacles\nperson\n  traffic light  \n\nbench\r\n");
    DetectionConfig detection;
    detection.classes_file = path;

    auto classes = ConfigManager::resolveClasses(detection);
    REQUIRE(classes.size() == 3);
    CHECK(classes[0] == "person");
    CHECK(classes[1] == "traffic light");
    CHECK(classes[2] == "bench");

    std::remove(path.c_str());
}

TEST_CASE("ConfigManager::resolveClasses fails without classes", "[config]") {
    DetectionConfig detection;
    CHECK_THROWS_AS(ConfigManager::resolveClasses(detection), std::runtime_error);

    detection.classes_file = "/nonexistent/classes";
    CHECK_THROWS_AS(ConfigManager::resolveClasses(detection), std::runtime_error);

    auto path = writeTempFile("sightline_classes_empty", "# nothing here\n\n");
    detection.classes_file = path;
    CHECK_THROWS_AS(ConfigManager::resolveClasses(detection), std::runtime_error);
    std::remove(path.c_str());
}
