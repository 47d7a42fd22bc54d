#include <catch2/catch_all.hpp>
#include "api_json.h"
#include "speech_client.h"
#include "time_utils.h"

using namespace assist;
using namespace std::chrono_literals;
using nlohmann::json;

TEST_CASE("api_json::safetyStatus reports an idle fall as inactive", "[api_json]") {
    SafetyMonitor monitor;
    auto status = api_json::safetyStatus(monitor.snapshot(SafetyType::Fall));

    CHECK(status["fall_detected"] == false);
    CHECK(status["status"] == "inactive");
    CHECK(status["state"] == "idle");
    CHECK(status["last_fall_timestamp"].is_null());
    CHECK(status["last_fall_time"].is_null());
    CHECK(status["fall_history"].empty());
    CHECK_FALSE(status.contains("assistance_type"));
}

TEST_CASE("api_json::safetyStatus active assistance carries its type", "[api_json]") {
    SafetyMonitor monitor;
    monitor.raise(SafetyType::Assistance, AssistanceKind::Medication, WallClock::now());

    auto status = api_json::safetyStatus(monitor.snapshot(SafetyType::Assistance));
    CHECK(status["assistance_active"] == true);
    CHECK(status["status"] == "active");
    CHECK(status["assistance_type"] == "Medication");
    CHECK(status["last_assistance_timestamp"].is_number());
    CHECK(status["last_assistance_time"].is_string());
    REQUIRE(status["assistance_history"].size() == 1);
    CHECK(status["assistance_history"][0]["type"] == "Medication");
    CHECK(status["assistance_history"][0]["acknowledged_at"].is_null());

    monitor.acknowledge(SafetyType::Assistance, WallClock::now());
    status = api_json::safetyStatus(monitor.snapshot(SafetyType::Assistance));
    CHECK(status["assistance_active"] == false);
    CHECK(status["status"] == "inactive");
    CHECK(status["state"] == "acknowledged");
    CHECK(status["assistance_type"].is_null());
    CHECK(status["assistance_history"][0]["acknowledged_at"].is_string());
}

TEST_CASE("api_json::safetyStatus timestamp is epoch seconds like the sensor service", "[api_json]") {
    SafetyMonitor monitor;
    auto raised = sightline::time_utils::from_epoch_seconds(1714557600.25);
    monitor.raise(SafetyType::Fall, std::nullopt, raised);

    auto status = api_json::safetyStatus(monitor.snapshot(SafetyType::Fall));
    REQUIRE(status["last_fall_timestamp"].is_number_float());
    CHECK(status["last_fall_timestamp"].get<double>() == Catch::Approx(1714557600.25));
    CHECK(status["last_fall_time"] == "2024-05-01T10:00:00.250Z");
}

TEST_CASE("api_json::acknowledgeResult is stable for repeated acks", "[api_json]") {
    auto first = api_json::acknowledgeResult(SafetyType::Emergency, true, WallClock::now());
    auto repeat = api_json::acknowledgeResult(SafetyType::Emergency, false, WallClock::now());
    CHECK(first["status"] == "acknowledged");
    CHECK(repeat["status"] == "acknowledged");
    CHECK(first["type"] == "emergency");
    CHECK(first["changed"] == true);
    CHECK(repeat["changed"] == false);
}

TEST_CASE("api_json::alert describes proximity and safety alerts", "[api_json]") {
    ProximityEvent event;
    event.object_type = "car";
    event.direction = Direction::Right;
    event.zone = ProximityZone::Warning;
    event.timestamp = WallClock::now();

    auto proximity = api_json::alert(Alert::proximity(event));
    CHECK(proximity["category"] == "proximity");
    CHECK(proximity["message"] == "car on your right, warning");
    CHECK(proximity["direction"] == "right");
    CHECK(proximity["zone"] == "warning");

    auto safety = api_json::alert(Alert::safety(SafetyType::Fall, SafetyTransitionKind::Raised,
                                                std::nullopt, WallClock::now()));
    CHECK(safety["category"] == "safety");
    CHECK(safety["transition"] == "raised");
    CHECK_FALSE(safety.contains("zone"));
}

TEST_CASE("api_json::environment before and after the first reading", "[api_json]") {
    auto empty = api_json::environment(std::nullopt);
    CHECK(empty["temperature_f"].is_null());
    CHECK(empty["humidity"].is_null());
    CHECK_FALSE(empty.contains("warnings"));

    EnvironmentReading reading;
    reading.temperature_c = 30.0;
    reading.temperature_f = 86.0;
    reading.humidity = 50.0;
    reading.pressure = 1012.0;
    auto filled = api_json::environment(reading);
    CHECK(filled["temperature_f"] == 86.0);
    CHECK(filled["last_update"].is_null());
    REQUIRE(filled["warnings"].size() == 1);
}

TEST_CASE("api_json::session is null when no session is open", "[api_json]") {
    CHECK(api_json::session(std::nullopt).is_null());

    sightline::SessionRecord s;
    s.id = "abc";
    s.start_time = WallClock::now();
    s.total_alerts = 3;
    auto out = api_json::session(s);
    CHECK(out["id"] == "abc");
    CHECK(out["end_time"].is_null());
    CHECK(out["total_alerts"] == 3);
}

TEST_CASE("api_json::clampParam bounds query values", "[api_json]") {
    CHECK(api_json::clampParam("", 50, 1, 500) == 50);
    CHECK(api_json::clampParam("20", 50, 1, 500) == 20);
    CHECK(api_json::clampParam("0", 50, 1, 500) == 1);
    CHECK(api_json::clampParam("100000", 50, 1, 500) == 500);
    CHECK(api_json::clampParam("-3", 24, 1, 720) == 1);
    CHECK(api_json::clampParam("abc", 24, 1, 720) == 24);
    CHECK(api_json::clampParam("12h", 24, 1, 720) == 24);
}

TEST_CASE("SpeechClient::parseTranscript extracts recognized text", "[speech]") {
    CHECK(SpeechClient::parseTranscript(R"({"text": "what's around me"})") == "what's around me");
    CHECK_FALSE(SpeechClient::parseTranscript(R"({"text": "   "})").has_value());
    CHECK_FALSE(SpeechClient::parseTranscript(R"({"text": null})").has_value());
    CHECK_FALSE(SpeechClient::parseTranscript(R"({"error": "timeout"})").has_value());
    CHECK_FALSE(SpeechClient::parseTranscript("<html>").has_value());
}

TEST_CASE("SpeechClient::speak with speech disabled only logs", "[speech]") {
    sightline::SpeechConfig config;
    config.enabled = false;
    SpeechClient client(config);
    CHECK(client.speak("person ahead, critical"));
    CHECK_FALSE(client.listen().has_value());
}

TEST_CASE("api_json::exportFilename names the attachment after the session", "[api_json]") {
    CHECK(api_json::exportFilename("18f2a9c1b7e-3fa2") == "session_18f2a9c1b7e-3fa2.json");
    // Path or header syntax from the URL never reaches Content-Disposition
    CHECK(api_json::exportFilename("a\"; x=../b") == "session_a___x____b.json");
}
