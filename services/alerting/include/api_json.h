#pragma once

#include "alert_types.h"
#include "announcer.h"
#include "connectivity_status.h"
#include "environment_state.h"
#include "records.h"
#include "safety_monitor.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace assist::api_json {

/// ISO-8601 string or null
nlohmann::json timeOrNull(const std::optional<WallClock::time_point>& tp);

/// Epoch seconds (fractional) or null
nlohmann::json epochOrNull(const std::optional<WallClock::time_point>& tp);

/// Status document for one safety type, using the sensor service field
/// names (fall_detected, last_fall_timestamp as epoch seconds, fall_history,
/// ...) plus last_<type>_time in ISO-8601.
/// Acknowledged reads as inactive.
nlohmann::json safetyStatus(const SafetySnapshot& snapshot);

nlohmann::json acknowledgeResult(SafetyType type, bool changed, WallClock::time_point at);

/// MQTT alert payload
nlohmann::json alert(const Alert& alert);

/// Retained MQTT safety state payload
nlohmann::json safetyState(const SafetySnapshot& snapshot);

/// temperature_f, temperature_c, humidity, pressure, last_update (nulls
/// before the first reading)
nlohmann::json environment(const std::optional<EnvironmentReading>& reading);

nlohmann::json connectivity(const std::map<std::string, ConnectivityStatus::Source>& sources);

nlohmann::json session(const std::optional<sightline::SessionRecord>& session);

nlohmann::json announcer(const Announcer::Stats& stats);

/// Clamp a ?limit= / ?hours= query value
int clampParam(const std::string& value, int fallback, int min, int max);

/// session_<id>.json with anything outside [A-Za-z0-9_-] replaced by '_'
std::string exportFilename(const std::string& session_id);

}  // namespace assist::api_json
