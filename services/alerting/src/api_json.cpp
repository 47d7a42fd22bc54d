#include "api_json.h"
#include "time_utils.h"

#include <algorithm>
#include <cstdlib>

using json = nlohmann::json;

namespace assist::api_json {

namespace {

const char* activeField(SafetyType type) {
    switch (type) {
        case SafetyType::Fall:       return "fall_detected";
        case SafetyType::Emergency:  return "emergency_active";
        case SafetyType::Assistance: return "assistance_active";
    }
    return "active";
}

}  // anonymous namespace

json timeOrNull(const std::optional<WallClock::time_point>& tp) {
    if (!tp) return nullptr;
    return sightline::time_utils::to_iso8601(*tp);
}

json epochOrNull(const std::optional<WallClock::time_point>& tp) {
    if (!tp) return nullptr;
    return sightline::time_utils::to_epoch_seconds(*tp);
}

json safetyStatus(const SafetySnapshot& snap) {
    std::string name = toString(snap.type);

    json history = json::array();
    for (const auto& incident : snap.history) {
        json entry = {
            {"timestamp", sightline::time_utils::to_iso8601(incident.raised_at)},
            {"acknowledged_at", timeOrNull(incident.acknowledged_at)},
        };
        if (incident.assistance) entry["type"] = label(*incident.assistance);
        history.push_back(std::move(entry));
    }

    json out = {
        {activeField(snap.type), snap.active()},
        {"status", snap.active() ? "active" : "inactive"},
        {"state", toString(snap.state)},
        {"last_" + name + "_timestamp", epochOrNull(snap.raised_at)},
        {"last_" + name + "_time", timeOrNull(snap.raised_at)},
        {"acknowledged_at", timeOrNull(snap.acknowledged_at)},
        {name + "_history", history},
    };

    if (snap.type == SafetyType::Assistance) {
        out["assistance_type"] = snap.active() && snap.assistance
            ? json(label(*snap.assistance)) : json(nullptr);
    }
    return out;
}

json acknowledgeResult(SafetyType type, bool changed, WallClock::time_point at) {
    return {
        {"status", "acknowledged"},
        {"type", toString(type)},
        {"changed", changed},
        {"timestamp", sightline::time_utils::to_iso8601(at)},
    };
}

json alert(const Alert& a) {
    json out = {
        {"category", a.category == AlertCategory::Safety ? "safety" : "proximity"},
        {"severity", a.severity()},
        {"message", a.message},
        {"timestamp", sightline::time_utils::to_iso8601(a.timestamp)},
    };
    if (a.category == AlertCategory::Proximity) {
        out["object_type"] = a.object_type;
        out["direction"] = toString(a.direction);
        out["zone"] = toString(a.zone);
    } else {
        out["transition"] = a.transition == SafetyTransitionKind::Raised ? "raised" : "acknowledged";
        if (a.assistance) out["assistance_type"] = label(*a.assistance);
    }
    return out;
}

json safetyState(const SafetySnapshot& snap) {
    json out = {
        {"type", toString(snap.type)},
        {"state", toString(snap.state)},
        {"active", snap.active()},
        {"raised_at", timeOrNull(snap.raised_at)},
        {"acknowledged_at", timeOrNull(snap.acknowledged_at)},
    };
    if (snap.assistance) out["assistance_type"] = label(*snap.assistance);
    return out;
}

json environment(const std::optional<EnvironmentReading>& reading) {
    if (!reading) {
        return {
            {"temperature_f", nullptr},
            {"temperature_c", nullptr},
            {"humidity", nullptr},
            {"pressure", nullptr},
            {"last_update", nullptr},
        };
    }

    json out = {
        {"temperature_f", reading->temperature_f},
        {"temperature_c", reading->temperature_c},
        {"humidity", reading->humidity},
        {"pressure", reading->pressure},
        {"last_update", reading->last_update.empty() ? json(nullptr) : json(reading->last_update)},
    };
    auto warnings = EnvironmentState::warnings(*reading);
    if (!warnings.empty()) out["warnings"] = warnings;
    return out;
}

json connectivity(const std::map<std::string, ConnectivityStatus::Source>& sources) {
    json out = json::object();
    for (const auto& [name, s] : sources) {
        out[name] = {
            {"degraded", s.degraded},
            {"consecutive_failures", s.consecutive_failures},
            {"last_error", s.last_error.empty() ? json(nullptr) : json(s.last_error)},
            {"last_success", timeOrNull(s.last_success)},
        };
    }
    return out;
}

json session(const std::optional<sightline::SessionRecord>& s) {
    if (!s) return nullptr;
    return {
        {"id", s->id},
        {"start_time", sightline::time_utils::to_iso8601(s->start_time)},
        {"end_time", timeOrNull(s->end_time)},
        {"total_detections", s->total_detections},
        {"total_alerts", s->total_alerts},
        {"critical_alerts", s->critical_alerts},
    };
}

json announcer(const Announcer::Stats& stats) {
    return {
        {"spoken", stats.spoken},
        {"failed", stats.failed},
        {"last_message", stats.last_message.empty() ? json(nullptr) : json(stats.last_message)},
        {"last_spoken_at", timeOrNull(stats.last_spoken_at)},
    };
}

int clampParam(const std::string& value, int fallback, int min, int max) {
    if (value.empty()) return fallback;
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') return fallback;
    return static_cast<int>(std::clamp<long>(parsed, min, max));
}

std::string exportFilename(const std::string& session_id) {
    std::string safe = session_id;
    for (auto& c : safe) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) c = '_';
    }
    return "session_" + safe + ".json";
}

}  // namespace assist::api_json
