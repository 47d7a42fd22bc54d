#include "alert_types.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace assist {

const char* toString(ProximityZone zone) {
    switch (zone) {
        case ProximityZone::Critical: return "critical";
        case ProximityZone::Warning:  return "warning";
        case ProximityZone::Far:      return "far";
    }
    return "far";
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::Left:  return "left";
        case Direction::Ahead: return "ahead";
        case Direction::Right: return "right";
    }
    return "ahead";
}

const char* toString(SafetyType type) {
    switch (type) {
        case SafetyType::Fall:       return "fall";
        case SafetyType::Emergency:  return "emergency";
        case SafetyType::Assistance: return "assistance";
    }
    return "fall";
}

const char* toString(AssistanceKind kind) {
    switch (kind) {
        case AssistanceKind::General:    return "general";
        case AssistanceKind::Bathroom:   return "bathroom";
        case AssistanceKind::FoodWater:  return "food_water";
        case AssistanceKind::Medication: return "medication";
    }
    return "general";
}

const char* label(AssistanceKind kind) {
    switch (kind) {
        case AssistanceKind::General:    return "General Help";
        case AssistanceKind::Bathroom:   return "Bathroom";
        case AssistanceKind::FoodWater:  return "Food/Water";
        case AssistanceKind::Medication: return "Medication";
    }
    return "General Help";
}

std::optional<SafetyType> parseSafetyType(const std::string& text) {
    if (text == "fall") return SafetyType::Fall;
    if (text == "emergency") return SafetyType::Emergency;
    if (text == "assistance") return SafetyType::Assistance;
    return std::nullopt;
}

std::optional<AssistanceKind> parseAssistanceKind(const std::string& text) {
    std::string lower;
    for (char c : text) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (lower == "general" || lower == "generalhelp") return AssistanceKind::General;
    if (lower == "bathroom") return AssistanceKind::Bathroom;
    if (lower == "foodwater") return AssistanceKind::FoodWater;
    if (lower == "medication") return AssistanceKind::Medication;
    return std::nullopt;
}

DetectionEvent DetectionEvent::fromBox(const std::string& object_type, float confidence,
                                       float x1, float y1, float x2, float y2,
                                       int frame_width, int frame_height,
                                       WallClock::time_point timestamp) {
    DetectionEvent event;
    event.object_type = object_type;
    event.confidence = confidence;
    event.x1 = x1;
    event.y1 = y1;
    event.x2 = x2;
    event.y2 = y2;
    event.x_center = (x1 + x2) / 2.0f;
    event.frame_width = frame_width;
    event.timestamp = timestamp;

    float width_fraction = frame_width > 0 ? std::abs(x2 - x1) / frame_width : 0.0f;
    float height_fraction = frame_height > 0 ? std::abs(y2 - y1) / frame_height : 0.0f;
    event.size_fraction = std::max(width_fraction, height_fraction);
    return event;
}

int Alert::rank() const {
    switch (category) {
        case AlertCategory::Response: return 4;
        case AlertCategory::Safety:   return 3;
        case AlertCategory::Proximity:
            return static_cast<int>(zone);  // critical 2, warning 1, far 0
    }
    return 0;
}

std::string Alert::severity() const {
    switch (category) {
        case AlertCategory::Proximity: return toString(zone);
        case AlertCategory::Safety:    return toString(safety_type);
        case AlertCategory::Response:  return "response";
    }
    return "";
}

Alert Alert::proximity(const ProximityEvent& event) {
    Alert alert;
    alert.category = AlertCategory::Proximity;
    alert.object_type = event.object_type;
    alert.direction = event.direction;
    alert.zone = event.zone;
    alert.timestamp = event.timestamp;
    alert.message = proximityMessage(event.object_type, event.direction, event.zone);
    return alert;
}

Alert Alert::safety(SafetyType type, SafetyTransitionKind transition,
                    std::optional<AssistanceKind> assistance,
                    WallClock::time_point at) {
    Alert alert;
    alert.category = AlertCategory::Safety;
    alert.safety_type = type;
    alert.transition = transition;
    alert.assistance = assistance;
    alert.timestamp = at;
    alert.message = safetyMessage(type, transition, assistance);
    return alert;
}

Alert Alert::response(const std::string& text) {
    Alert alert;
    alert.category = AlertCategory::Response;
    alert.message = text;
    alert.timestamp = WallClock::now();
    return alert;
}

std::string proximityMessage(const std::string& object_type, Direction direction,
                             ProximityZone zone) {
    std::string where;
    switch (direction) {
        case Direction::Left:  where = "on your left"; break;
        case Direction::Ahead: where = "ahead"; break;
        case Direction::Right: where = "on your right"; break;
    }
    return object_type + " " + where + ", " + toString(zone);
}

std::string safetyMessage(SafetyType type, SafetyTransitionKind transition,
                          std::optional<AssistanceKind> assistance) {
    bool raised = transition == SafetyTransitionKind::Raised;
    switch (type) {
        case SafetyType::Fall:
            return raised ? "Fall detected. Alerting your caregiver."
                          : "Fall alert acknowledged. Help is on the way.";
        case SafetyType::Emergency:
            return raised ? "Emergency button pressed. Alerting your caregiver."
                          : "Emergency acknowledged. Help is on the way.";
        case SafetyType::Assistance: {
            std::string what = assistance ? label(*assistance) : "General Help";
            return raised ? "Assistance requested: " + what + "."
                          : "Your " + what + " request was acknowledged.";
        }
    }
    return "";
}

}  // namespace assist
