#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace assist {

using WallClock = std::chrono::system_clock;

enum class ProximityZone { Far = 0, Warning = 1, Critical = 2 };

enum class Direction { Left, Ahead, Right };

const char* toString(ProximityZone zone);
const char* toString(Direction direction);

/// One detected object from one inference cycle
struct DetectionEvent {
    std::string object_type;
    float confidence = 0.0f;
    float size_fraction = 0.0f;   // frame-relative box size, 0–1
    float x_center = 0.0f;        // pixels
    int frame_width = 0;
    float x1 = 0, y1 = 0, x2 = 0, y2 = 0;  // pixel bbox, persisted as-is
    WallClock::time_point timestamp;

    /// Build from a pixel bounding box. Size is the larger of the width and
    /// height fractions.
    static DetectionEvent fromBox(const std::string& object_type, float confidence,
                                  float x1, float y1, float x2, float y2,
                                  int frame_width, int frame_height,
                                  WallClock::time_point timestamp);
};

struct ProximityEvent {
    std::string object_type;
    Direction direction = Direction::Ahead;
    ProximityZone zone = ProximityZone::Far;
    float size_fraction = 0.0f;
    float confidence = 0.0f;
    float x1 = 0, y1 = 0, x2 = 0, y2 = 0;
    WallClock::time_point timestamp;
};

/// Cooldown bucket: object type + direction. Zone is not part of the key.
struct AlertKey {
    std::string object_type;
    Direction direction = Direction::Ahead;

    bool operator==(const AlertKey& other) const {
        return direction == other.direction && object_type == other.object_type;
    }
};

struct AlertKeyHash {
    size_t operator()(const AlertKey& key) const {
        return std::hash<std::string>{}(key.object_type) ^
               (static_cast<size_t>(key.direction) * 0x9e3779b97f4a7c15ULL);
    }
};

enum class SafetyType { Fall, Emergency, Assistance };

enum class AssistanceKind { General, Bathroom, FoodWater, Medication };

const char* toString(SafetyType type);
const char* toString(AssistanceKind kind);

/// Human-readable label, e.g. "Food/Water"
const char* label(AssistanceKind kind);

std::optional<SafetyType> parseSafetyType(const std::string& text);

/// Accepts the sensor service labels ("General Help", "Food/Water", ...) and
/// the snake-case names ("food_water")
std::optional<AssistanceKind> parseAssistanceKind(const std::string& text);

enum class AlertCategory { Proximity, Safety, Response };

enum class SafetyTransitionKind { Raised, Acknowledged };

/// One item on the outgoing alert stream
struct Alert {
    AlertCategory category = AlertCategory::Proximity;
    std::string message;
    WallClock::time_point timestamp;

    // Proximity
    std::string object_type;
    Direction direction = Direction::Ahead;
    ProximityZone zone = ProximityZone::Far;

    // Safety
    SafetyType safety_type = SafetyType::Fall;
    SafetyTransitionKind transition = SafetyTransitionKind::Raised;
    std::optional<AssistanceKind> assistance;

    uint64_t sequence = 0;  // assigned by the aggregator

    /// Ordering rank: response > safety > critical > warning > far
    int rank() const;

    /// Persisted severity string (critical / warning / fall / ...)
    std::string severity() const;

    static Alert proximity(const ProximityEvent& event);
    static Alert safety(SafetyType type, SafetyTransitionKind transition,
                        std::optional<AssistanceKind> assistance,
                        WallClock::time_point at);
    static Alert response(const std::string& text);
};

/// Spoken phrase for a proximity event, e.g. "person ahead, critical"
std::string proximityMessage(const std::string& object_type, Direction direction,
                             ProximityZone zone);

std::string safetyMessage(SafetyType type, SafetyTransitionKind transition,
                          std::optional<AssistanceKind> assistance);

}  // namespace assist
