#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace sightline {

using WallTime = std::chrono::system_clock::time_point;

struct SessionRecord {
    std::string id;
    WallTime start_time;
    std::optional<WallTime> end_time;  // nullopt while open
    int64_t total_detections = 0;
    int64_t total_alerts = 0;
    int64_t critical_alerts = 0;
};

/// Raw detection fact, written whether or not the alert was admitted
struct DetectionRecord {
    std::string session_id;
    WallTime timestamp;
    std::string object_type;
    std::string distance_category;  // critical | warning | far
    double distance_score = 0;      // frame-relative size
    std::string direction;          // left | ahead | right
    int bbox_x1 = 0, bbox_y1 = 0, bbox_x2 = 0, bbox_y2 = 0;
    double confidence = 0;
    bool announced = false;
};

/// Append-only audit fact. Never updated once written.
struct AlertRecord {
    std::string id;
    std::string session_id;
    WallTime timestamp;
    std::string category;   // proximity | safety
    std::string severity;   // critical | warning | fall | emergency | assistance
    std::string message;
    std::string object_type;
    std::string direction;
};

struct VoiceCommandRecord {
    std::string session_id;
    WallTime timestamp;
    std::string command;
    std::string response;
};

struct SceneSummaryRecord {
    std::string session_id;
    WallTime timestamp;
    std::string summary_text;
    int object_count = 0;
};

}  // namespace sightline
