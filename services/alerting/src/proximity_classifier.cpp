#include "proximity_classifier.h"

#include <algorithm>
#include <cmath>

namespace assist {

ProximityClassifier::ProximityClassifier(std::vector<std::string> relevant_classes)
    : ProximityClassifier(std::move(relevant_classes), Thresholds{})
{
}

ProximityClassifier::ProximityClassifier(std::vector<std::string> relevant_classes,
                                         const Thresholds& thresholds)
    : relevant_(relevant_classes.begin(), relevant_classes.end())
    , thresholds_(thresholds)
{
}

ProximityClassifier::Thresholds ProximityClassifier::thresholdsFrom(
        const sightline::DetectionConfig& config) {
    return Thresholds{
        .critical = config.critical_threshold,
        .warning = config.warning_threshold,
        .left_boundary = config.left_boundary,
        .right_boundary = config.right_boundary,
    };
}

std::optional<ProximityEvent> ProximityClassifier::classify(const DetectionEvent& detection) const {
    if (detection.frame_width <= 0) return std::nullopt;
    if (!std::isfinite(detection.size_fraction) || detection.size_fraction < 0.0f) {
        return std::nullopt;
    }
    if (!std::isfinite(detection.x_center)) return std::nullopt;
    if (!isRelevant(detection.object_type)) return std::nullopt;

    float size = std::min(detection.size_fraction, 1.0f);

    return ProximityEvent{
        .object_type = detection.object_type,
        .direction = directionFor(detection.x_center, detection.frame_width),
        .zone = zoneFor(size),
        .size_fraction = size,
        .confidence = detection.confidence,
        .x1 = detection.x1,
        .y1 = detection.y1,
        .x2 = detection.x2,
        .y2 = detection.y2,
        .timestamp = detection.timestamp,
    };
}

ProximityZone ProximityClassifier::zoneFor(float size_fraction) const {
    if (size_fraction >= thresholds_.critical) return ProximityZone::Critical;
    if (size_fraction >= thresholds_.warning) return ProximityZone::Warning;
    return ProximityZone::Far;
}

Direction ProximityClassifier::directionFor(float x_center, int frame_width) const {
    double relative = static_cast<double>(x_center) / frame_width;
    if (relative < thresholds_.left_boundary) return Direction::Left;
    if (relative > thresholds_.right_boundary) return Direction::Right;
    return Direction::Ahead;
}

bool ProximityClassifier::isRelevant(const std::string& object_type) const {
    return relevant_.empty() || relevant_.count(object_type) > 0;
}

}  // namespace assist
