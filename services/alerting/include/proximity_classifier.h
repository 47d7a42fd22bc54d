#pragma once

#include "alert_types.h"
#include "config_manager.h"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace assist {

/// Maps a raw detection to object type, direction band and proximity zone.
/// Stateless after construction; safe to share between threads.
class ProximityClassifier {
public:
    struct Thresholds {
        double critical = 0.60;
        double warning = 0.40;
        double left_boundary = 0.33;
        double right_boundary = 0.67;
    };

    /// Empty relevant_classes accepts every class
    explicit ProximityClassifier(std::vector<std::string> relevant_classes = {});
    ProximityClassifier(std::vector<std::string> relevant_classes, const Thresholds& thresholds);

    static Thresholds thresholdsFrom(const sightline::DetectionConfig& config);

    std::optional<ProximityEvent> classify(const DetectionEvent& detection) const;

    ProximityZone zoneFor(float size_fraction) const;

    /// x_center relative to frame_width; bands are left < 33%, right > 67%
    Direction directionFor(float x_center, int frame_width) const;

    bool isRelevant(const std::string& object_type) const;

    const Thresholds& thresholds() const { return thresholds_; }

private:
    std::unordered_set<std::string> relevant_;
    Thresholds thresholds_;
};

}  // namespace assist
