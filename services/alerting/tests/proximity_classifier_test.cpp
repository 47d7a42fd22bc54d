#include <catch2/catch_all.hpp>
#include "proximity_classifier.h"

#include <cmath>
#include <limits>

using namespace assist;

namespace {

DetectionEvent makeDetection(const std::string& cls, float size, float x_center,
                             int frame_width = 640) {
    DetectionEvent d;
    d.object_type = cls;
    d.confidence = 0.9f;
    d.size_fraction = size;
    d.x_center = x_center;
    d.frame_width = frame_width;
    d.timestamp = WallClock::now();
    return d;
}

}  // namespace

TEST_CASE("ProximityClassifier::zoneFor applies the size thresholds", "[classifier]") {
    ProximityClassifier classifier;

    CHECK(classifier.zoneFor(1.00f) == ProximityZone::Critical);
    CHECK(classifier.zoneFor(0.65f) == ProximityZone::Critical);
    CHECK(classifier.zoneFor(0.60f) == ProximityZone::Critical);
    CHECK(classifier.zoneFor(0.59f) == ProximityZone::Warning);
    CHECK(classifier.zoneFor(0.40f) == ProximityZone::Warning);
    CHECK(classifier.zoneFor(0.39f) == ProximityZone::Far);
    CHECK(classifier.zoneFor(0.00f) == ProximityZone::Far);
}

TEST_CASE("ProximityClassifier zone is monotonic in size", "[classifier]") {
    ProximityClassifier classifier;
    auto previous = ProximityZone::Far;
    for (int i = 0; i <= 100; ++i) {
        auto zone = classifier.zoneFor(static_cast<float>(i) / 100.0f);
        CHECK(zone >= previous);
        previous = zone;
    }
}

TEST_CASE("ProximityClassifier::directionFor splits the frame into thirds", "[classifier]") {
    ProximityClassifier classifier;

    CHECK(classifier.directionFor(10.0f, 640) == Direction::Left);
    CHECK(classifier.directionFor(200.0f, 640) == Direction::Left);    // 31%
    CHECK(classifier.directionFor(320.0f, 640) == Direction::Ahead);
    CHECK(classifier.directionFor(230.0f, 640) == Direction::Ahead);   // 36%
    CHECK(classifier.directionFor(420.0f, 640) == Direction::Ahead);   // 65.6%
    CHECK(classifier.directionFor(440.0f, 640) == Direction::Right);   // 68.8%
    CHECK(classifier.directionFor(630.0f, 640) == Direction::Right);
}

TEST_CASE("ProximityClassifier::classify builds a proximity event", "[classifier]") {
    ProximityClassifier classifier({"person", "chair"});

    auto event = classifier.classify(makeDetection("person", 0.65f, 320.0f));
    REQUIRE(event.has_value());
    CHECK(event->object_type == "person");
    CHECK(event->zone == ProximityZone::Critical);
    CHECK(event->direction == Direction::Ahead);
    CHECK(event->size_fraction == Catch::Approx(0.65f));
}

TEST_CASE("ProximityClassifier::classify ignores irrelevant classes", "[classifier]") {
    ProximityClassifier classifier({"person"});
    CHECK_FALSE(classifier.classify(makeDetection("kite", 0.9f, 320.0f)).has_value());

    ProximityClassifier accept_all;
    CHECK(accept_all.classify(makeDetection("kite", 0.9f, 320.0f)).has_value());
}

TEST_CASE("ProximityClassifier::classify rejects degenerate input", "[classifier]") {
    ProximityClassifier classifier;

    CHECK_FALSE(classifier.classify(makeDetection("person", 0.5f, 100.0f, 0)).has_value());
    CHECK_FALSE(classifier.classify(makeDetection("person", -0.1f, 100.0f)).has_value());
    CHECK_FALSE(classifier.classify(
        makeDetection("person", std::numeric_limits<float>::quiet_NaN(), 100.0f)).has_value());
}

TEST_CASE("ProximityClassifier::classify clamps oversized boxes", "[classifier]") {
    ProximityClassifier classifier;
    auto event = classifier.classify(makeDetection("person", 1.7f, 320.0f));
    REQUIRE(event.has_value());
    CHECK(event->size_fraction == Catch::Approx(1.0f));
    CHECK(event->zone == ProximityZone::Critical);
}

TEST_CASE("ProximityClassifier honours configured thresholds", "[classifier]") {
    sightline::DetectionConfig config;
    config.critical_threshold = 0.5;
    config.warning_threshold = 0.2;
    ProximityClassifier classifier({}, ProximityClassifier::thresholdsFrom(config));

    CHECK(classifier.zoneFor(0.55f) == ProximityZone::Critical);
    CHECK(classifier.zoneFor(0.25f) == ProximityZone::Warning);
    CHECK(classifier.zoneFor(0.15f) == ProximityZone::Far);
}

TEST_CASE("DetectionEvent::fromBox uses the larger frame fraction", "[classifier]") {
    auto now = WallClock::now();

    // Tall narrow box: height dominates
    auto tall = DetectionEvent::fromBox("person", 0.8f, 300, 0, 340, 400, 640, 480, now);
    CHECK(tall.size_fraction == Catch::Approx(400.0f / 480.0f));
    CHECK(tall.x_center == Catch::Approx(320.0f));

    // Wide short box: width dominates
    auto wide = DetectionEvent::fromBox("couch", 0.8f, 0, 400, 512, 480, 640, 480, now);
    CHECK(wide.size_fraction == Catch::Approx(0.8f));
}

TEST_CASE("proximityMessage phrases direction and zone", "[classifier]") {
    CHECK(proximityMessage("person", Direction::Ahead, ProximityZone::Critical) ==
          "person ahead, critical");
    CHECK(proximityMessage("chair", Direction::Left, ProximityZone::Warning) ==
          "chair on your left, warning");
    CHECK(proximityMessage("car", Direction::Right, ProximityZone::Critical) ==
          "car on your right, critical");
}
