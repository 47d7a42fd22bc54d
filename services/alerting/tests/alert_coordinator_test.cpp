#include <catch2/catch_all.hpp>
#include "alert_coordinator.h"
#include "api_json.h"
#include "test_support.h"

#include <thread>

using namespace assist;
using namespace std::chrono_literals;

namespace {

struct Pipeline {
    std::shared_ptr<testing::InMemoryEventStore> store = std::make_shared<testing::InMemoryEventStore>();
    std::shared_ptr<PersistenceSink> sink = std::make_shared<PersistenceSink>(store);
    std::shared_ptr<SafetyMonitor> monitor = std::make_shared<SafetyMonitor>();
    std::shared_ptr<AlertAggregator> aggregator = std::make_shared<AlertAggregator>(sink);
    std::shared_ptr<AlertCoordinator> coordinator;

    explicit Pipeline(bool escalation_bypass = false) {
        coordinator = std::make_shared<AlertCoordinator>(
            ProximityClassifier({"person", "chair", "car"}),
            std::make_shared<CooldownTracker>(3s, escalation_bypass),
            monitor, aggregator, sink);
        sink->openSession();
    }
};

/// Box centred horizontally in a 640x480 frame whose height fraction is `size`
DetectionEvent personAhead(float size, WallClock::time_point at,
                           const std::string& cls = "person") {
    return DetectionEvent::fromBox(cls, 0.9f, 300, 0, 340, size * 480.0f, 640, 480, at);
}

}  // namespace

TEST_CASE("AlertCoordinator end-to-end proximity and fall scenario", "[coordinator]") {
    Pipeline p;
    auto t0 = WallClock::now();

    // t=0 and t=1: same person ahead, critical both times
    auto first = p.coordinator->onDetections({personAhead(0.65f, t0)});
    auto second = p.coordinator->onDetections({personAhead(0.70f, t0 + 1s)});
    CHECK(first.announced == 1);
    CHECK(second.announced == 0);
    CHECK(second.suppressed == 1);

    auto queued = p.aggregator->snapshot();
    REQUIRE(queued.size() == 1);
    CHECK(queued[0].message == "person ahead, critical");

    // t=2: fall reported; announced ahead of the queued proximity alert
    CHECK(p.coordinator->raiseSafety(SafetyType::Fall, std::nullopt, t0 + 2s));
    CHECK(p.monitor->state(SafetyType::Fall) == SafetyState::Active);
    queued = p.aggregator->snapshot();
    REQUIRE(queued.size() == 2);
    CHECK(queued[0].category == AlertCategory::Safety);
    CHECK(queued[0].safety_type == SafetyType::Fall);

    // Speak the fall before the acknowledgement arrives
    auto spoken = p.aggregator->tryNext();
    REQUIRE(spoken.has_value());
    CHECK(spoken->category == AlertCategory::Safety);
    p.aggregator->complete();

    // t=5: acknowledged
    CHECK(p.coordinator->acknowledge(SafetyType::Fall, t0 + 5s));
    CHECK(p.monitor->state(SafetyType::Fall) == SafetyState::Acknowledged);

    auto status = api_json::safetyStatus(p.monitor->snapshot(SafetyType::Fall));
    CHECK(status["status"] == "inactive");
    CHECK(status["fall_detected"] == false);

    p.sink->flush();
    CHECK(p.store->alertsWithCategory("proximity").size() == 1);
    auto safety = p.store->alertsWithCategory("safety");
    REQUIRE(safety.size() == 2);
    CHECK(safety[0].message == "Fall detected. Alerting your caregiver.");
    CHECK(safety[1].message == "Fall alert acknowledged. Help is on the way.");

    // Both detections recorded, only the first announced
    auto detections = p.store->detections();
    REQUIRE(detections.size() == 2);
    CHECK(detections[0].announced);
    CHECK_FALSE(detections[1].announced);
}

TEST_CASE("AlertCoordinator acknowledging twice records one transition", "[coordinator]") {
    Pipeline p;
    p.coordinator->raiseSafety(SafetyType::Emergency);

    CHECK(p.coordinator->acknowledge(SafetyType::Emergency));
    CHECK_FALSE(p.coordinator->acknowledge(SafetyType::Emergency));

    p.sink->flush();
    CHECK(p.store->alertsWithCategory("safety").size() == 2);  // raise + one acknowledge
}

TEST_CASE("AlertCoordinator re-raising an active event creates no record", "[coordinator]") {
    Pipeline p;
    auto t0 = WallClock::now();

    CHECK(p.coordinator->raiseSafety(SafetyType::Fall, std::nullopt, t0));
    CHECK_FALSE(p.coordinator->raiseSafety(SafetyType::Fall, std::nullopt, t0 + 2s));
    CHECK(p.monitor->snapshot(SafetyType::Fall).raised_at == t0 + 2s);

    p.sink->flush();
    CHECK(p.store->alertsWithCategory("safety").size() == 1);
}

TEST_CASE("AlertCoordinator supersedes an unspoken raise on acknowledge", "[coordinator]") {
    Pipeline p;
    p.coordinator->raiseSafety(SafetyType::Assistance, AssistanceKind::Bathroom);
    p.coordinator->acknowledge(SafetyType::Assistance);

    auto queued = p.aggregator->snapshot();
    REQUIRE(queued.size() == 1);
    CHECK(queued[0].transition == SafetyTransitionKind::Acknowledged);
    CHECK(queued[0].message == "Your Bathroom request was acknowledged.");

    // The raise is still part of the audit trail
    p.sink->flush();
    CHECK(p.store->alertsWithCategory("safety").size() == 2);
}

TEST_CASE("AlertCoordinator records Far objects without announcing them", "[coordinator]") {
    Pipeline p;
    auto t0 = WallClock::now();

    auto result = p.coordinator->onDetections({personAhead(0.20f, t0)});
    CHECK(result.far == 1);
    CHECK(result.announced == 0);
    CHECK(p.aggregator->pending() == 0);

    p.sink->flush();
    REQUIRE(p.store->detections().size() == 1);
    CHECK(p.store->detections()[0].distance_category == "far");
    CHECK(p.store->alerts().empty());
    CHECK(p.sink->currentSession()->total_detections == 1);
}

TEST_CASE("AlertCoordinator ignores classes outside the relevant set", "[coordinator]") {
    Pipeline p;
    auto result = p.coordinator->onDetections({personAhead(0.9f, WallClock::now(), "kite")});
    CHECK(result.classified == 0);
    p.sink->flush();
    CHECK(p.store->detections().empty());
}

TEST_CASE("AlertCoordinator notifies the acknowledge listener", "[coordinator]") {
    Pipeline p;
    std::vector<SafetyType> forwarded;
    p.coordinator->setAcknowledgeListener([&](SafetyType t) { forwarded.push_back(t); });

    p.coordinator->acknowledge(SafetyType::Fall);   // idle: nothing to forward
    p.coordinator->raiseSafety(SafetyType::Fall);
    p.coordinator->acknowledge(SafetyType::Fall);

    REQUIRE(forwarded.size() == 1);
    CHECK(forwarded[0] == SafetyType::Fall);
}

TEST_CASE("AlertCoordinator keeps the latest scene", "[coordinator]") {
    Pipeline p;
    auto t0 = WallClock::now();

    p.coordinator->onDetections({personAhead(0.65f, t0), personAhead(0.2f, t0, "chair")});
    CHECK(p.coordinator->latestScene().size() == 2);

    p.coordinator->onDetections({});
    CHECK(p.coordinator->latestScene().empty());
}

TEST_CASE("AlertCoordinator escalation bypass is opt-in", "[coordinator]") {
    auto t0 = WallClock::now();

    Pipeline strict;
    strict.coordinator->onDetections({personAhead(0.45f, t0)});
    strict.coordinator->onDetections({personAhead(0.65f, t0 + 1s)});
    CHECK(strict.aggregator->pending() == 1);

    Pipeline bypass(true);
    bypass.coordinator->onDetections({personAhead(0.45f, t0)});
    bypass.coordinator->onDetections({personAhead(0.65f, t0 + 1s)});
    CHECK(bypass.aggregator->pending() == 2);
}

TEST_CASE("AlertCoordinator acknowledge racing a raise never leaves the raise queued", "[coordinator]") {
    Pipeline p;
    std::thread acker;

    // While the raise is being published, a caregiver acknowledges from
    // another thread
    p.aggregator->addListener([&](const Alert& alert) {
        if (alert.category != AlertCategory::Safety) return;
        if (alert.transition != SafetyTransitionKind::Raised) return;
        acker = std::thread([&] { p.coordinator->acknowledge(SafetyType::Fall); });
        std::this_thread::sleep_for(20ms);
    });

    CHECK(p.coordinator->raiseSafety(SafetyType::Fall));
    acker.join();

    CHECK(p.monitor->state(SafetyType::Fall) == SafetyState::Acknowledged);
    auto queued = p.aggregator->snapshot();
    REQUIRE(queued.size() == 1);
    CHECK(queued[0].transition == SafetyTransitionKind::Acknowledged);
    CHECK(queued[0].message == "Fall alert acknowledged. Help is on the way.");
}

TEST_CASE("AlertCoordinator concurrent raise and acknowledge leave no stale raise queued", "[coordinator]") {
    for (int i = 0; i < 200; ++i) {
        Pipeline p;
        std::thread raiser([&] { p.coordinator->raiseSafety(SafetyType::Emergency); });
        std::thread acker([&] { p.coordinator->acknowledge(SafetyType::Emergency); });
        raiser.join();
        acker.join();

        if (p.monitor->state(SafetyType::Emergency) != SafetyState::Acknowledged) continue;
        for (const auto& alert : p.aggregator->snapshot()) {
            CHECK_FALSE((alert.safety_type == SafetyType::Emergency &&
                         alert.transition == SafetyTransitionKind::Raised));
        }
    }
}

TEST_CASE("AlertCoordinator detections are not announced once the stream is closed", "[coordinator]") {
    Pipeline p;
    p.aggregator->close();

    auto result = p.coordinator->onDetections({personAhead(0.65f, WallClock::now())});
    CHECK(result.announced == 0);

    p.sink->flush();
    CHECK(p.store->alerts().empty());
    REQUIRE(p.store->detections().size() == 1);
    CHECK_FALSE(p.store->detections()[0].announced);
}
