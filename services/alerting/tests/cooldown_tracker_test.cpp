#include <catch2/catch_all.hpp>
#include "cooldown_tracker.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace assist;
using namespace std::chrono_literals;

namespace {

ProximityEvent makeEvent(const std::string& cls, Direction dir, ProximityZone zone,
                         WallClock::time_point at) {
    ProximityEvent e;
    e.object_type = cls;
    e.direction = dir;
    e.zone = zone;
    e.timestamp = at;
    return e;
}

}  // namespace

TEST_CASE("CooldownTracker admits the first event for a key", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0)));
    CHECK(tracker.size() == 1);
}

TEST_CASE("CooldownTracker suppresses repeats within three seconds", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();

    REQUIRE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0)));
    CHECK_FALSE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 1s)));
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 3100ms)));
}

TEST_CASE("CooldownTracker rejections do not extend the window", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();

    REQUIRE(tracker.admit(makeEvent("chair", Direction::Left, ProximityZone::Warning, t0)));
    CHECK_FALSE(tracker.admit(makeEvent("chair", Direction::Left, ProximityZone::Warning, t0 + 2s)));
    CHECK_FALSE(tracker.admit(makeEvent("chair", Direction::Left, ProximityZone::Warning, t0 + 2900ms)));
    CHECK(tracker.admit(makeEvent("chair", Direction::Left, ProximityZone::Warning, t0 + 3s)));
}

TEST_CASE("CooldownTracker keys on object type and direction", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();

    REQUIRE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Warning, t0)));
    CHECK(tracker.admit(makeEvent("person", Direction::Left, ProximityZone::Warning, t0)));
    CHECK(tracker.admit(makeEvent("chair", Direction::Ahead, ProximityZone::Warning, t0)));
    CHECK(tracker.size() == 3);
}

TEST_CASE("CooldownTracker does not bypass on escalation by default", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();

    REQUIRE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Warning, t0)));
    CHECK_FALSE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 1s)));
}

TEST_CASE("CooldownTracker escalation bypass admits a more severe zone", "[cooldown]") {
    CooldownTracker tracker(3s, true);
    auto t0 = WallClock::now();

    REQUIRE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Warning, t0)));
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 1s)));
    // Same zone again inside the new window is still suppressed
    CHECK_FALSE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 2s)));
    // De-escalation never bypasses
    CHECK_FALSE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Warning, t0 + 2s)));
}

TEST_CASE("CooldownTracker admits one of many concurrent identical events", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (tracker.admit(makeEvent("dog", Direction::Right, ProximityZone::Critical, t0))) {
                admitted++;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(admitted == 1);
}

TEST_CASE("CooldownTracker::clear forgets every key", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();
    tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0));
    tracker.clear();
    CHECK(tracker.size() == 0);
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 1s)));
}

TEST_CASE("CooldownTracker restarts the window when the clock steps backwards", "[cooldown]") {
    CooldownTracker tracker;
    auto t0 = WallClock::now();

    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 1h)));
    // Wall clock corrected by an hour: the key must not stay muted until then
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 5s)));
    // The new admission starts a normal window
    CHECK_FALSE(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 6s)));
    CHECK(tracker.admit(makeEvent("person", Direction::Ahead, ProximityZone::Critical, t0 + 8s)));
}
