#include <catch2/catch_all.hpp>
#include "safety_monitor.h"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace assist;
using namespace std::chrono_literals;

TEST_CASE("SafetyMonitor transition table covers every state and input", "[safety]") {
    std::set<std::pair<SafetyState, SafetyInput>> covered;
    for (const auto& rule : kSafetyRules) {
        CHECK(covered.emplace(rule.from, rule.input).second);  // no duplicates
    }
    CHECK(covered.size() == 6);

    CHECK(ruleFor(SafetyState::Idle, SafetyInput::Raise).to == SafetyState::Active);
    CHECK(ruleFor(SafetyState::Active, SafetyInput::Raise).to == SafetyState::Active);
    CHECK_FALSE(ruleFor(SafetyState::Active, SafetyInput::Raise).emits);
    CHECK(ruleFor(SafetyState::Active, SafetyInput::Acknowledge).to == SafetyState::Acknowledged);
    CHECK(ruleFor(SafetyState::Acknowledged, SafetyInput::Raise).to == SafetyState::Active);
    CHECK(ruleFor(SafetyState::Idle, SafetyInput::Acknowledge).to == SafetyState::Idle);
    CHECK_FALSE(ruleFor(SafetyState::Acknowledged, SafetyInput::Acknowledge).emits);
}

TEST_CASE("SafetyMonitor::raise activates an idle event once", "[safety]") {
    SafetyMonitor monitor;
    auto t0 = WallClock::now();

    auto first = monitor.raise(SafetyType::Fall, std::nullopt, t0);
    REQUIRE(first.has_value());
    CHECK(first->kind == SafetyTransitionKind::Raised);
    CHECK(monitor.state(SafetyType::Fall) == SafetyState::Active);

    // Re-raise refreshes raised_at without a new incident
    auto again = monitor.raise(SafetyType::Fall, std::nullopt, t0 + 2s);
    CHECK_FALSE(again.has_value());

    auto snap = monitor.snapshot(SafetyType::Fall);
    CHECK(snap.raised_at == t0 + 2s);
    CHECK(snap.history.size() == 1);
}

TEST_CASE("SafetyMonitor::acknowledge is idempotent", "[safety]") {
    SafetyMonitor monitor;
    auto t0 = WallClock::now();
    monitor.raise(SafetyType::Emergency, std::nullopt, t0);

    auto first = monitor.acknowledge(SafetyType::Emergency, t0 + 3s);
    REQUIRE(first.has_value());
    CHECK(first->kind == SafetyTransitionKind::Acknowledged);

    CHECK_FALSE(monitor.acknowledge(SafetyType::Emergency, t0 + 4s).has_value());
    CHECK(monitor.state(SafetyType::Emergency) == SafetyState::Acknowledged);

    auto snap = monitor.snapshot(SafetyType::Emergency);
    CHECK(snap.acknowledged_at == t0 + 3s);
    CHECK_FALSE(snap.active());
}

TEST_CASE("SafetyMonitor::acknowledge of an idle event changes nothing", "[safety]") {
    SafetyMonitor monitor;
    CHECK_FALSE(monitor.acknowledge(SafetyType::Fall).has_value());
    CHECK(monitor.state(SafetyType::Fall) == SafetyState::Idle);
}

TEST_CASE("SafetyMonitor raise after acknowledge is a new incident", "[safety]") {
    SafetyMonitor monitor;
    auto t0 = WallClock::now();

    monitor.raise(SafetyType::Fall, std::nullopt, t0);
    monitor.acknowledge(SafetyType::Fall, t0 + 1s);
    auto again = monitor.raise(SafetyType::Fall, std::nullopt, t0 + 10s);

    REQUIRE(again.has_value());
    auto snap = monitor.snapshot(SafetyType::Fall);
    CHECK(snap.state == SafetyState::Active);
    CHECK_FALSE(snap.acknowledged_at.has_value());
    REQUIRE(snap.history.size() == 2);
    CHECK(snap.history[0].acknowledged_at == t0 + 1s);
    CHECK_FALSE(snap.history[1].acknowledged_at.has_value());
}

TEST_CASE("SafetyMonitor types are independent", "[safety]") {
    SafetyMonitor monitor;
    monitor.raise(SafetyType::Fall);

    CHECK(monitor.isActive(SafetyType::Fall));
    CHECK_FALSE(monitor.isActive(SafetyType::Emergency));
    CHECK_FALSE(monitor.isActive(SafetyType::Assistance));

    monitor.acknowledge(SafetyType::Emergency);
    CHECK(monitor.isActive(SafetyType::Fall));
}

TEST_CASE("SafetyMonitor stores the assistance subtype", "[safety]") {
    SafetyMonitor monitor;

    auto t = monitor.raise(SafetyType::Assistance, AssistanceKind::Medication);
    REQUIRE(t.has_value());
    CHECK(t->assistance == AssistanceKind::Medication);
    CHECK(monitor.snapshot(SafetyType::Assistance).assistance == AssistanceKind::Medication);

    monitor.acknowledge(SafetyType::Assistance);
    auto t2 = monitor.raise(SafetyType::Assistance);
    REQUIRE(t2.has_value());
    CHECK(t2->assistance == AssistanceKind::General);
}

TEST_CASE("SafetyMonitor history is bounded per type", "[safety]") {
    SafetyMonitor monitor;
    auto t0 = WallClock::now();

    for (int i = 0; i < 15; ++i) {
        monitor.raise(SafetyType::Fall, std::nullopt, t0 + std::chrono::seconds(i * 2));
        monitor.acknowledge(SafetyType::Fall, t0 + std::chrono::seconds(i * 2 + 1));
    }
    auto snap = monitor.snapshot(SafetyType::Fall);
    CHECK(snap.history.size() == SafetyMonitor::historyLimit(SafetyType::Fall));
    CHECK(snap.history.front().raised_at == t0 + 10s);

    CHECK(SafetyMonitor::historyLimit(SafetyType::Assistance) == 20);
}

TEST_CASE("SafetyMonitor concurrent raises produce one incident", "[safety]") {
    SafetyMonitor monitor;
    std::atomic<int> transitions{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (monitor.raise(SafetyType::Emergency)) transitions++;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(transitions == 1);
    CHECK(monitor.snapshot(SafetyType::Emergency).history.size() == 1);
}
