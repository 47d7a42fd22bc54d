#pragma once

#include "alert_types.h"

#include <array>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace assist {

enum class SafetyState { Idle, Active, Acknowledged };

enum class SafetyInput { Raise, Acknowledge };

const char* toString(SafetyState state);

/// One row of the per-type state machine
struct SafetyRule {
    SafetyState from;
    SafetyInput input;
    SafetyState to;
    bool emits;             // produces a recorded + announced transition
    bool refreshes_raised;  // updates raised_at
};

/// Complete transition table: every (state, input) pair has exactly one rule.
inline constexpr std::array<SafetyRule, 6> kSafetyRules{{
    {SafetyState::Idle,         SafetyInput::Raise,       SafetyState::Active,       true,  true},
    {SafetyState::Active,       SafetyInput::Raise,       SafetyState::Active,       false, true},
    {SafetyState::Acknowledged, SafetyInput::Raise,       SafetyState::Active,       true,  true},
    {SafetyState::Active,       SafetyInput::Acknowledge, SafetyState::Acknowledged, true,  false},
    {SafetyState::Idle,         SafetyInput::Acknowledge, SafetyState::Idle,         false, false},
    {SafetyState::Acknowledged, SafetyInput::Acknowledge, SafetyState::Acknowledged, false, false},
}};

const SafetyRule& ruleFor(SafetyState from, SafetyInput input);

struct SafetyIncident {
    WallClock::time_point raised_at;
    std::optional<WallClock::time_point> acknowledged_at;
    std::optional<AssistanceKind> assistance;
};

/// A state change the rest of the pipeline must announce and record
struct SafetyTransition {
    SafetyType type;
    SafetyTransitionKind kind;
    std::optional<AssistanceKind> assistance;
    WallClock::time_point at;
};

struct SafetySnapshot {
    SafetyType type = SafetyType::Fall;
    SafetyState state = SafetyState::Idle;
    std::optional<AssistanceKind> assistance;
    std::optional<WallClock::time_point> raised_at;
    std::optional<WallClock::time_point> acknowledged_at;
    std::vector<SafetyIncident> history;  // oldest first

    /// Idle and Acknowledged both read as inactive
    bool active() const { return state == SafetyState::Active; }
};

/// Independent Fall / Emergency / Assistance state machines, each behind its
/// own mutex. Producers only go through raise() and acknowledge().
class SafetyMonitor {
public:
    SafetyMonitor();

    SafetyMonitor(const SafetyMonitor&) = delete;
    SafetyMonitor& operator=(const SafetyMonitor&) = delete;

    /// Returns a transition for Idle/Acknowledged → Active. Re-raising an
    /// Active event only refreshes raised_at and returns nullopt.
    std::optional<SafetyTransition> raise(SafetyType type,
                                          std::optional<AssistanceKind> assistance = std::nullopt,
                                          WallClock::time_point at = WallClock::now());

    /// Active → Acknowledged. Idempotent: returns nullopt in any other state.
    std::optional<SafetyTransition> acknowledge(SafetyType type,
                                                WallClock::time_point at = WallClock::now());

    SafetyState state(SafetyType type) const;
    bool isActive(SafetyType type) const { return state(type) == SafetyState::Active; }

    SafetySnapshot snapshot(SafetyType type) const;

    static size_t historyLimit(SafetyType type);

private:
    struct Machine {
        mutable std::mutex mutex;
        SafetyState state = SafetyState::Idle;
        std::optional<AssistanceKind> assistance;
        std::optional<WallClock::time_point> raised_at;
        std::optional<WallClock::time_point> acknowledged_at;
        std::deque<SafetyIncident> history;
    };

    Machine& machine(SafetyType type) { return machines_[static_cast<size_t>(type)]; }
    const Machine& machine(SafetyType type) const { return machines_[static_cast<size_t>(type)]; }

    std::array<Machine, 3> machines_;
};

}  // namespace assist
