#include "safety_monitor.h"
#include "time_utils.h"

#include <spdlog/spdlog.h>

namespace assist {

const char* toString(SafetyState state) {
    switch (state) {
        case SafetyState::Idle:         return "idle";
        case SafetyState::Active:       return "active";
        case SafetyState::Acknowledged: return "acknowledged";
    }
    return "idle";
}

const SafetyRule& ruleFor(SafetyState from, SafetyInput input) {
    for (const auto& rule : kSafetyRules) {
        if (rule.from == from && rule.input == input) return rule;
    }
    // Table is complete; unreachable unless an enumerator is added without a rule
    return kSafetyRules.front();
}

SafetyMonitor::SafetyMonitor() = default;

size_t SafetyMonitor::historyLimit(SafetyType type) {
    return type == SafetyType::Assistance ? 20 : 10;
}

std::optional<SafetyTransition> SafetyMonitor::raise(SafetyType type,
                                                     std::optional<AssistanceKind> assistance,
                                                     WallClock::time_point at) {
    auto& m = machine(type);
    std::lock_guard lock(m.mutex);

    const auto& rule = ruleFor(m.state, SafetyInput::Raise);
    m.state = rule.to;
    if (rule.refreshes_raised) m.raised_at = at;

    if (!rule.emits) {
        spdlog::debug("SafetyMonitor: {} still active, raised_at refreshed", toString(type));
        return std::nullopt;
    }

    // New incident
    if (type == SafetyType::Assistance) {
        m.assistance = assistance.value_or(AssistanceKind::General);
    }
    m.acknowledged_at.reset();
    m.history.push_back(SafetyIncident{at, std::nullopt, m.assistance});
    while (m.history.size() > historyLimit(type)) m.history.pop_front();

    spdlog::warn("SafetyMonitor: {} raised{}{}", toString(type),
                 m.assistance ? " - " : "", m.assistance ? label(*m.assistance) : "");

    return SafetyTransition{type, SafetyTransitionKind::Raised, m.assistance, at};
}

std::optional<SafetyTransition> SafetyMonitor::acknowledge(SafetyType type,
                                                           WallClock::time_point at) {
    auto& m = machine(type);
    std::lock_guard lock(m.mutex);

    const auto& rule = ruleFor(m.state, SafetyInput::Acknowledge);
    m.state = rule.to;
    if (!rule.emits) {
        spdlog::debug("SafetyMonitor: acknowledge {} ignored (not active)", toString(type));
        return std::nullopt;
    }

    m.acknowledged_at = at;
    if (!m.history.empty()) m.history.back().acknowledged_at = at;

    spdlog::info("SafetyMonitor: {} acknowledged at {}", toString(type),
                 sightline::time_utils::to_iso8601(at));

    return SafetyTransition{type, SafetyTransitionKind::Acknowledged, m.assistance, at};
}

SafetyState SafetyMonitor::state(SafetyType type) const {
    const auto& m = machine(type);
    std::lock_guard lock(m.mutex);
    return m.state;
}

SafetySnapshot SafetyMonitor::snapshot(SafetyType type) const {
    const auto& m = machine(type);
    std::lock_guard lock(m.mutex);

    SafetySnapshot snap;
    snap.type = type;
    snap.state = m.state;
    snap.assistance = m.assistance;
    snap.raised_at = m.raised_at;
    snap.acknowledged_at = m.acknowledged_at;
    snap.history.assign(m.history.begin(), m.history.end());
    return snap;
}

}  // namespace assist
