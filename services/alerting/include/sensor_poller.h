#pragma once

#include "alert_types.h"
#include "config_manager.h"
#include "connectivity_status.h"
#include "environment_state.h"
#include "http_fetch.h"
#include "safety_monitor.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace assist {

/// One poll of a safety endpoint on the sensor service
struct SafetyReading {
    bool active = false;
    std::optional<double> source_timestamp;    // epoch seconds
    std::optional<AssistanceKind> assistance;
};

/// Periodic pollers for the Pi sensor service, one thread per source, each
/// with its own timeout and exponential backoff. Readings only ever reach the
/// SafetyMonitor through the raise handler; a failed poll marks the source
/// degraded and leaves safety state untouched.
class SensorPoller {
public:
    using Fetch = std::function<sightline::HttpFetch::Result(const std::string& url,
                                                             long timeout_ms)>;
    using RaiseHandler = std::function<void(SafetyType, std::optional<AssistanceKind>,
                                            WallClock::time_point)>;

    SensorPoller(const sightline::SensorConfig& config,
                 std::shared_ptr<const SafetyMonitor> monitor,
                 RaiseHandler on_raise,
                 std::shared_ptr<ConnectivityStatus> connectivity,
                 std::shared_ptr<EnvironmentState> environment,
                 Fetch fetch = &sightline::HttpFetch::get);
    ~SensorPoller();

    SensorPoller(const SensorPoller&) = delete;
    SensorPoller& operator=(const SensorPoller&) = delete;

    void start();
    void stop();

    /// Poll one safety endpoint now. Returns false on transport or parse failure.
    bool pollSafety(SafetyType type);

    bool pollEnvironment();

    /// Queue an acknowledgement for the sensor service. Sent before the
    /// next poll of that type, and wakes that poller.
    void forwardAcknowledge(SafetyType type);

    /// Send queued acknowledgements for one type. Failed sends stay queued.
    void sendPendingAcknowledge(SafetyType type);

    bool hasPendingAcknowledge(SafetyType type) const;

    /// Delay before the next poll after `failures` consecutive failures
    static std::chrono::milliseconds backoff(std::chrono::milliseconds interval,
                                             int failures,
                                             std::chrono::milliseconds max_backoff);

    static std::optional<SafetyReading> parseSafety(SafetyType type, const std::string& body);
    static std::optional<EnvironmentReading> parseEnvironment(const std::string& body);

    /// Connectivity source name for a type ("fall", ...)
    static std::string sourceName(SafetyType type) { return toString(type); }

private:
    void safetyLoop(SafetyType type);
    void environmentLoop();

    /// Wait up to `delay`; returns false if stopping. Wakes early when an
    /// acknowledgement for `type` is queued.
    bool waitFor(std::chrono::milliseconds delay, std::optional<SafetyType> type);

    std::string url(const std::string& path) const;

    sightline::SensorConfig config_;
    std::shared_ptr<const SafetyMonitor> monitor_;
    RaiseHandler on_raise_;
    std::shared_ptr<ConnectivityStatus> connectivity_;
    std::shared_ptr<EnvironmentState> environment_;
    Fetch fetch_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::set<SafetyType> pending_acks_;
    std::set<SafetyType> wake_requests_;
    std::map<SafetyType, double> last_seen_;   // last source timestamp raised

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

}  // namespace assist
