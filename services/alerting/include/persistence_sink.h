#pragma once

#include "alert_types.h"
#include "event_store.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace assist {

/// Records detections, alerts, voice commands and scene summaries against the
/// open session. Callers never block on storage: facts are stamped with the
/// session id under the session lock and handed to a single writer thread.
/// Write failures are logged and dropped.
class PersistenceSink {
public:
    struct Stats {
        uint64_t written = 0;
        uint64_t failed = 0;
        uint64_t dropped = 0;   // queue overflow or no store
    };

    /// A null store keeps session bookkeeping but skips every write
    explicit PersistenceSink(std::shared_ptr<sightline::EventStore> store,
                             size_t max_pending = 10000);
    ~PersistenceSink();

    PersistenceSink(const PersistenceSink&) = delete;
    PersistenceSink& operator=(const PersistenceSink&) = delete;

    void start();

    /// Drain pending writes, then join the writer
    void stop();

    /// Returns the open session, opening a fresh one if none is open
    sightline::SessionRecord openSession(WallClock::time_point at = WallClock::now());

    /// One-way: finalizes end_time and counters. Returns the closed session,
    /// or nullopt if nothing was open.
    std::optional<sightline::SessionRecord> closeSession(WallClock::time_point at = WallClock::now());

    std::optional<sightline::SessionRecord> currentSession() const;

    void recordDetection(const ProximityEvent& event, bool announced);

    /// Proximity and safety alerts only. Returns the generated alert id.
    std::string recordAlert(const Alert& alert);

    void recordVoiceCommand(const std::string& command, const std::string& response,
                            WallClock::time_point at = WallClock::now());

    void recordSceneSummary(const std::string& summary, int object_count,
                            WallClock::time_point at = WallClock::now());

    /// Block until every write queued so far has been attempted
    void flush();

    Stats stats() const;

    bool hasStore() const { return store_ != nullptr; }

private:
    using Job = std::function<void(sightline::EventStore&)>;

    /// Must hold session_mutex_. Opens a session if none is open and returns its id.
    std::string ensureSessionLocked(WallClock::time_point at);

    void enqueue(const char* what, Job job);
    void writerLoop();

    std::shared_ptr<sightline::EventStore> store_;
    size_t max_pending_;

    mutable std::mutex session_mutex_;
    std::optional<sightline::SessionRecord> session_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::deque<std::pair<const char*, Job>> queue_;
    bool writing_ = false;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};

    std::thread writer_;
    std::atomic<bool> running_{false};
};

}  // namespace assist
