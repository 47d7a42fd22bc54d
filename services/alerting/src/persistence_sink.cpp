#include "persistence_sink.h"
#include "time_utils.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace assist {

using sightline::SessionRecord;

PersistenceSink::PersistenceSink(std::shared_ptr<sightline::EventStore> store, size_t max_pending)
    : store_(std::move(store))
    , max_pending_(max_pending)
{
    if (!store_) {
        spdlog::warn("PersistenceSink: no event store, facts will not be persisted");
    }
}

PersistenceSink::~PersistenceSink() {
    stop();
}

void PersistenceSink::start() {
    if (running_.exchange(true)) return;
    writer_ = std::thread(&PersistenceSink::writerLoop, this);
    spdlog::info("PersistenceSink: writer started");
}

void PersistenceSink::stop() {
    if (!running_.exchange(false)) return;
    queue_cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    spdlog::info("PersistenceSink: stopped ({} written, {} failed, {} dropped)",
                 written_.load(), failed_.load(), dropped_.load());
}

std::string PersistenceSink::ensureSessionLocked(WallClock::time_point at) {
    if (session_) return session_->id;

    SessionRecord session;
    session.id = sightline::time_utils::generate_id();
    session.start_time = at;
    session_ = session;

    spdlog::info("PersistenceSink: session {} opened", session.id);
    enqueue("session", [session](sightline::EventStore& store) {
        store.createSession(session);
    });
    return session.id;
}

SessionRecord PersistenceSink::openSession(WallClock::time_point at) {
    std::lock_guard lock(session_mutex_);
    ensureSessionLocked(at);
    return *session_;
}

std::optional<SessionRecord> PersistenceSink::closeSession(WallClock::time_point at) {
    SessionRecord closed;
    {
        // Records are queued under this lock too, so none stamped with this
        // session can land behind its finalize
        std::lock_guard lock(session_mutex_);
        if (!session_) return std::nullopt;
        closed = *session_;
        closed.end_time = at;
        session_.reset();
        enqueue("session close", [closed](sightline::EventStore& store) {
            store.finalizeSession(closed);
        });
    }

    spdlog::info("PersistenceSink: session {} closed ({} detections, {} alerts, {} critical)",
                 closed.id, closed.total_detections, closed.total_alerts, closed.critical_alerts);
    return closed;
}

std::optional<SessionRecord> PersistenceSink::currentSession() const {
    std::lock_guard lock(session_mutex_);
    return session_;
}

void PersistenceSink::recordDetection(const ProximityEvent& event, bool announced) {
    sightline::DetectionRecord record;
    record.timestamp = event.timestamp;
    record.object_type = event.object_type;
    record.distance_category = toString(event.zone);
    record.distance_score = event.size_fraction;
    record.direction = toString(event.direction);
    record.bbox_x1 = static_cast<int>(std::lround(event.x1));
    record.bbox_y1 = static_cast<int>(std::lround(event.y1));
    record.bbox_x2 = static_cast<int>(std::lround(event.x2));
    record.bbox_y2 = static_cast<int>(std::lround(event.y2));
    record.confidence = event.confidence;
    record.announced = announced;

    std::lock_guard lock(session_mutex_);
    record.session_id = ensureSessionLocked(event.timestamp);
    session_->total_detections++;
    enqueue("detection", [record](sightline::EventStore& store) {
        store.insertDetection(record);
    });
}

std::string PersistenceSink::recordAlert(const Alert& alert) {
    sightline::AlertRecord record;
    record.id = sightline::time_utils::generate_id();
    record.timestamp = alert.timestamp;
    record.category = alert.category == AlertCategory::Safety ? "safety" : "proximity";
    record.severity = alert.severity();
    record.message = alert.message;
    if (alert.category == AlertCategory::Proximity) {
        record.object_type = alert.object_type;
        record.direction = toString(alert.direction);
    } else if (alert.assistance) {
        record.object_type = toString(*alert.assistance);
    }

    std::lock_guard lock(session_mutex_);
    record.session_id = ensureSessionLocked(alert.timestamp);
    session_->total_alerts++;
    if (alert.category == AlertCategory::Proximity && alert.zone == ProximityZone::Critical) {
        session_->critical_alerts++;
    }
    enqueue("alert", [record](sightline::EventStore& store) {
        store.insertAlert(record);
    });
    return record.id;
}

void PersistenceSink::recordVoiceCommand(const std::string& command, const std::string& response,
                                         WallClock::time_point at) {
    sightline::VoiceCommandRecord record{"", at, command, response};
    std::lock_guard lock(session_mutex_);
    record.session_id = ensureSessionLocked(at);
    enqueue("voice command", [record](sightline::EventStore& store) {
        store.insertVoiceCommand(record);
    });
}

void PersistenceSink::recordSceneSummary(const std::string& summary, int object_count,
                                         WallClock::time_point at) {
    sightline::SceneSummaryRecord record{"", at, summary, object_count};
    std::lock_guard lock(session_mutex_);
    record.session_id = ensureSessionLocked(at);
    enqueue("scene summary", [record](sightline::EventStore& store) {
        store.insertSceneSummary(record);
    });
}

void PersistenceSink::enqueue(const char* what, Job job) {
    if (!store_) {
        dropped_++;
        spdlog::debug("PersistenceSink: no store, skipping {}", what);
        return;
    }

    {
        std::lock_guard lock(queue_mutex_);
        if (queue_.size() >= max_pending_) {
            dropped_++;
            spdlog::warn("PersistenceSink: write queue full ({}), dropping {}", max_pending_, what);
            return;
        }
        queue_.emplace_back(what, std::move(job));
    }
    queue_cv_.notify_one();
}

void PersistenceSink::flush() {
    if (!running_) {
        // No writer: drain on the caller's thread
        std::deque<std::pair<const char*, Job>> pending;
        {
            std::lock_guard lock(queue_mutex_);
            pending.swap(queue_);
        }
        for (auto& [what, job] : pending) {
            try {
                job(*store_);
                written_++;
            } catch (const std::exception& e) {
                failed_++;
                spdlog::error("PersistenceSink: {} write failed: {}", what, e.what());
            }
        }
        return;
    }

    std::unique_lock lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return (queue_.empty() && !writing_) || !running_; });
}

void PersistenceSink::writerLoop() {
    while (true) {
        std::pair<const char*, Job> item;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) break;  // stopped and drained
            item = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
        }

        try {
            item.second(*store_);
            written_++;
        } catch (const std::exception& e) {
            failed_++;
            spdlog::error("PersistenceSink: {} write failed: {}", item.first, e.what());
        }

        {
            std::lock_guard lock(queue_mutex_);
            writing_ = false;
        }
        drained_cv_.notify_all();
    }
    drained_cv_.notify_all();
}

PersistenceSink::Stats PersistenceSink::stats() const {
    return Stats{written_.load(), failed_.load(), dropped_.load()};
}

}  // namespace assist
