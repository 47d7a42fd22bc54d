#pragma once

#include "event_store.h"
#include "speaker.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace assist::testing {

/// EventStore that keeps every write in memory. fail_writes makes every call
/// throw, like an unreachable database.
class InMemoryEventStore : public sightline::EventStore {
public:
    std::atomic<bool> fail_writes{false};

    void createSession(const sightline::SessionRecord& session) override {
        check();
        std::lock_guard lock(mutex_);
        sessions_.push_back(session);
        writes_.push_back("create:" + session.id);
    }

    void finalizeSession(const sightline::SessionRecord& session) override {
        check();
        std::lock_guard lock(mutex_);
        for (auto& s : sessions_) {
            if (s.id == session.id && !s.end_time) s = session;
        }
        writes_.push_back("finalize:" + session.id);
    }

    void insertDetection(const sightline::DetectionRecord& detection) override {
        check();
        std::lock_guard lock(mutex_);
        detections_.push_back(detection);
        writes_.push_back("detection:" + detection.session_id);
    }

    void insertAlert(const sightline::AlertRecord& alert) override {
        check();
        std::lock_guard lock(mutex_);
        alerts_.push_back(alert);
        writes_.push_back("alert:" + alert.session_id);
    }

    void insertVoiceCommand(const sightline::VoiceCommandRecord& command) override {
        check();
        std::lock_guard lock(mutex_);
        voice_commands_.push_back(command);
    }

    void insertSceneSummary(const sightline::SceneSummaryRecord& summary) override {
        check();
        std::lock_guard lock(mutex_);
        scene_summaries_.push_back(summary);
    }

    std::vector<sightline::SessionRecord> sessions() const {
        std::lock_guard lock(mutex_);
        return sessions_;
    }

    std::vector<sightline::DetectionRecord> detections() const {
        std::lock_guard lock(mutex_);
        return detections_;
    }

    std::vector<sightline::AlertRecord> alerts() const {
        std::lock_guard lock(mutex_);
        return alerts_;
    }

    std::vector<sightline::AlertRecord> alertsWithCategory(const std::string& category) const {
        std::lock_guard lock(mutex_);
        std::vector<sightline::AlertRecord> out;
        for (const auto& a : alerts_) {
            if (a.category == category) out.push_back(a);
        }
        return out;
    }

    std::vector<sightline::VoiceCommandRecord> voiceCommands() const {
        std::lock_guard lock(mutex_);
        return voice_commands_;
    }

    std::vector<sightline::SceneSummaryRecord> sceneSummaries() const {
        std::lock_guard lock(mutex_);
        return scene_summaries_;
    }

    /// Session, detection and alert writes in arrival order, as "kind:session_id"
    std::vector<std::string> writes() const {
        std::lock_guard lock(mutex_);
        return writes_;
    }

private:
    void check() const {
        if (fail_writes) throw std::runtime_error("database unavailable");
    }

    mutable std::mutex mutex_;
    std::vector<sightline::SessionRecord> sessions_;
    std::vector<sightline::DetectionRecord> detections_;
    std::vector<sightline::AlertRecord> alerts_;
    std::vector<sightline::VoiceCommandRecord> voice_commands_;
    std::vector<sightline::SceneSummaryRecord> scene_summaries_;
    std::vector<std::string> writes_;
};

/// Speaker that records utterances. When gated, speak() blocks until
/// release() so tests can hold an utterance "in progress".
class RecordingSpeaker : public Speaker {
public:
    explicit RecordingSpeaker(bool gated = false) : gated_(gated) {}

    bool speak(const std::string& text) override {
        {
            std::unique_lock lock(mutex_);
            started_.push_back(text);
            cv_.notify_all();
            if (gated_) {
                cv_.wait(lock, [this] { return releases_ > 0; });
                releases_--;
            }
            spoken_.push_back(text);
        }
        cv_.notify_all();
        return !fail_;
    }

    /// Let one gated utterance finish
    void release() {
        std::lock_guard lock(mutex_);
        releases_++;
        cv_.notify_all();
    }

    void releaseAll() {
        std::lock_guard lock(mutex_);
        gated_ = false;
        releases_ = 1 << 20;
        cv_.notify_all();
    }

    void setFail(bool fail) { fail_ = fail; }

    /// Wait until `count` utterances have started
    bool waitForStarted(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return started_.size() >= count; });
    }

    /// Wait until `count` utterances have finished
    bool waitForSpoken(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return spoken_.size() >= count; });
    }

    std::vector<std::string> spoken() const {
        std::lock_guard lock(mutex_);
        return spoken_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> started_;
    std::vector<std::string> spoken_;
    bool gated_;
    int releases_ = 0;
    std::atomic<bool> fail_{false};
};

}  // namespace assist::testing
