#pragma once

#include "records.h"

namespace sightline {

/// Write side of the caregiver audit store. Implementations throw on storage
/// failure; callers decide whether a failure is fatal (it never is on the
/// live alert path).
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual void createSession(const SessionRecord& session) = 0;

    /// Write end_time, duration and final counters. Called once per session.
    virtual void finalizeSession(const SessionRecord& session) = 0;

    virtual void insertDetection(const DetectionRecord& detection) = 0;
    virtual void insertAlert(const AlertRecord& alert) = 0;
    virtual void insertVoiceCommand(const VoiceCommandRecord& command) = 0;
    virtual void insertSceneSummary(const SceneSummaryRecord& summary) = 0;
};

}  // namespace sightline
