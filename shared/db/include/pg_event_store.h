#pragma once

#include "db_pool.h"
#include "event_store.h"

#include <memory>

namespace sightline {

/// PostgreSQL-backed EventStore. Each call runs in its own transaction on a
/// pooled connection; pqxx exceptions propagate to the caller.
class PgEventStore : public EventStore {
public:
    explicit PgEventStore(std::shared_ptr<DbPool> db);

    /// CREATE TABLE IF NOT EXISTS for every audit table
    void ensureSchema();

    void createSession(const SessionRecord& session) override;
    void finalizeSession(const SessionRecord& session) override;
    void insertDetection(const DetectionRecord& detection) override;
    void insertAlert(const AlertRecord& alert) override;
    void insertVoiceCommand(const VoiceCommandRecord& command) override;
    void insertSceneSummary(const SceneSummaryRecord& summary) override;

private:
    std::shared_ptr<DbPool> db_;
};

}  // namespace sightline
