#pragma once

#include "db_pool.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace sightline {

/// Read-only dashboard queries over the audit tables. Every method opens a
/// read-only transaction and returns plain JSON; pqxx errors propagate.
class StatsQueries {
public:
    explicit StatsQueries(std::shared_ptr<DbPool> db);

    /// Newest first
    nlohmann::json recentAlerts(int limit);
    nlohmann::json voiceCommands(int limit);
    nlohmann::json sessions();

    /// Session row plus object_distribution and alert_timeline. Null if the
    /// session does not exist.
    nlohmann::json sessionDetail(const std::string& session_id);

    /// Every row recorded for the session: {session, detections, alerts,
    /// voice_commands, scene_summaries}, oldest first. Null if unknown.
    nlohmann::json exportSession(const std::string& session_id);

    /// Totals across finalized sessions
    nlohmann::json overall();

    nlohmann::json safety();
    nlohmann::json objects();
    nlohmann::json timeline(int hours);

private:
    std::shared_ptr<DbPool> db_;
};

}  // namespace sightline
