#include "pg_event_store.h"
#include "time_utils.h"

#include <spdlog/spdlog.h>
#include <pqxx/pqxx>

#include <chrono>

namespace sightline {

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS sessions (
        id               TEXT PRIMARY KEY,
        start_time       TIMESTAMPTZ NOT NULL,
        end_time         TIMESTAMPTZ,
        duration_seconds INTEGER,
        total_detections BIGINT DEFAULT 0,
        total_alerts     BIGINT DEFAULT 0,
        critical_alerts  BIGINT DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS detections (
        id                BIGSERIAL PRIMARY KEY,
        session_id        TEXT REFERENCES sessions(id),
        timestamp         TIMESTAMPTZ NOT NULL,
        object_type       VARCHAR(50) NOT NULL,
        distance_category VARCHAR(20),
        distance_score    REAL,
        direction         VARCHAR(20),
        bbox_x1 INTEGER, bbox_y1 INTEGER, bbox_x2 INTEGER, bbox_y2 INTEGER,
        confidence        REAL,
        announced         BOOLEAN DEFAULT FALSE
    );

    CREATE TABLE IF NOT EXISTS alerts (
        id                TEXT PRIMARY KEY,
        session_id        TEXT REFERENCES sessions(id),
        timestamp         TIMESTAMPTZ NOT NULL,
        category          VARCHAR(20) NOT NULL,
        distance_category VARCHAR(20),
        object_type       VARCHAR(50),
        direction         VARCHAR(20),
        alert_text        TEXT
    );

    CREATE TABLE IF NOT EXISTS voice_commands (
        id         BIGSERIAL PRIMARY KEY,
        session_id TEXT REFERENCES sessions(id),
        timestamp  TIMESTAMPTZ NOT NULL,
        command    TEXT NOT NULL,
        response   TEXT
    );

    CREATE TABLE IF NOT EXISTS scene_summaries (
        id           BIGSERIAL PRIMARY KEY,
        session_id   TEXT REFERENCES sessions(id),
        timestamp    TIMESTAMPTZ NOT NULL,
        summary_text TEXT NOT NULL,
        object_count INTEGER
    );

    CREATE INDEX IF NOT EXISTS detections_session_ts ON detections (session_id, timestamp);
    CREATE INDEX IF NOT EXISTS alerts_session_ts ON alerts (session_id, timestamp);
)";

}  // anonymous namespace

PgEventStore::PgEventStore(std::shared_ptr<DbPool> db)
    : db_(std::move(db))
{
}

void PgEventStore::ensureSchema() {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);
    txn.exec(kSchema);
    txn.commit();
    spdlog::info("PgEventStore: schema ready");
}

void PgEventStore::createSession(const SessionRecord& session) {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    txn.exec(R"(
        INSERT INTO sessions (id, start_time)
        VALUES ($1, $2::timestamptz)
    )", pqxx::params{session.id, time_utils::to_iso8601(session.start_time)});

    txn.commit();
    spdlog::debug("PgEventStore: created session {}", session.id);
}

void PgEventStore::finalizeSession(const SessionRecord& session) {
    auto end_time = session.end_time.value_or(std::chrono::system_clock::now());
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        end_time - session.start_time).count();

    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    // end_time IS NULL guard keeps a closed session's row final
    txn.exec(R"(
        UPDATE sessions
        SET end_time = $2::timestamptz,
            duration_seconds = $3,
            total_detections = $4,
            total_alerts = $5,
            critical_alerts = $6
        WHERE id = $1 AND end_time IS NULL
    )", pqxx::params{
        session.id, time_utils::to_iso8601(end_time),
        static_cast<int>(duration),
        session.total_detections, session.total_alerts, session.critical_alerts
    });

    txn.commit();
    spdlog::debug("PgEventStore: finalized session {} ({}s, {} detections, {} alerts)",
                  session.id, duration, session.total_detections, session.total_alerts);
}

void PgEventStore::insertDetection(const DetectionRecord& det) {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    txn.exec(R"(
        INSERT INTO detections
            (session_id, timestamp, object_type, distance_category, distance_score,
             direction, bbox_x1, bbox_y1, bbox_x2, bbox_y2, confidence, announced)
        VALUES ($1, $2::timestamptz, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12)
    )", pqxx::params{
        det.session_id, time_utils::to_iso8601(det.timestamp),
        det.object_type, det.distance_category, det.distance_score,
        det.direction,
        det.bbox_x1, det.bbox_y1, det.bbox_x2, det.bbox_y2,
        det.confidence, det.announced
    });

    txn.commit();
}

void PgEventStore::insertAlert(const AlertRecord& alert) {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    txn.exec(R"(
        INSERT INTO alerts
            (id, session_id, timestamp, category, distance_category,
             object_type, direction, alert_text)
        VALUES ($1, $2, $3::timestamptz, $4, $5, $6, $7, $8)
    )", pqxx::params{
        alert.id, alert.session_id, time_utils::to_iso8601(alert.timestamp),
        alert.category, alert.severity,
        alert.object_type, alert.direction, alert.message
    });

    txn.commit();
    spdlog::debug("PgEventStore: alert {} [{}:{}] {}",
                  alert.id, alert.category, alert.severity, alert.message);
}

void PgEventStore::insertVoiceCommand(const VoiceCommandRecord& command) {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    txn.exec(R"(
        INSERT INTO voice_commands (session_id, timestamp, command, response)
        VALUES ($1, $2::timestamptz, $3, $4)
    )", pqxx::params{
        command.session_id, time_utils::to_iso8601(command.timestamp),
        command.command, command.response
    });

    txn.commit();
}

void PgEventStore::insertSceneSummary(const SceneSummaryRecord& summary) {
    auto conn = db_->acquire();
    pqxx::work txn(*conn);

    txn.exec(R"(
        INSERT INTO scene_summaries (session_id, timestamp, summary_text, object_count)
        VALUES ($1, $2::timestamptz, $3, $4)
    )", pqxx::params{
        summary.session_id, time_utils::to_iso8601(summary.timestamp),
        summary.summary_text, summary.object_count
    });

    txn.commit();
}

}  // namespace sightline
