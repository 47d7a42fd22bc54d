#include "stats_queries.h"

#include <pqxx/pqxx>

namespace sightline {

using json = nlohmann::json;

namespace {

// ISO-8601 UTC text, matching time_utils::to_iso8601
std::string iso(const std::string& column) {
    return "to_char(" + column + " AT TIME ZONE 'UTC', "
           "'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"')";
}

json text(const pqxx::field& f) {
    return f.is_null() ? json(nullptr) : json(f.as<std::string>());
}

json integer(const pqxx::field& f) {
    return f.is_null() ? json(0) : json(f.as<int64_t>());
}

json countRows(const pqxx::result& res, const char* key) {
    json out = json::array();
    for (const auto& row : res) {
        out.push_back({{key, text(row[0])}, {"count", integer(row[1])}});
    }
    return out;
}

json sessionRow(const pqxx::row& row) {
    return {
        {"id", text(row["id"])},
        {"start_time", text(row["start_time"])},
        {"end_time", text(row["end_time"])},
        {"duration_seconds", row["duration_seconds"].is_null()
            ? json(nullptr) : json(row["duration_seconds"].as<int64_t>())},
        {"total_detections", integer(row["total_detections"])},
        {"total_alerts", integer(row["total_alerts"])},
        {"critical_alerts", integer(row["critical_alerts"])},
    };
}

json alertRow(const pqxx::row& row) {
    return {
        {"id", text(row["id"])},
        {"session_id", text(row["session_id"])},
        {"timestamp", text(row["ts"])},
        {"category", text(row["category"])},
        {"distance_category", text(row["distance_category"])},
        {"object_type", text(row["object_type"])},
        {"direction", text(row["direction"])},
        {"alert_text", text(row["alert_text"])},
    };
}

json real(const pqxx::field& f) {
    return f.is_null() ? json(nullptr) : json(f.as<double>());
}

const std::string kAlertColumns =
    "id, session_id, " + iso("timestamp") + " AS ts, category, "
    "distance_category, object_type, direction, alert_text";

const std::string kSessionColumns =
    "id, " + iso("start_time") + " AS start_time, " + iso("end_time") + " AS end_time, "
    "duration_seconds, total_detections, total_alerts, critical_alerts";

}  // anonymous namespace

StatsQueries::StatsQueries(std::shared_ptr<DbPool> db)
    : db_(std::move(db))
{
}

json StatsQueries::recentAlerts(int limit) {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto res = txn.exec("SELECT " + kAlertColumns +
                        " FROM alerts ORDER BY timestamp DESC LIMIT $1",
                        pqxx::params{limit});

    json out = json::array();
    for (const auto& row : res) out.push_back(alertRow(row));
    return out;
}

json StatsQueries::voiceCommands(int limit) {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto res = txn.exec(
        "SELECT id, session_id, " + iso("timestamp") + " AS ts, command, response "
        "FROM voice_commands ORDER BY timestamp DESC LIMIT $1",
        pqxx::params{limit});

    json out = json::array();
    for (const auto& row : res) {
        out.push_back({
            {"id", integer(row["id"])},
            {"session_id", text(row["session_id"])},
            {"timestamp", text(row["ts"])},
            {"command", text(row["command"])},
            {"response", text(row["response"])},
        });
    }
    return out;
}

json StatsQueries::sessions() {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto res = txn.exec("SELECT " + kSessionColumns +
                        " FROM sessions ORDER BY sessions.start_time DESC");

    json out = json::array();
    for (const auto& row : res) out.push_back(sessionRow(row));
    return out;
}

json StatsQueries::sessionDetail(const std::string& session_id) {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto res = txn.exec("SELECT " + kSessionColumns + " FROM sessions WHERE id = $1",
                        pqxx::params{session_id});
    if (res.empty()) return nullptr;

    json session = sessionRow(res[0]);

    auto objects = txn.exec(R"(
        SELECT object_type, COUNT(*) AS count
        FROM detections
        WHERE session_id = $1
        GROUP BY object_type
        ORDER BY count DESC
    )", pqxx::params{session_id});
    session["object_distribution"] = countRows(objects, "object_type");

    auto timeline = txn.exec(
        "SELECT " + iso("timestamp") + " AS ts, category, object_type, "
        "distance_category, direction "
        "FROM alerts WHERE session_id = $1 ORDER BY timestamp",
        pqxx::params{session_id});

    json alerts = json::array();
    for (const auto& row : timeline) {
        alerts.push_back({
            {"timestamp", text(row["ts"])},
            {"category", text(row["category"])},
            {"object_type", text(row["object_type"])},
            {"distance_category", text(row["distance_category"])},
            {"direction", text(row["direction"])},
        });
    }
    session["alert_timeline"] = alerts;
    return session;
}

json StatsQueries::exportSession(const std::string& session_id) {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto res = txn.exec("SELECT " + kSessionColumns + " FROM sessions WHERE id = $1",
                        pqxx::params{session_id});
    if (res.empty()) return nullptr;

    json detections = json::array();
    for (const auto& row : txn.exec(
            "SELECT " + iso("timestamp") + " AS ts, object_type, distance_category, "
            "distance_score, direction, bbox_x1, bbox_y1, bbox_x2, bbox_y2, "
            "confidence, announced "
            "FROM detections WHERE session_id = $1 ORDER BY timestamp, id",
            pqxx::params{session_id})) {
        detections.push_back({
            {"timestamp", text(row["ts"])},
            {"object_type", text(row["object_type"])},
            {"distance_category", text(row["distance_category"])},
            {"distance_score", real(row["distance_score"])},
            {"direction", text(row["direction"])},
            {"bbox", {integer(row["bbox_x1"]), integer(row["bbox_y1"]),
                      integer(row["bbox_x2"]), integer(row["bbox_y2"])}},
            {"confidence", real(row["confidence"])},
            {"announced", !row["announced"].is_null() && row["announced"].as<bool>()},
        });
    }

    json alerts = json::array();
    for (const auto& row : txn.exec(
            "SELECT " + kAlertColumns +
            " FROM alerts WHERE session_id = $1 ORDER BY timestamp",
            pqxx::params{session_id})) {
        alerts.push_back(alertRow(row));
    }

    json commands = json::array();
    for (const auto& row : txn.exec(
            "SELECT " + iso("timestamp") + " AS ts, command, response "
            "FROM voice_commands WHERE session_id = $1 ORDER BY timestamp, id",
            pqxx::params{session_id})) {
        commands.push_back({
            {"timestamp", text(row["ts"])},
            {"command", text(row["command"])},
            {"response", text(row["response"])},
        });
    }

    json summaries = json::array();
    for (const auto& row : txn.exec(
            "SELECT " + iso("timestamp") + " AS ts, summary_text, object_count "
            "FROM scene_summaries WHERE session_id = $1 ORDER BY timestamp, id",
            pqxx::params{session_id})) {
        summaries.push_back({
            {"timestamp", text(row["ts"])},
            {"summary_text", text(row["summary_text"])},
            {"object_count", integer(row["object_count"])},
        });
    }

    return {
        {"session", sessionRow(res[0])},
        {"detections", detections},
        {"alerts", alerts},
        {"voice_commands", commands},
        {"scene_summaries", summaries},
    };
}

json StatsQueries::overall() {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto row = txn.exec(R"(
        SELECT
            COUNT(*) AS total_sessions,
            COALESCE(SUM(duration_seconds), 0) AS total_duration,
            COALESCE(SUM(total_detections), 0) AS total_detections,
            COALESCE(SUM(total_alerts), 0) AS total_alerts,
            COALESCE(SUM(critical_alerts), 0) AS total_critical_alerts
        FROM sessions
    )").one_row();

    return {
        {"total_sessions", integer(row["total_sessions"])},
        {"total_duration", integer(row["total_duration"])},
        {"total_detections", integer(row["total_detections"])},
        {"total_alerts", integer(row["total_alerts"])},
        {"total_critical_alerts", integer(row["total_critical_alerts"])},
    };
}

json StatsQueries::safety() {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto counts = txn.exec(R"(
        SELECT
            COUNT(*) FILTER (WHERE distance_category = 'critical') AS critical,
            COUNT(*) FILTER (WHERE distance_category = 'warning') AS warning,
            COUNT(*) FILTER (WHERE category = 'safety') AS safety
        FROM alerts
        WHERE timestamp > NOW() - INTERVAL '24 hours'
    )").one_row();

    auto hours = txn.exec(R"(
        SELECT to_char(timestamp, 'HH24') AS hour, COUNT(*) AS count
        FROM alerts
        WHERE distance_category IN ('critical', 'warning')
        GROUP BY hour
        ORDER BY count DESC
        LIMIT 5
    )");

    auto objects = txn.exec(R"(
        SELECT object_type, COUNT(*) AS count
        FROM alerts
        WHERE distance_category = 'critical'
        GROUP BY object_type
        ORDER BY count DESC
        LIMIT 5
    )");

    auto by_type = txn.exec(R"(
        SELECT distance_category, COUNT(*) AS count
        FROM alerts
        WHERE category = 'safety' AND timestamp > NOW() - INTERVAL '24 hours'
        GROUP BY distance_category
        ORDER BY count DESC
    )");

    return {
        {"critical_alerts_24h", integer(counts["critical"])},
        {"warning_alerts_24h", integer(counts["warning"])},
        {"safety_alerts_24h", integer(counts["safety"])},
        {"dangerous_hours", countRows(hours, "hour")},
        {"dangerous_objects", countRows(objects, "object_type")},
        {"safety_events", countRows(by_type, "type")},
    };
}

json StatsQueries::objects() {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto common = txn.exec(R"(
        SELECT object_type, COUNT(*) AS count
        FROM detections
        GROUP BY object_type
        ORDER BY count DESC
        LIMIT 10
    )");

    auto distance = txn.exec(R"(
        SELECT distance_category, COUNT(*) AS count
        FROM detections
        WHERE distance_category IS NOT NULL
        GROUP BY distance_category
    )");

    auto direction = txn.exec(R"(
        SELECT direction, COUNT(*) AS count
        FROM detections
        WHERE direction IS NOT NULL
        GROUP BY direction
    )");

    return {
        {"common_objects", countRows(common, "object_type")},
        {"distance_distribution", countRows(distance, "distance_category")},
        {"direction_distribution", countRows(direction, "direction")},
    };
}

json StatsQueries::timeline(int hours) {
    auto conn = db_->acquire();
    pqxx::read_transaction txn(*conn);

    auto detections = txn.exec(R"(
        SELECT to_char(date_trunc('hour', timestamp), 'YYYY-MM-DD HH24:00') AS hour,
               COUNT(*) AS count
        FROM detections
        WHERE timestamp > NOW() - make_interval(hours => $1)
        GROUP BY hour
        ORDER BY hour
    )", pqxx::params{hours});

    auto alerts = txn.exec(R"(
        SELECT to_char(date_trunc('hour', timestamp), 'YYYY-MM-DD HH24:00') AS hour,
               distance_category,
               COUNT(*) AS count
        FROM alerts
        WHERE timestamp > NOW() - make_interval(hours => $1)
        GROUP BY hour, distance_category
        ORDER BY hour
    )", pqxx::params{hours});

    json alerts_json = json::array();
    for (const auto& row : alerts) {
        alerts_json.push_back({
            {"hour", text(row["hour"])},
            {"distance_category", text(row["distance_category"])},
            {"count", integer(row["count"])},
        });
    }

    return {
        {"detections", countRows(detections, "hour")},
        {"alerts", alerts_json},
    };
}

}  // namespace sightline
