#pragma once

#include <drogon/HttpController.h>
#include <memory>

namespace sightline {
class StatsQueries;
}

namespace assist {

class PersistenceSink;

/// Read-only dashboard statistics over the audit store. Every endpoint but
/// overview answers 503 while the database is unavailable.
class StatsController : public drogon::HttpController<StatsController> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(StatsController::overview, "/api/stats/overview", drogon::Get);
    ADD_METHOD_TO(StatsController::safety, "/api/stats/safety", drogon::Get);
    ADD_METHOD_TO(StatsController::objects, "/api/stats/objects", drogon::Get);
    ADD_METHOD_TO(StatsController::timeline, "/api/stats/timeline", drogon::Get);
    ADD_METHOD_TO(StatsController::recentAlerts, "/api/alerts/recent", drogon::Get);
    ADD_METHOD_TO(StatsController::voiceCommands, "/api/voice_commands", drogon::Get);
    ADD_METHOD_TO(StatsController::sessions, "/api/sessions", drogon::Get);
    ADD_METHOD_TO(StatsController::session, "/api/sessions/{session_id}", drogon::Get);
    ADD_METHOD_TO(StatsController::exportSession, "/api/sessions/{session_id}/export", drogon::Get);
    METHOD_LIST_END

    /// {overall, current_session}; overall is null without a database
    void overview(const drogon::HttpRequestPtr& req,
                  std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void safety(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void objects(const drogon::HttpRequestPtr& req,
                 std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /// ?hours=N (default 24, max 720)
    void timeline(const drogon::HttpRequestPtr& req,
                  std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /// ?limit=N (default 50, max 500)
    void recentAlerts(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void voiceCommands(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void sessions(const drogon::HttpRequestPtr& req,
                  std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void session(const drogon::HttpRequestPtr& req,
                 std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                 const std::string& session_id);

    /// Full session dump served as a session_<id>.json attachment
    void exportSession(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                       const std::string& session_id);

    static void setQueries(std::shared_ptr<sightline::StatsQueries> queries);
    static void setSink(std::shared_ptr<PersistenceSink> sink);

private:
    static inline std::shared_ptr<sightline::StatsQueries> queries_;
    static inline std::shared_ptr<PersistenceSink> sink_;
};

}  // namespace assist
