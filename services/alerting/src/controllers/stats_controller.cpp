#include "controllers/stats_controller.h"
#include "api_json.h"
#include "persistence_sink.h"
#include "stats_queries.h"

#include <drogon/HttpResponse.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace assist {

using json = nlohmann::json;

namespace {

drogon::HttpResponsePtr jsonResponse(const json& body,
                                     drogon::HttpStatusCode code = drogon::k200OK) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

/// Run a query, mapping a missing database to 503 and query errors to 500
template <typename Query>
void respond(const std::shared_ptr<sightline::StatsQueries>& queries, const char* what,
             std::function<void(const drogon::HttpResponsePtr&)>& callback, Query query) {
    if (!queries) {
        callback(jsonResponse({{"error", "Database unavailable"}},
                              drogon::k503ServiceUnavailable));
        return;
    }
    try {
        callback(jsonResponse(query(*queries)));
    } catch (const std::exception& e) {
        spdlog::error("StatsController: {} query failed: {}", what, e.what());
        callback(jsonResponse({{"error", "Query failed"}}, drogon::k500InternalServerError));
    }
}

}  // anonymous namespace

void StatsController::setQueries(std::shared_ptr<sightline::StatsQueries> queries) {
    queries_ = std::move(queries);
}

void StatsController::setSink(std::shared_ptr<PersistenceSink> sink) {
    sink_ = std::move(sink);
}

void StatsController::overview(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    json result = {
        {"overall", nullptr},
        {"current_session", api_json::session(sink_ ? sink_->currentSession() : std::nullopt)},
    };

    if (queries_) {
        try {
            result["overall"] = queries_->overall();
        } catch (const std::exception& e) {
            spdlog::error("StatsController: overview query failed: {}", e.what());
        }
    }
    callback(jsonResponse(result));
}

void StatsController::safety(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    respond(queries_, "safety", callback, [](sightline::StatsQueries& q) { return q.safety(); });
}

void StatsController::objects(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    respond(queries_, "objects", callback, [](sightline::StatsQueries& q) { return q.objects(); });
}

void StatsController::timeline(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    int hours = api_json::clampParam(req->getParameter("hours"), 24, 1, 720);
    respond(queries_, "timeline", callback,
            [hours](sightline::StatsQueries& q) { return q.timeline(hours); });
}

void StatsController::recentAlerts(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    int limit = api_json::clampParam(req->getParameter("limit"), 50, 1, 500);
    respond(queries_, "recent alerts", callback,
            [limit](sightline::StatsQueries& q) { return q.recentAlerts(limit); });
}

void StatsController::voiceCommands(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    int limit = api_json::clampParam(req->getParameter("limit"), 50, 1, 500);
    respond(queries_, "voice commands", callback,
            [limit](sightline::StatsQueries& q) { return q.voiceCommands(limit); });
}

void StatsController::sessions(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    respond(queries_, "sessions", callback, [](sightline::StatsQueries& q) { return q.sessions(); });
}

void StatsController::session(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& session_id)
{
    if (!queries_) {
        callback(jsonResponse({{"error", "Database unavailable"}},
                              drogon::k503ServiceUnavailable));
        return;
    }

    try {
        auto detail = queries_->sessionDetail(session_id);
        if (detail.is_null()) {
            callback(jsonResponse({{"error", "Session not found: " + session_id}},
                                  drogon::k404NotFound));
            return;
        }
        callback(jsonResponse(detail));
    } catch (const std::exception& e) {
        spdlog::error("StatsController: session {} query failed: {}", session_id, e.what());
        callback(jsonResponse({{"error", "Query failed"}}, drogon::k500InternalServerError));
    }
}

void StatsController::exportSession(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& session_id)
{
    if (!queries_) {
        callback(jsonResponse({{"error", "Database unavailable"}},
                              drogon::k503ServiceUnavailable));
        return;
    }

    try {
        auto dump = queries_->exportSession(session_id);
        if (dump.is_null()) {
            callback(jsonResponse({{"error", "Session not found: " + session_id}},
                                  drogon::k404NotFound));
            return;
        }
        auto resp = jsonResponse(dump);
        resp->addHeader("Content-Disposition",
                        "attachment; filename=" + api_json::exportFilename(session_id));
        callback(resp);
        spdlog::info("StatsController: exported session {} ({} detections, {} alerts)",
                     session_id, dump["detections"].size(), dump["alerts"].size());
    } catch (const std::exception& e) {
        spdlog::error("StatsController: session {} export failed: {}", session_id, e.what());
        callback(jsonResponse({{"error", "Query failed"}}, drogon::k500InternalServerError));
    }
}

}  // namespace assist
