#include "controllers/status_controller.h"
#include "alert_coordinator.h"
#include "announcer.h"
#include "api_json.h"
#include "connectivity_status.h"
#include "environment_state.h"
#include "mqtt_client.h"
#include "time_utils.h"

#include <drogon/HttpResponse.h>
#include <nlohmann/json.hpp>

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

}  // anonymous namespace

void StatusController::setCoordinator(std::shared_ptr<AlertCoordinator> coordinator) {
    coordinator_ = std::move(coordinator);
}

void StatusController::setAnnouncer(std::shared_ptr<Announcer> announcer) {
    announcer_ = std::move(announcer);
}

void StatusController::setConnectivity(std::shared_ptr<ConnectivityStatus> connectivity) {
    connectivity_ = std::move(connectivity);
}

void StatusController::setEnvironment(std::shared_ptr<EnvironmentState> environment) {
    environment_ = std::move(environment);
}

void StatusController::setMqtt(std::shared_ptr<sightline::MqttClient> mqtt) {
    mqtt_ = std::move(mqtt);
}

void StatusController::getStatus(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    if (!coordinator_) {
        callback(jsonResponse({{"error", "Service not initialized"}},
                              drogon::k500InternalServerError));
        return;
    }

    auto session = coordinator_->sink()->currentSession();
    json result = {
        {"status", session ? "active" : "inactive"},
        {"current_session_id", session ? json(session->id) : json(nullptr)},
        {"timestamp", sightline::time_utils::now_iso8601()},
        {"degraded", connectivity_ ? connectivity_->degraded() : false},
    };
    if (connectivity_) result["connectivity"] = api_json::connectivity(connectivity_->snapshot());

    callback(jsonResponse(result));
}

void StatusController::getHealth(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    bool announcing = announcer_ && announcer_->isRunning();
    bool degraded = connectivity_ && connectivity_->degraded();

    json result = {
        {"service", "sightline-alerts"},
        {"status", !announcing ? "unhealthy" : (degraded ? "degraded" : "healthy")},
        {"timestamp", sightline::time_utils::now_iso8601()},
    };

    if (coordinator_) {
        auto aggregator = coordinator_->aggregator();
        auto stats = aggregator->stats();
        result["queue"] = {
            {"pending", aggregator->pending()},
            {"published", stats.published},
            {"delivered", stats.delivered},
            {"dropped_far", stats.dropped_far},
            {"evicted", stats.evicted},
            {"superseded", stats.superseded},
        };

        auto sink_stats = coordinator_->sink()->stats();
        result["persistence"] = {
            {"store", coordinator_->sink()->hasStore()},
            {"written", sink_stats.written},
            {"failed", sink_stats.failed},
            {"dropped", sink_stats.dropped},
        };
    }
    if (announcer_) result["announcer"] = api_json::announcer(announcer_->stats());
    if (mqtt_) {
        auto mqtt_stats = mqtt_->stats();
        result["mqtt"] = {
            {"connected", mqtt_->isConnected()},
            {"received", mqtt_stats.received},
            {"published", mqtt_stats.published},
            {"dropped", mqtt_stats.dropped},
        };
    }
    if (connectivity_) result["connectivity"] = api_json::connectivity(connectivity_->snapshot());

    // Degraded inputs still serve alerts; only a dead announcer is unhealthy
    callback(jsonResponse(result, announcing ? drogon::k200OK : drogon::k503ServiceUnavailable));
}

void StatusController::getEnvironmental(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    auto reading = environment_ ? environment_->latest() : std::nullopt;
    callback(jsonResponse(api_json::environment(reading)));
}

}  // namespace assist
