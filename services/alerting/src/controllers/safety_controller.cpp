#include "controllers/safety_controller.h"
#include "alert_coordinator.h"
#include "api_json.h"

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

void SafetyController::setCoordinator(std::shared_ptr<AlertCoordinator> coordinator) {
    coordinator_ = std::move(coordinator);
}

void SafetyController::status(SafetyType type,
                              std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    if (!coordinator_) {
        callback(jsonResponse({{"error", "Service not initialized"}},
                              drogon::k500InternalServerError));
        return;
    }
    callback(jsonResponse(api_json::safetyStatus(coordinator_->monitor()->snapshot(type))));
}

void SafetyController::acknowledge(SafetyType type,
                                   std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    if (!coordinator_) {
        callback(jsonResponse({{"error", "Service not initialized"}},
                              drogon::k500InternalServerError));
        return;
    }
    auto now = WallClock::now();
    bool changed = coordinator_->acknowledge(type, now);
    callback(jsonResponse(api_json::acknowledgeResult(type, changed, now)));
}

void SafetyController::fallStatus(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    status(SafetyType::Fall, std::move(callback));
}

void SafetyController::fallAcknowledge(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    acknowledge(SafetyType::Fall, std::move(callback));
}

void SafetyController::emergencyStatus(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    status(SafetyType::Emergency, std::move(callback));
}

void SafetyController::emergencyAcknowledge(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    acknowledge(SafetyType::Emergency, std::move(callback));
}

void SafetyController::assistanceStatus(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    status(SafetyType::Assistance, std::move(callback));
}

void SafetyController::assistanceAcknowledge(
    const drogon::HttpRequestPtr& /*req*/,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback)
{
    acknowledge(SafetyType::Assistance, std::move(callback));
}

}  // namespace assist
