#pragma once

#include "alert_types.h"

#include <drogon/HttpController.h>
#include <memory>

namespace assist {

class AlertCoordinator;

/// Safety status and acknowledge endpoints. Acknowledge is a GET to match
/// the sensor service and is idempotent.
class SafetyController : public drogon::HttpController<SafetyController> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(SafetyController::fallStatus, "/api/fall_status", drogon::Get);
    ADD_METHOD_TO(SafetyController::fallAcknowledge, "/api/fall_acknowledge", drogon::Get, drogon::Post);
    ADD_METHOD_TO(SafetyController::emergencyStatus, "/api/emergency_status", drogon::Get);
    ADD_METHOD_TO(SafetyController::emergencyAcknowledge, "/api/emergency_acknowledge", drogon::Get, drogon::Post);
    ADD_METHOD_TO(SafetyController::assistanceStatus, "/api/assistance_status", drogon::Get);
    ADD_METHOD_TO(SafetyController::assistanceAcknowledge, "/api/assistance_acknowledge", drogon::Get, drogon::Post);
    METHOD_LIST_END

    void fallStatus(const drogon::HttpRequestPtr& req,
                    std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void fallAcknowledge(const drogon::HttpRequestPtr& req,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void emergencyStatus(const drogon::HttpRequestPtr& req,
                         std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void emergencyAcknowledge(const drogon::HttpRequestPtr& req,
                              std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void assistanceStatus(const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    void assistanceAcknowledge(const drogon::HttpRequestPtr& req,
                               std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    static void setCoordinator(std::shared_ptr<AlertCoordinator> coordinator);

private:
    static void status(SafetyType type,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback);
    static void acknowledge(SafetyType type,
                            std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    static inline std::shared_ptr<AlertCoordinator> coordinator_;
};

}  // namespace assist
