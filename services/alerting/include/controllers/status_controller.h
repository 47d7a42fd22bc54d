#pragma once

#include <drogon/HttpController.h>
#include <memory>

namespace sightline {
class MqttClient;
}

namespace assist {

class AlertCoordinator;
class Announcer;
class ConnectivityStatus;
class EnvironmentState;

class StatusController : public drogon::HttpController<StatusController> {
public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(StatusController::getStatus, "/api/status", drogon::Get);
    ADD_METHOD_TO(StatusController::getHealth, "/health", drogon::Get);
    ADD_METHOD_TO(StatusController::getHealth, "/api/health", drogon::Get);
    ADD_METHOD_TO(StatusController::getEnvironmental, "/api/environmental", drogon::Get);
    METHOD_LIST_END

    /// {status: active|inactive} from the open session, plus connectivity
    void getStatus(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void getHealth(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void getEnvironmental(const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    static void setCoordinator(std::shared_ptr<AlertCoordinator> coordinator);
    static void setAnnouncer(std::shared_ptr<Announcer> announcer);
    static void setConnectivity(std::shared_ptr<ConnectivityStatus> connectivity);
    static void setEnvironment(std::shared_ptr<EnvironmentState> environment);
    static void setMqtt(std::shared_ptr<sightline::MqttClient> mqtt);

private:
    static inline std::shared_ptr<AlertCoordinator> coordinator_;
    static inline std::shared_ptr<Announcer> announcer_;
    static inline std::shared_ptr<ConnectivityStatus> connectivity_;
    static inline std::shared_ptr<EnvironmentState> environment_;
    static inline std::shared_ptr<sightline::MqttClient> mqtt_;
};

}  // namespace assist
