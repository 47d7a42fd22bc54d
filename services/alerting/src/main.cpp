#include <drogon/drogon.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <iostream>

#include "config_manager.h"
#include "db_pool.h"
#include "http_fetch.h"
#include "mqtt_client.h"
#include "pg_event_store.h"
#include "stats_queries.h"
#include "alert_aggregator.h"
#include "alert_coordinator.h"
#include "announcer.h"
#include "connectivity_status.h"
#include "cooldown_tracker.h"
#include "detection_feed.h"
#include "environment_state.h"
#include "persistence_sink.h"
#include "proximity_classifier.h"
#include "safety_monitor.h"
#include "sensor_poller.h"
#include "speech_client.h"
#include "voice_assistant.h"
#include "controllers/safety_controller.h"
#include "controllers/stats_controller.h"
#include "controllers/status_controller.h"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    g_shutdown = true;
    drogon::app().quit();
}

void setup_logging(const sightline::LoggingConfig& log_config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_config.file.empty()) {
        auto dir = fs::path(log_config.file).parent_path();
        if (!dir.empty()) fs::create_directories(dir);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_config.file, log_config.max_bytes, log_config.backup_count));
    }

    auto logger = std::make_shared<spdlog::logger>("sightline", sinks.begin(), sinks.end());

    spdlog::level::level_enum level = spdlog::level::info;
    if (log_config.level == "DEBUG" || log_config.level == "debug") level = spdlog::level::debug;
    else if (log_config.level == "WARNING" || log_config.level == "warning") level = spdlog::level::warn;
    else if (log_config.level == "ERROR" || log_config.level == "error") level = spdlog::level::err;

    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
}

std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == "--config") return argv[i + 1];
    }
    if (fs::exists("config.yaml")) return "config.yaml";
    if (fs::exists("config/config.yaml")) return "config/config.yaml";
    if (fs::exists("/etc/sightline/config.yaml")) return "/etc/sightline/config.yaml";
    return "config.yaml";
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto config_path = find_config_path(argc, argv);
        auto config = sightline::ConfigManager::load(config_path);

        setup_logging(config.logging);
        spdlog::info("Starting sightline alert service");
        spdlog::info("Config: {}", config_path);

        // Missing class list is fatal
        auto classes = sightline::ConfigManager::resolveClasses(config.detection);
        spdlog::info("Relevant classes: {}", classes.size());

        sightline::HttpFetch::globalInit();

        // --- Database pool (audit store + dashboard stats) ---
        std::shared_ptr<sightline::DbPool> db;
        std::shared_ptr<sightline::PgEventStore> store;
        std::shared_ptr<sightline::StatsQueries> queries;
        if (config.database.enabled) {
            try {
                sightline::DbPool::Config db_cfg;
                db_cfg.host = config.database.host;
                db_cfg.port = config.database.port;
                db_cfg.user = config.database.user;
                db_cfg.password = config.database.password;
                db_cfg.database = config.database.database;
                db_cfg.pool_size = config.database.pool_size;
                db = std::make_shared<sightline::DbPool>(db_cfg);

                store = std::make_shared<sightline::PgEventStore>(db);
                store->ensureSchema();
                queries = std::make_shared<sightline::StatsQueries>(db);
            } catch (const std::exception& e) {
                spdlog::warn("Database unavailable: {} (persistence disabled)", e.what());
                store.reset();
                queries.reset();
            }
        }

        // --- Persistence + session ---
        auto sink = std::make_shared<assist::PersistenceSink>(store);
        sink->start();
        auto session = sink->openSession();
        spdlog::info("Session {} started", session.id);

        // --- MQTT (detections in, alerts out) ---
        std::shared_ptr<sightline::MqttClient> mqtt;
        if (config.mqtt.enabled) {
            mqtt = std::make_shared<sightline::MqttClient>(config.mqtt);
            try {
                mqtt->connect();
            } catch (const std::exception& e) {
                spdlog::warn("MQTT unavailable: {} (HTTP will continue serving)", e.what());
            }
        }

        // --- Alert pipeline ---
        auto monitor = std::make_shared<assist::SafetyMonitor>();
        auto cooldown = std::make_shared<assist::CooldownTracker>(
            std::chrono::duration<double>(config.alerts.cooldown_seconds),
            config.alerts.escalation_bypasses_cooldown);
        auto aggregator = std::make_shared<assist::AlertAggregator>(sink, config.alerts.queue_capacity);

        auto speech = std::make_shared<assist::SpeechClient>(config.speech);
        auto announcer = std::make_shared<assist::Announcer>(aggregator, speech);

        assist::ProximityClassifier classifier(
            classes, assist::ProximityClassifier::thresholdsFrom(config.detection));
        auto coordinator = std::make_shared<assist::AlertCoordinator>(
            std::move(classifier), cooldown, monitor, aggregator, sink, mqtt);

        auto connectivity = std::make_shared<assist::ConnectivityStatus>();
        auto environment = std::make_shared<assist::EnvironmentState>();

        std::shared_ptr<assist::SensorPoller> poller;
        if (config.sensors.enabled) {
            poller = std::make_shared<assist::SensorPoller>(
                config.sensors, monitor,
                [coordinator](assist::SafetyType type, std::optional<assist::AssistanceKind> kind,
                              assist::WallClock::time_point at) {
                    coordinator->raiseSafety(type, kind, at);
                },
                connectivity, environment);
            std::weak_ptr<assist::SensorPoller> weak_poller = poller;
            coordinator->setAcknowledgeListener([weak_poller](assist::SafetyType type) {
                if (auto p = weak_poller.lock()) p->forwardAcknowledge(type);
            });
        }

        auto feed = std::make_shared<assist::DetectionFeed>(
            mqtt, coordinator, connectivity,
            std::chrono::milliseconds(config.detection.inference_interval_ms));

        auto voice = std::make_shared<assist::VoiceAssistant>(
            coordinator, environment, [speech]() { return speech->listen(); }, mqtt);

        // Wire controller dependencies
        assist::StatusController::setCoordinator(coordinator);
        assist::StatusController::setAnnouncer(announcer);
        assist::StatusController::setConnectivity(connectivity);
        assist::StatusController::setEnvironment(environment);
        assist::StatusController::setMqtt(mqtt);
        assist::SafetyController::setCoordinator(coordinator);
        assist::StatsController::setQueries(queries);
        assist::StatsController::setSink(sink);

        // Signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        announcer->start();
        coordinator->start();
        feed->start();
        voice->start();
        if (poller) poller->start();

        // Configure Drogon
        auto& app = drogon::app();
        app.setLogLevel(trantor::Logger::kWarn);
        app.addListener(config.api.host, config.api.port);
        app.setThreadNum(config.api.threads);
        app.setMaxConnectionNum(100);

        // Global CORS headers
        app.registerPostHandlingAdvice(
            [](const drogon::HttpRequestPtr& req, const drogon::HttpResponsePtr& resp) {
                auto origin = std::string(req->getHeader("Origin"));
                std::string allow_origin = origin.empty() ? "*" : origin;
                resp->addHeader("Access-Control-Allow-Origin", allow_origin);
                resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
                resp->addHeader("Access-Control-Allow-Headers",
                                "Content-Type, Authorization, Accept");
            }
        );

        spdlog::info("Listening on {}:{}", config.api.host, config.api.port);

        app.run();  // Blocks until quit

        // Cleanup: producers first, then the consumer, then the session
        spdlog::info("Shutting down...");
        if (poller) poller->stop();
        feed->stop();
        voice->stop();
        coordinator->stop();
        announcer->stop();

        if (auto closed = sink->closeSession()) {
            spdlog::info("Session {} closed: {} detections, {} alerts ({} critical)",
                         closed->id, closed->total_detections, closed->total_alerts,
                         closed->critical_alerts);
        }
        sink->stop();

        if (mqtt) mqtt->disconnect();

        sightline::HttpFetch::globalCleanup();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
