#include "sensor_poller.h"
#include "time_utils.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace assist {

namespace {

// Field names on the sensor service
struct SafetyFields {
    const char* active;
    const char* timestamp;
};

SafetyFields fieldsFor(SafetyType type) {
    switch (type) {
        case SafetyType::Fall:       return {"fall_detected", "last_fall_timestamp"};
        case SafetyType::Emergency:  return {"emergency_active", "last_emergency_timestamp"};
        case SafetyType::Assistance: return {"assistance_active", "last_assistance_timestamp"};
    }
    return {"", ""};
}

double numberOr(const json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

}  // anonymous namespace

SensorPoller::SensorPoller(const sightline::SensorConfig& config,
                           std::shared_ptr<const SafetyMonitor> monitor,
                           RaiseHandler on_raise,
                           std::shared_ptr<ConnectivityStatus> connectivity,
                           std::shared_ptr<EnvironmentState> environment,
                           Fetch fetch)
    : config_(config)
    , monitor_(std::move(monitor))
    , on_raise_(std::move(on_raise))
    , connectivity_(std::move(connectivity))
    , environment_(std::move(environment))
    , fetch_(std::move(fetch))
{
}

SensorPoller::~SensorPoller() {
    stop();
}

void SensorPoller::start() {
    if (running_.exchange(true)) return;

    for (auto type : {SafetyType::Fall, SafetyType::Emergency, SafetyType::Assistance}) {
        threads_.emplace_back(&SensorPoller::safetyLoop, this, type);
    }
    threads_.emplace_back(&SensorPoller::environmentLoop, this);

    spdlog::info("SensorPoller: polling {} every {}ms (environment every {}ms)",
                 config_.base_url, config_.safety_poll_ms, config_.environment_poll_ms);
}

void SensorPoller::stop() {
    {
        // Cleared under the lock so a loop between its predicate check and
        // its wait cannot miss the notify
        std::lock_guard lock(mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    spdlog::info("SensorPoller: stopped");
}

std::string SensorPoller::url(const std::string& path) const {
    std::string base = config_.base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + path;
}

std::chrono::milliseconds SensorPoller::backoff(std::chrono::milliseconds interval,
                                                int failures,
                                                std::chrono::milliseconds max_backoff) {
    if (failures <= 0) return interval;
    // Cap the exponent before shifting
    int exponent = std::min(failures, 16);
    auto delay = interval * (1LL << exponent);
    return std::min<std::chrono::milliseconds>(delay, std::max(interval, max_backoff));
}

std::optional<SafetyReading> SensorPoller::parseSafety(SafetyType type, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        spdlog::warn("SensorPoller: bad {} payload: {}", toString(type), e.what());
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    auto fields = fieldsFor(type);
    auto active = j.find(fields.active);
    if (active == j.end() || !active->is_boolean()) return std::nullopt;

    SafetyReading reading;
    reading.active = active->get<bool>();

    auto ts = j.find(fields.timestamp);
    if (ts != j.end() && ts->is_number()) {
        reading.source_timestamp = ts->get<double>();
    }

    if (type == SafetyType::Assistance) {
        auto kind = j.find("assistance_type");
        if (kind != j.end() && kind->is_string()) {
            reading.assistance = parseAssistanceKind(kind->get<std::string>());
            if (!reading.assistance) {
                spdlog::warn("SensorPoller: unknown assistance type '{}', treating as general",
                             kind->get<std::string>());
                reading.assistance = AssistanceKind::General;
            }
        } else if (reading.active) {
            reading.assistance = AssistanceKind::General;
        }
    }

    return reading;
}

std::optional<EnvironmentReading> SensorPoller::parseEnvironment(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        spdlog::warn("SensorPoller: bad environmental payload: {}", e.what());
        return std::nullopt;
    }

    // The sensor service returns {} until its first reading
    if (!j.is_object() || !j.contains("humidity")) return std::nullopt;

    EnvironmentReading reading;
    reading.humidity = numberOr(j, "humidity", 0);
    reading.pressure = numberOr(j, "pressure", 0);

    bool has_c = j.contains("temperature_c") && j["temperature_c"].is_number();
    bool has_f = j.contains("temperature_f") && j["temperature_f"].is_number();
    if (!has_c && !has_f) return std::nullopt;

    reading.temperature_c = has_c ? j["temperature_c"].get<double>()
                                  : (j["temperature_f"].get<double>() - 32.0) * 5.0 / 9.0;
    reading.temperature_f = has_f ? j["temperature_f"].get<double>()
                                  : reading.temperature_c * 9.0 / 5.0 + 32.0;
    reading.temperature_c = std::round(reading.temperature_c * 10.0) / 10.0;
    reading.temperature_f = std::round(reading.temperature_f * 10.0) / 10.0;

    if (j.contains("last_update") && j["last_update"].is_string()) {
        reading.last_update = j["last_update"].get<std::string>();
    }
    return reading;
}

bool SensorPoller::pollSafety(SafetyType type) {
    auto source = sourceName(type);
    auto result = fetch_(url("/api/" + source + "_status"), config_.timeout_ms);
    if (!result.ok) {
        connectivity_->markFailure(source, result.error);
        return false;
    }

    auto reading = parseSafety(type, result.body);
    if (!reading) {
        connectivity_->markFailure(source, "malformed response");
        return false;
    }
    connectivity_->markSuccess(source);

    if (!reading->active) return true;

    // New incident at the source, or a refresh of one still active locally
    auto local = monitor_->state(type);
    bool local_active = local == SafetyState::Active;
    bool is_new;
    {
        std::lock_guard lock(mutex_);
        if (reading->source_timestamp) {
            auto it = last_seen_.find(type);
            is_new = it == last_seen_.end() || it->second != *reading->source_timestamp;
            last_seen_[type] = *reading->source_timestamp;
        } else {
            is_new = local == SafetyState::Idle;
        }
    }

    if (is_new || local_active) {
        auto at = is_new && reading->source_timestamp
            ? sightline::time_utils::from_epoch_seconds(*reading->source_timestamp)
            : WallClock::now();
        on_raise_(type, reading->assistance, at);
    }
    return true;
}

bool SensorPoller::pollEnvironment() {
    auto result = fetch_(url("/api/environmental"), config_.timeout_ms);
    if (!result.ok) {
        connectivity_->markFailure("environmental", result.error);
        return false;
    }

    connectivity_->markSuccess("environmental");
    auto reading = parseEnvironment(result.body);
    if (!reading) {
        spdlog::debug("SensorPoller: no environmental reading yet");
        return true;
    }
    environment_->update(*reading);
    return true;
}

void SensorPoller::forwardAcknowledge(SafetyType type) {
    if (!config_.forward_acknowledge) return;
    {
        std::lock_guard lock(mutex_);
        pending_acks_.insert(type);
        wake_requests_.insert(type);
    }
    wake_.notify_all();
}

bool SensorPoller::hasPendingAcknowledge(SafetyType type) const {
    std::lock_guard lock(mutex_);
    return pending_acks_.count(type) > 0;
}

void SensorPoller::sendPendingAcknowledge(SafetyType type) {
    if (!hasPendingAcknowledge(type)) return;

    auto source = sourceName(type);
    auto result = fetch_(url("/api/" + source + "_acknowledge"), config_.timeout_ms);
    if (!result.ok) {
        spdlog::warn("SensorPoller: forwarding {} acknowledge failed: {}", source, result.error);
        connectivity_->markFailure(source, result.error);
        return;
    }

    std::lock_guard lock(mutex_);
    pending_acks_.erase(type);
    spdlog::info("SensorPoller: {} acknowledge forwarded", source);
}

bool SensorPoller::waitFor(std::chrono::milliseconds delay, std::optional<SafetyType> type) {
    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, delay, [this, type] {
        return !running_ || (type && wake_requests_.count(*type) > 0);
    });
    if (type) wake_requests_.erase(*type);
    return running_;
}

void SensorPoller::safetyLoop(SafetyType type) {
    std::chrono::milliseconds interval(config_.safety_poll_ms);
    std::chrono::milliseconds max_backoff(config_.max_backoff_ms);
    int failures = 0;

    while (running_) {
        try {
            sendPendingAcknowledge(type);
            failures = pollSafety(type) ? 0 : failures + 1;
        } catch (const std::exception& e) {
            failures++;
            spdlog::error("SensorPoller: {} poll threw: {}", toString(type), e.what());
        }

        if (!waitFor(backoff(interval, failures, max_backoff), type)) break;
    }
}

void SensorPoller::environmentLoop() {
    std::chrono::milliseconds interval(config_.environment_poll_ms);
    std::chrono::milliseconds max_backoff(std::max(config_.max_backoff_ms, config_.environment_poll_ms));
    int failures = 0;

    while (running_) {
        try {
            failures = pollEnvironment() ? 0 : failures + 1;
        } catch (const std::exception& e) {
            failures++;
            spdlog::error("SensorPoller: environmental poll threw: {}", e.what());
        }

        if (!waitFor(backoff(interval, failures, max_backoff), std::nullopt)) break;
    }
}

}  // namespace assist
