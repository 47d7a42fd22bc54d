#include "voice_assistant.h"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

using json = nlohmann::json;

namespace assist {

namespace {

const char* kHelpText =
    "You can say: what's around me, status, repeat, or help.";

std::string lowercase(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

std::string withArticle(const std::string& cls) {
    if (cls.empty()) return cls;
    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(cls[0])));
    bool vowel = c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
    return std::string(vowel ? "an " : "a ") + cls;
}

std::string wherePhrase(Direction direction) {
    switch (direction) {
        case Direction::Left:  return "on your left";
        case Direction::Ahead: return "ahead";
        case Direction::Right: return "on your right";
    }
    return "ahead";
}

}  // anonymous namespace

VoiceAssistant::VoiceAssistant(std::shared_ptr<AlertCoordinator> coordinator,
                               std::shared_ptr<EnvironmentState> environment,
                               Listen listen,
                               std::shared_ptr<sightline::MqttClient> mqtt)
    : coordinator_(std::move(coordinator))
    , environment_(std::move(environment))
    , listen_(std::move(listen))
    , mqtt_(std::move(mqtt))
{
}

VoiceAssistant::~VoiceAssistant() {
    stop();
}

void VoiceAssistant::start() {
    running_ = true;

    if (!mqtt_) {
        spdlog::warn("VoiceAssistant: MQTT disabled, voice trigger unavailable");
        return;
    }

    auto topic = mqtt_->topicPrefix() + "/voice/trigger";
    mqtt_->subscribe({topic}, [this](const std::string&, const std::string& payload) {
        if (!running_) return;

        std::optional<std::string> text;
        if (!payload.empty()) {
            try {
                auto msg = json::parse(payload);
                if (msg.is_object() && msg.contains("text") && msg["text"].is_string()) {
                    text = msg["text"].get<std::string>();
                }
            } catch (const json::exception& e) {
                spdlog::warn("VoiceAssistant: ignoring trigger payload: {}", e.what());
            }
        }

        if (!trigger(text)) {
            spdlog::info("VoiceAssistant: busy, trigger ignored");
        }
    });

    spdlog::info("VoiceAssistant: listening for triggers on {}", topic);
}

void VoiceAssistant::stop() {
    running_ = false;
    wait();
}

void VoiceAssistant::wait() {
    std::lock_guard lock(worker_mutex_);
    if (worker_.joinable()) worker_.join();
}

bool VoiceAssistant::trigger(std::optional<std::string> text) {
    if (!running_) return false;
    if (busy_.exchange(true)) return false;

    std::lock_guard lock(worker_mutex_);
    if (worker_.joinable()) worker_.join();  // previous command has finished
    worker_ = std::thread(&VoiceAssistant::run, this, std::move(text));
    return true;
}

void VoiceAssistant::run(std::optional<std::string> text) {
    try {
        if (!text) {
            spdlog::info("VoiceAssistant: listening...");
            text = listen_ ? listen_() : std::nullopt;
        }

        if (!text) {
            coordinator_->aggregator()->publishResponse("Sorry, I didn't catch that.");
        } else if (running_) {
            handle(*text);
        }
    } catch (const std::exception& e) {
        spdlog::error("VoiceAssistant: command failed: {}", e.what());
    }
    busy_ = false;
}

VoiceAssistant::Command VoiceAssistant::parseCommand(const std::string& text) {
    auto t = lowercase(text);
    if (containsAny(t, {"help", "what can you do"})) return Command::Help;
    if (containsAny(t, {"repeat", "say again", "again"})) return Command::Repeat;
    if (containsAny(t, {"around", "describe", "what do you see", "in front", "scene", "surround"})) {
        return Command::Describe;
    }
    if (containsAny(t, {"status", "temperature", "how am i", "alert"})) return Command::Status;
    return Command::Unknown;
}

std::string VoiceAssistant::describeScene(const std::vector<ProximityEvent>& scene) {
    if (scene.empty()) return "I don't see anything around you right now.";

    // Closest first, one mention per object and direction
    auto sorted = scene;
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.zone > b.zone;
    });

    std::vector<std::string> items;
    std::set<std::pair<std::string, Direction>> seen;
    for (const auto& event : sorted) {
        if (!seen.emplace(event.object_type, event.direction).second) continue;
        std::string item = withArticle(event.object_type) + " " + wherePhrase(event.direction);
        if (event.zone == ProximityZone::Critical) item += ", very close";
        items.push_back(std::move(item));
        if (items.size() == 5) break;
    }

    std::string message = "I see ";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0 && i == items.size() - 1) message += " and ";
        else if (i > 0) message += ", ";
        message += items[i];
    }
    return message + ".";
}

std::string VoiceAssistant::statusText() const {
    std::vector<std::string> active;
    auto monitor = coordinator_->monitor();
    for (auto type : {SafetyType::Fall, SafetyType::Emergency, SafetyType::Assistance}) {
        auto snap = monitor->snapshot(type);
        if (!snap.active()) continue;
        if (type == SafetyType::Assistance && snap.assistance) {
            active.push_back(std::string(label(*snap.assistance)) + " request pending");
        } else {
            active.push_back(std::string(toString(type)) + " alert active");
        }
    }

    std::string text = active.empty() ? "No active safety alerts." : "";
    for (size_t i = 0; i < active.size(); ++i) {
        text += (i == 0 ? "" : ", ") + active[i];
    }
    if (!active.empty()) text += ".";

    auto reading = environment_ ? environment_->latest() : std::nullopt;
    if (reading) {
        text += fmt::format(" Temperature {:.0f} degrees, humidity {:.0f} percent.",
                            reading->temperature_f, reading->humidity);
    }
    return text;
}

std::string VoiceAssistant::handle(const std::string& text) {
    auto sink = coordinator_->sink();
    std::string response;

    switch (parseCommand(text)) {
        case Command::Describe: {
            auto scene = coordinator_->latestScene();
            response = describeScene(scene);
            sink->recordSceneSummary(response, static_cast<int>(scene.size()));
            break;
        }
        case Command::Status:
            response = statusText();
            break;
        case Command::Repeat: {
            auto last = coordinator_->aggregator()->lastAlert();
            response = last ? last->message : "There are no recent alerts.";
            break;
        }
        case Command::Help:
            response = kHelpText;
            break;
        case Command::Unknown:
            response = std::string("Sorry, I don't know that command. ") + kHelpText;
            break;
    }

    spdlog::info("VoiceAssistant: '{}' -> '{}'", text, response);
    coordinator_->aggregator()->publishResponse(response);
    sink->recordVoiceCommand(text, response);
    return response;
}

}  // namespace assist
