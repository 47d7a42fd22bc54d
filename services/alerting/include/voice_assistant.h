#pragma once

#include "alert_coordinator.h"
#include "environment_state.h"
#include "mqtt_client.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace assist {

/// On-demand voice commands. A trigger runs one command on a worker thread:
/// blocking speech recognition, then a reply through the aggregator's
/// response lane. Triggers while a command is running are ignored.
class VoiceAssistant {
public:
    /// Blocking speech recognition; nullopt when nothing was understood
    using Listen = std::function<std::optional<std::string>()>;

    enum class Command { Describe, Status, Repeat, Help, Unknown };

    VoiceAssistant(std::shared_ptr<AlertCoordinator> coordinator,
                   std::shared_ptr<EnvironmentState> environment,
                   Listen listen,
                   std::shared_ptr<sightline::MqttClient> mqtt = nullptr);
    ~VoiceAssistant();

    VoiceAssistant(const VoiceAssistant&) = delete;
    VoiceAssistant& operator=(const VoiceAssistant&) = delete;

    /// Subscribe to <prefix>/voice/trigger
    void start();
    void stop();

    /// Start a command. With text, recognition is skipped. Returns false if
    /// a command is already running or the assistant is stopped.
    bool trigger(std::optional<std::string> text = std::nullopt);

    bool busy() const { return busy_; }

    /// Wait for the running command, if any
    void wait();

    /// Run one recognized command synchronously: reply, record, return the reply
    std::string handle(const std::string& text);

    static Command parseCommand(const std::string& text);

    /// "I see a person ahead and a chair on your left"
    static std::string describeScene(const std::vector<ProximityEvent>& scene);

private:
    void run(std::optional<std::string> text);
    std::string statusText() const;

    std::shared_ptr<AlertCoordinator> coordinator_;
    std::shared_ptr<EnvironmentState> environment_;
    Listen listen_;
    std::shared_ptr<sightline::MqttClient> mqtt_;

    std::mutex worker_mutex_;
    std::thread worker_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> running_{false};
};

}  // namespace assist
