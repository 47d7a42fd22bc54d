#include "speech_client.h"
#include "http_fetch.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace assist {

SpeechClient::SpeechClient(const sightline::SpeechConfig& config)
    : config_(config)
{
}

bool SpeechClient::speak(const std::string& text) {
    if (!config_.enabled) {
        spdlog::info("Speech (muted): {}", text);
        return true;
    }

    json body = {{"text", text}};
    if (!config_.voice.empty()) body["voice"] = config_.voice;

    auto result = sightline::HttpFetch::postJson(config_.tts_endpoint, body.dump(),
                                                 config_.tts_timeout_seconds * 1000L);
    if (!result.ok) {
        spdlog::error("SpeechClient: TTS failed for '{}': {}", text, result.error);
        return false;
    }

    spdlog::debug("SpeechClient: spoke '{}' in {:.2f}s", text, result.elapsed_seconds);
    return true;
}

std::optional<std::string> SpeechClient::listen() {
    if (!config_.enabled) {
        spdlog::warn("SpeechClient: speech disabled, cannot listen");
        return std::nullopt;
    }

    json body = {{"language", "en-US"}};
    auto result = sightline::HttpFetch::postJson(config_.stt_endpoint, body.dump(),
                                                 config_.stt_timeout_seconds * 1000L);
    if (!result.ok) {
        spdlog::error("SpeechClient: STT failed: {}", result.error);
        return std::nullopt;
    }

    auto transcript = parseTranscript(result.body);
    if (transcript) {
        spdlog::info("SpeechClient: heard '{}' ({:.1f}s)", *transcript, result.elapsed_seconds);
    } else {
        spdlog::info("SpeechClient: nothing recognized");
    }
    return transcript;
}

std::optional<std::string> SpeechClient::parseTranscript(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
            return std::nullopt;
        }
        auto text = j["text"].get<std::string>();
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;
        return text;
    } catch (const json::exception& e) {
        spdlog::warn("SpeechClient: bad STT response: {}", e.what());
        return std::nullopt;
    }
}

}  // namespace assist
