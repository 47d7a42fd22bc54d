#pragma once

#include "config_manager.h"
#include "speaker.h"

#include <optional>
#include <string>

namespace assist {

/// HTTP client for the local speech services. Both calls block on libcurl
/// with the configured timeout and run outside any lock.
class SpeechClient : public Speaker {
public:
    explicit SpeechClient(const sightline::SpeechConfig& config);

    /// POST {text, voice} to the TTS endpoint. With speech disabled the
    /// utterance is only logged.
    bool speak(const std::string& text) override;

    /// POST to the STT endpoint, which records one phrase from the
    /// microphone. Returns nullopt on failure or silence.
    std::optional<std::string> listen();

    /// Extract the transcript from an STT response body
    static std::optional<std::string> parseTranscript(const std::string& body);

    bool enabled() const { return config_.enabled; }

private:
    sightline::SpeechConfig config_;
};

}  // namespace assist
