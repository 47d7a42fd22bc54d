#pragma once

#include <string>

namespace assist {

/// Blocking text-to-speech output. speak() returns once the utterance has
/// finished playing (or failed); it is never interrupted mid-utterance.
class Speaker {
public:
    virtual ~Speaker() = default;

    /// False on synthesis or playback failure
    virtual bool speak(const std::string& text) = 0;
};

}  // namespace assist
