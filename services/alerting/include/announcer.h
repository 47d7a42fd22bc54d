#pragma once

#include "alert_aggregator.h"
#include "speaker.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace assist {

/// Single consumer of the AlertAggregator. Utterances are serialized: the
/// next alert is taken only after speak() returns.
class Announcer {
public:
    struct Stats {
        uint64_t spoken = 0;
        uint64_t failed = 0;
        std::string last_message;
        std::optional<WallClock::time_point> last_spoken_at;
    };

    Announcer(std::shared_ptr<AlertAggregator> aggregator,
              std::shared_ptr<Speaker> speaker);
    ~Announcer();

    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;

    void start();

    /// Closes the aggregator and joins. An utterance already in progress
    /// finishes; nothing further is started.
    void stop();

    bool isRunning() const { return running_; }
    bool isSpeaking() const { return speaking_; }

    Stats stats() const;

private:
    void run();

    std::shared_ptr<AlertAggregator> aggregator_;
    std::shared_ptr<Speaker> speaker_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> speaking_{false};
};

}  // namespace assist
