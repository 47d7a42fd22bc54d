#include "announcer.h"

#include <spdlog/spdlog.h>

namespace assist {

Announcer::Announcer(std::shared_ptr<AlertAggregator> aggregator,
                     std::shared_ptr<Speaker> speaker)
    : aggregator_(std::move(aggregator))
    , speaker_(std::move(speaker))
{
}

Announcer::~Announcer() {
    stop();
}

void Announcer::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&Announcer::run, this);
    spdlog::info("Announcer: started");
}

void Announcer::stop() {
    bool was_running = running_.exchange(false);
    aggregator_->close();
    if (thread_.joinable()) thread_.join();
    if (was_running) spdlog::info("Announcer: stopped");
}

void Announcer::run() {
    while (running_) {
        auto alert = aggregator_->next();
        if (!alert) break;  // closed

        // Cancellation point: never start a new utterance after stop()
        if (!running_) {
            aggregator_->complete();
            break;
        }

        speaking_ = true;
        bool ok = false;
        try {
            ok = speaker_->speak(alert->message);
        } catch (const std::exception& e) {
            spdlog::error("Announcer: speaker threw: {}", e.what());
        }
        speaking_ = false;
        aggregator_->complete();

        std::lock_guard lock(stats_mutex_);
        if (ok) {
            stats_.spoken++;
            stats_.last_message = alert->message;
            stats_.last_spoken_at = WallClock::now();
        } else {
            stats_.failed++;
            spdlog::warn("Announcer: failed to speak '{}'", alert->message);
        }
    }
}

Announcer::Stats Announcer::stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

}  // namespace assist
