#include "environment_state.h"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace assist {

void EnvironmentState::update(const EnvironmentReading& reading) {
    {
        std::lock_guard lock(mutex_);
        latest_ = reading;
    }
    for (const auto& warning : warnings(reading)) {
        spdlog::warn("Environment: {}", warning);
    }
}

std::optional<EnvironmentReading> EnvironmentState::latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
}

std::vector<std::string> EnvironmentState::warnings(const EnvironmentReading& reading) {
    std::vector<std::string> out;
    if (reading.temperature_f > 85) {
        out.push_back(fmt::format("high temperature {:.1f}°F", reading.temperature_f));
    } else if (reading.temperature_f < 60) {
        out.push_back(fmt::format("low temperature {:.1f}°F", reading.temperature_f));
    }
    if (reading.humidity > 70) {
        out.push_back(fmt::format("high humidity {:.1f}%", reading.humidity));
    } else if (reading.humidity < 30) {
        out.push_back(fmt::format("low humidity {:.1f}%", reading.humidity));
    }
    return out;
}

}  // namespace assist
