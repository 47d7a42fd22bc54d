#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace assist {

struct EnvironmentReading {
    double temperature_c = 0;
    double temperature_f = 0;
    double humidity = 0;     // percent
    double pressure = 0;     // millibars
    std::string last_update; // as reported by the sensor service
};

/// Latest environmental reading from the sensor service
class EnvironmentState {
public:
    void update(const EnvironmentReading& reading);

    std::optional<EnvironmentReading> latest() const;

    /// Comfort warnings: above 85 °F / below 60 °F, humidity above 70 % / below 30 %
    static std::vector<std::string> warnings(const EnvironmentReading& reading);

private:
    mutable std::mutex mutex_;
    std::optional<EnvironmentReading> latest_;
};

}  // namespace assist
