#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace sightline::time_utils {

using WallClock = std::chrono::system_clock;

/// UTC ISO-8601 with milliseconds, e.g. 2026-10-17T09:41:07.125Z
std::string to_iso8601(WallClock::time_point tp);

std::string now_iso8601();

/// Parse an ISO-8601 timestamp (with or without fractional seconds and a
/// trailing Z). Returns nullopt on malformed input.
std::optional<WallClock::time_point> parse_iso8601(const std::string& text);

/// Unix epoch seconds (fractional) → time_point
WallClock::time_point from_epoch_seconds(double seconds);

/// time_point → Unix epoch seconds with microsecond precision
double to_epoch_seconds(WallClock::time_point tp);

/// Short unique id: hex epoch millis + random suffix
std::string generate_id();

}  // namespace sightline::time_utils
