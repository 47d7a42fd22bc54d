#include "time_utils.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace sightline::time_utils {

std::string to_iso8601(WallClock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    if (ms < 0) {
        secs -= std::chrono::seconds(1);
        ms += 1000;
    }

    std::time_t t = WallClock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::string now_iso8601() {
    return to_iso8601(WallClock::now());
}

std::optional<WallClock::time_point> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;

    // Optional fractional part
    int64_t micros = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) digits += static_cast<char>(in.get());
        digits = digits.substr(0, 6);
        while (digits.size() < 6) digits += '0';
        micros = std::stoll(digits);
    }

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return WallClock::from_time_t(t) + std::chrono::microseconds(micros);
}

WallClock::time_point from_epoch_seconds(double seconds) {
    auto us = static_cast<int64_t>(seconds * 1e6);
    return WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(
        std::chrono::microseconds(us)));
}

double to_epoch_seconds(WallClock::time_point tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

std::string generate_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        WallClock::now().time_since_epoch()).count();

    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    uint32_t r = dist(gen);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lx-%08x",
                  static_cast<unsigned long>(ms), r);
    return buf;
}

}  // namespace sightline::time_utils
